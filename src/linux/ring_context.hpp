/*
   Part of the io_rings project, under the MIT License
   SPDX-License-Identifier: MIT

   Copyright (c) 2025 Mikhail Smirnov

   Permission is hereby granted, free of charge, to any person obtaining a copy
   of this software and associated documentation files (the "Software"), to deal
   in the Software without restriction, including without limitation the rights
   to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
   copies of the Software, and to permit persons to whom the Software is
   furnished to do so, subject to the following conditions:

   The above copyright notice and this permission notice shall be included in all
   copies or substantial portions of the Software.

   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
   IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
   FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
   AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
   LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
   OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
   SOFTWARE.
*/

#pragma once

#include "common/buffer_slots.hpp" ///< for io_rings::buffer_slots
#include "io_rings/completion_record.hpp" ///< for io_rings::completion_handler
#include "linux/ring_instance.hpp" ///< for io_rings::ring_instance, io_rings::submission_entry
#include "linux/submission_backlog.hpp" ///< for io_rings::submission_backlog
#include "linux/submission_template.hpp" ///< for io_rings::submission_template

#include <cstdint> ///< for uint32_t
#include <memory> ///< for std::unique_ptr
#include <system_error> ///< for std::error_code

namespace io_rings
{

/// A ring with its backlog and the buffer slots of the template copies it keeps in flight
class ring_context final
{
public:
   ring_context() = delete;
   ring_context(ring_context &&) = delete;
   ring_context(ring_context const &) = delete;
   [[nodiscard]] ring_context(std::unique_ptr<ring_instance> ring, submission_template const &submissionTemplate, uint32_t targetDepth);

   ring_context &operator = (ring_context &&) = delete;
   ring_context &operator = (ring_context const &) = delete;

   [[maybe_unused, nodiscard]] submission_backlog const &backlog() const noexcept
   {
      return m_backlog;
   }

   [[maybe_unused, nodiscard]] ring_instance &ring() const noexcept
   {
      return *m_ring;
   }

   [[maybe_unused, nodiscard]] buffer_slots const &slots() const noexcept
   {
      return m_slots;
   }

   /// Pushes backlogged entries until the backlog is empty, submitting whenever the queue fills up.
   /// Returns the submit error which interrupted the drain.
   [[nodiscard]] std::error_code drain_backlog();
   /// Hands every available completion to the handler and rearms its slot.
   /// Returns the first error reported by the handler.
   [[nodiscard]] std::error_code drain_completions(completion_handler const &completionHandler);
   /// Arms never armed slots until either the queue is full or every slot is armed
   uint32_t fill();
   /// Pushes the entry unless the queue is full or older entries are still waiting in the backlog
   void submit_or_defer(submission_entry const &submissionEntry);

private:
   buffer_slots m_slots;
   std::unique_ptr<ring_instance> const m_ring;
   submission_template const m_submissionTemplate;
   submission_backlog m_backlog{};

   void rearm(uint32_t slotIndex);
};

}
