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

#include "linux/completion_listener.hpp" ///< for io_rings::completion_listener

#include <liburing.h> ///< for io_uring_sqe

#include <array> ///< for std::array
#include <cstdint> ///< for uint32_t
#include <memory> ///< for std::unique_ptr
#include <system_error> ///< for std::error_code

namespace io_rings
{

using submission_entry = io_uring_sqe;

/// One io_uring with its submission and completion queues, owned by a single thread
class ring_instance
{
public:
   ring_instance(ring_instance &&) = delete;
   ring_instance(ring_instance const &) = delete;
   virtual ~ring_instance() = default;

   ring_instance &operator = (ring_instance &&) = delete;
   ring_instance &operator = (ring_instance const &) = delete;

   [[nodiscard]] virtual uint32_t capacity() const noexcept = 0;

   /// Number of free submission queue slots
   [[nodiscard]] virtual uint32_t submission_queue_space() const noexcept = 0;
   /// Number of pushed entries not yet consumed by the kernel
   [[nodiscard]] virtual uint32_t submission_queue_ready() const noexcept = 0;

   [[nodiscard]] bool is_submission_queue_full() const noexcept
   {
      return 0 == submission_queue_space();
   }

   [[nodiscard]] bool try_push(submission_entry const &submissionEntry) noexcept
   {
      if (true == is_submission_queue_full())
      {
         return false;
      }
      push_unchecked(submissionEntry);
      return true;
   }

   /// Both return an error code of the generic category, EINTR when the wait has been interrupted by a signal
   [[nodiscard]] virtual std::error_code submit() = 0;
   [[nodiscard]] virtual std::error_code submit_and_wait(uint32_t waitNumber) = 0;

   /// Visits every available completion in kernel order, then marks all of them as consumed
   virtual uint32_t drain_completions(completion_listener &completionListener) = 0;

   /// Current {bounded, unbounded} IO workers limits
   [[nodiscard]] virtual std::array<uint32_t, 2> query_max_workers() = 0;

   /// Thread-safe. Makes the pending or the next submit_and_wait() return even when no operation completes.
   /// The wake completion is consumed internally and never reaches a completion listener.
   virtual void wake() = 0;

   /// Throws io_rings::engine_error
   [[nodiscard]] static std::unique_ptr<ring_instance> construct(uint32_t capacity, uint32_t maxUnboundedWorkers);

protected:
   [[nodiscard]] ring_instance() noexcept = default;

private:
   /// Raw write into the next submission queue slot, the caller guarantees the queue is not full
   virtual void push_unchecked(submission_entry const &submissionEntry) noexcept = 0;
};

}
