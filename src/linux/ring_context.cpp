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

#include "common/buffer_slots.hpp" ///< for io_rings::buffer_slots
#include "io_rings/completion_record.hpp" ///< for io_rings::completion_handler, io_rings::completion_record
#include "linux/completion_listener.hpp" ///< for io_rings::completion_listener
#include "linux/ring_context.hpp" ///< for io_rings::ring_context
#include "linux/ring_instance.hpp" ///< for io_rings::ring_instance, io_rings::submission_entry
#include "linux/submission_template.hpp" ///< for io_rings::submission_template

#include <algorithm> ///< for std::min
#include <cassert> ///< for assert
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for int32_t, uint32_t, uint64_t
#include <functional> ///< for std::function
#include <memory> ///< for std::unique_ptr
#include <span> ///< for std::span
#include <system_error> ///< for std::error_code
#include <utility> ///< for std::forward, std::move

namespace io_rings
{

namespace
{

class completion_dispatcher final : public completion_listener
{
public:
   completion_dispatcher() = delete;
   completion_dispatcher(completion_dispatcher &&) = delete;
   completion_dispatcher(completion_dispatcher const &) = delete;

   template<typename rearm_routine>
   [[nodiscard]] completion_dispatcher(buffer_slots const &slots, completion_handler const &completionHandler, rearm_routine &&rearmRoutine) :
      m_slots{slots,},
      m_completionHandler{completionHandler,},
      m_rearmRoutine{std::forward<rearm_routine>(rearmRoutine),}
   {}

   completion_dispatcher &operator = (completion_dispatcher &&) = delete;
   completion_dispatcher &operator = (completion_dispatcher const &) = delete;

   [[nodiscard]] std::error_code const &first_error() const noexcept
   {
      return m_firstError;
   }

   void handle_completion(int32_t const result, uint64_t const userdata, uint32_t) override
   {
      assert(m_slots.slots_count() > userdata);
      auto const slotIndex{static_cast<uint32_t>(userdata),};
      if (true == bool{m_completionHandler,})
      {
         auto const payloadSize{(0 < result) ? std::min<size_t>(static_cast<size_t>(result), m_slots.slot_size()) : size_t{0,},};
         std::span<std::byte const> const payload{m_slots.bytes(slotIndex), (nullptr == m_slots.bytes(slotIndex)) ? size_t{0,} : payloadSize,};
         if (auto const errorCode{m_completionHandler(completion_record{.result = result, .tag = userdata,}, payload),}; errorCode)
         {
            if (false == bool{m_firstError,})
            {
               m_firstError = errorCode;
            }
         }
      }
      m_rearmRoutine(slotIndex);
   }

private:
   buffer_slots const &m_slots;
   completion_handler const &m_completionHandler;
   std::function<void(uint32_t)> const m_rearmRoutine;
   std::error_code m_firstError{};
};

}

ring_context::ring_context(std::unique_ptr<ring_instance> ring, submission_template const &submissionTemplate, uint32_t const targetDepth) :
   m_slots{targetDepth, submissionTemplate.buffer_size(),},
   m_ring{std::move(ring),},
   m_submissionTemplate{submissionTemplate,}
{
   assert(nullptr != m_ring);
   assert(0 < targetDepth);
}

std::error_code ring_context::drain_backlog()
{
   while (false == m_backlog.empty())
   {
      if (true == m_ring->is_submission_queue_full())
      {
         if (auto const errorCode{m_ring->submit(),}; errorCode)
         {
            return errorCode;
         }
         if (true == m_ring->is_submission_queue_full()) [[unlikely]]
         {
            break;
         }
      }
      if (false == m_ring->try_push(m_backlog.front())) [[unlikely]]
      {
         break;
      }
      [[maybe_unused]] auto const submissionEntry{m_backlog.pop_front(),};
   }
   return std::error_code{};
}

std::error_code ring_context::drain_completions(completion_handler const &completionHandler)
{
   completion_dispatcher completionDispatcher{m_slots, completionHandler, [this] (uint32_t const slotIndex) { rearm(slotIndex); },};
   m_ring->drain_completions(completionDispatcher);
   return completionDispatcher.first_error();
}

uint32_t ring_context::fill()
{
   uint32_t pushedCount{0,};
   while (false == m_ring->is_submission_queue_full())
   {
      auto const slotIndex{m_slots.pop_free(),};
      if (false == slotIndex.has_value())
      {
         break;
      }
      if (false == m_ring->try_push(m_submissionTemplate.prepare(slotIndex.value(), m_slots.bytes(slotIndex.value())))) [[unlikely]]
      {
         m_slots.push_free(slotIndex.value());
         break;
      }
      ++pushedCount;
   }
   return pushedCount;
}

void ring_context::submit_or_defer(submission_entry const &submissionEntry)
{
   if ((false == m_backlog.empty()) || (false == m_ring->try_push(submissionEntry)))
   {
      m_backlog.push(submissionEntry);
   }
}

void ring_context::rearm(uint32_t const slotIndex)
{
   submit_or_defer(m_submissionTemplate.prepare(slotIndex, m_slots.bytes(slotIndex)));
}

}
