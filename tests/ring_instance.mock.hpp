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

#include "linux/completion_listener.hpp"
#include "linux/ring_instance.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <system_error>
#include <vector>

namespace io_rings::tests
{

/// In-memory ring: submit moves pushed entries in flight, completions are produced by the test or automatically on wait
class test_ring_instance_mock final : public ring_instance
{
public:
   struct test_completion final
   {
      int32_t result;
      uint64_t userdata;
   };

   test_ring_instance_mock() = delete;
   test_ring_instance_mock(test_ring_instance_mock &&) = delete;
   test_ring_instance_mock(test_ring_instance_mock const &) = delete;

   [[nodiscard]] test_ring_instance_mock(uint32_t const capacity, uint32_t const maxUnboundedWorkers) :
      m_capacity{capacity,},
      m_maxWorkers{0, maxUnboundedWorkers,}
   {
      assert(0 < capacity);
   }

   test_ring_instance_mock &operator = (test_ring_instance_mock &&) = delete;
   test_ring_instance_mock &operator = (test_ring_instance_mock const &) = delete;

   [[nodiscard]] uint32_t capacity() const noexcept override
   {
      return m_capacity;
   }

   [[nodiscard]] uint32_t submission_queue_space() const noexcept override
   {
      return m_capacity - static_cast<uint32_t>(m_submissionQueue.size());
   }

   [[nodiscard]] uint32_t submission_queue_ready() const noexcept override
   {
      return static_cast<uint32_t>(m_submissionQueue.size());
   }

   [[nodiscard]] std::error_code submit() override
   {
      ++m_submitCalls;
      if (false == m_submitErrors.empty())
      {
         auto const errorCode{m_submitErrors.front(),};
         m_submitErrors.pop_front();
         return errorCode;
      }
      consume_submission_queue();
      return std::error_code{};
   }

   [[nodiscard]] std::error_code submit_and_wait(uint32_t const waitNumber) override
   {
      ++m_waitCalls;
      if (false == m_waitErrors.empty())
      {
         auto const errorCode{m_waitErrors.front(),};
         m_waitErrors.pop_front();
         return errorCode;
      }
      consume_submission_queue();
      if ((true == m_autoComplete) && (waitNumber > m_completionQueue.size()))
      {
         complete(m_inFlight.size(), static_cast<int32_t>(m_autoPayload.size()));
      }
      if ((true == m_blockingWait) && (waitNumber > m_completionQueue.size()))
      {
         std::unique_lock wakeLock{m_wakeMutex,};
         if (nullptr != m_onBlocked)
         {
            m_onBlocked();
         }
         m_wakeCondition.wait(wakeLock, [this] () { return m_woken; });
         /// One wake releases one wait, as the single wake read of a real ring
         m_woken = false;
      }
      return std::error_code{};
   }

   uint32_t drain_completions(completion_listener &completionListener) override
   {
      uint32_t drainedCount{0,};
      while (false == m_completionQueue.empty())
      {
         auto const completion{m_completionQueue.front(),};
         m_completionQueue.pop_front();
         completionListener.handle_completion(completion.result, completion.userdata, 0);
         ++drainedCount;
      }
      m_drainedCount += drainedCount;
      return drainedCount;
   }

   [[nodiscard]] std::array<uint32_t, 2> query_max_workers() override
   {
      return m_maxWorkers;
   }

   void wake() override
   {
      {
         std::scoped_lock const wakeLock{m_wakeMutex,};
         m_woken = true;
         ++m_wakeCalls;
      }
      m_wakeCondition.notify_all();
   }

   /// Completes the oldest in-flight entries, copying the automatic payload into their buffers
   void complete(size_t const count, int32_t const result)
   {
      assert(count <= m_inFlight.size());
      for (size_t index{0,}; count > index; ++index)
      {
         auto const submissionEntry{m_inFlight.front(),};
         m_inFlight.pop_front();
         if ((0 < result) && (0 != submissionEntry.addr))
         {
            auto const bytesToCopy{std::min<size_t>(m_autoPayload.size(), submissionEntry.len),};
            std::memcpy(std::bit_cast<void *>(static_cast<uintptr_t>(submissionEntry.addr)), m_autoPayload.data(), bytesToCopy);
         }
         m_completionQueue.push_back(test_completion{.result = result, .userdata = submissionEntry.user_data,});
      }
   }

   void fail_next_submit(std::error_code const &errorCode)
   {
      m_submitErrors.push_back(errorCode);
   }

   void fail_next_wait(std::error_code const &errorCode)
   {
      m_waitErrors.push_back(errorCode);
   }

   /// Waits without completions block until wake(), onBlocked is invoked right before blocking
   void set_blocking_wait(std::function<void()> onBlocked)
   {
      m_blockingWait = true;
      m_onBlocked = std::move(onBlocked);
   }

   void set_auto_complete(std::string payload)
   {
      m_autoComplete = true;
      m_autoPayload = std::move(payload);
   }

   [[nodiscard]] std::deque<test_completion> const &completion_queue() const noexcept
   {
      return m_completionQueue;
   }

   [[nodiscard]] size_t drained_count() const noexcept
   {
      return m_drainedCount;
   }

   [[nodiscard]] std::deque<submission_entry> const &in_flight() const noexcept
   {
      return m_inFlight;
   }

   [[nodiscard]] size_t pushed_count() const noexcept
   {
      return m_pushedCount;
   }

   [[nodiscard]] std::deque<submission_entry> const &submission_queue() const noexcept
   {
      return m_submissionQueue;
   }

   [[nodiscard]] size_t submit_calls() const noexcept
   {
      return m_submitCalls;
   }

   [[nodiscard]] size_t wait_calls() const noexcept
   {
      return m_waitCalls;
   }

   [[nodiscard]] size_t wake_calls() const
   {
      std::scoped_lock const wakeLock{m_wakeMutex,};
      return m_wakeCalls;
   }

private:
   uint32_t const m_capacity;
   std::array<uint32_t, 2> const m_maxWorkers;
   std::deque<submission_entry> m_submissionQueue{};
   std::deque<submission_entry> m_inFlight{};
   std::deque<test_completion> m_completionQueue{};
   std::deque<std::error_code> m_submitErrors{};
   std::deque<std::error_code> m_waitErrors{};
   bool m_autoComplete{false,};
   std::string m_autoPayload{};
   size_t m_pushedCount{0,};
   size_t m_drainedCount{0,};
   size_t m_submitCalls{0,};
   size_t m_waitCalls{0,};
   bool m_blockingWait{false,};
   std::function<void()> m_onBlocked{};
   mutable std::mutex m_wakeMutex{};
   std::condition_variable m_wakeCondition{};
   bool m_woken{false,};
   size_t m_wakeCalls{0,};

   void consume_submission_queue()
   {
      while (false == m_submissionQueue.empty())
      {
         m_inFlight.push_back(m_submissionQueue.front());
         m_submissionQueue.pop_front();
      }
   }

   void push_unchecked(submission_entry const &submissionEntry) noexcept override
   {
      assert(m_capacity > m_submissionQueue.size());
      m_submissionQueue.push_back(submissionEntry);
      ++m_pushedCount;
   }
};

}
