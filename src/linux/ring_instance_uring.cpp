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

#if (defined(__linux__))
#include "common/logger.hpp" ///< for io_rings::log_error, io_rings::log_system_error
#include "common/utility.hpp" ///< for io_rings::unreachable
#include "io_rings/engine_error.hpp" ///< for io_rings::engine_errc, io_rings::engine_error
#include "linux/completion_listener.hpp" ///< for io_rings::completion_listener
#include "linux/ring_instance.hpp" ///< for io_rings::ring_instance, io_rings::submission_entry

/// for
///   io_uring,
///   io_uring_cq_advance,
///   io_uring_cqe,
///   io_uring_for_each_cqe,
///   io_uring_get_sqe,
///   io_uring_prep_read,
///   io_uring_queue_exit,
///   io_uring_queue_init,
///   io_uring_register_iowq_max_workers,
///   io_uring_sqe_set_data64,
///   io_uring_sq_ready,
///   io_uring_sq_space_left,
///   io_uring_submit,
///   io_uring_submit_and_wait
#include <liburing.h>
#include <sys/eventfd.h> ///< for EFD_NONBLOCK, eventfd, eventfd_t, eventfd_write
#include <unistd.h> ///< for close

#include <array> ///< for std::array
#include <cassert> ///< for assert
#include <cerrno> ///< for errno
#include <cstdint> ///< for int32_t, uint32_t, uint64_t
#include <limits> ///< for std::numeric_limits
#include <memory> ///< for std::addressof, std::make_unique, std::unique_ptr
#include <source_location> ///< for std::source_location
#include <system_error> ///< for std::error_code, std::generic_category

namespace io_rings
{

namespace
{

/// Never a buffer slot index
constexpr uint64_t wake_userdata{std::numeric_limits<uint64_t>::max(),};

}

class ring_instance_uring final : public ring_instance
{
private:
   using super = ring_instance;

public:
   ring_instance_uring() = delete;
   ring_instance_uring(ring_instance_uring &&) = delete;
   ring_instance_uring(ring_instance_uring const &) = delete;

   [[nodiscard]] ring_instance_uring(uint32_t const capacity, uint32_t const maxUnboundedWorkers) :
      super{}
   {
      assert(0 < capacity);
      if (auto const returnCode{io_uring_queue_init(capacity, std::addressof(m_ring), 0),}; 0 > returnCode) [[unlikely]]
      {
         std::error_code const errorCode{-returnCode, std::generic_category(),};
         log_system_error("[ring] failed to initialize the ring: ({}) - {}", errorCode);
         throw engine_error{engine_errc::ring_creation, errorCode,};
      }
      /// The kernel rounds the requested size up to a power of two
      m_capacity = m_ring.sq.ring_entries;
      /// Bounded workers stay at zero which keeps the kernel limit, as does zero for unbounded workers
      std::array<uint32_t, 2> iowqMaxWorkers = {0, maxUnboundedWorkers,};
      if (auto const returnCode{io_uring_register_iowq_max_workers(std::addressof(m_ring), iowqMaxWorkers.data()),}; 0 > returnCode) [[unlikely]]
      {
         std::error_code const errorCode{-returnCode, std::generic_category(),};
         log_system_error("[ring] failed to register IO workers limits: ({}) - {}", errorCode);
         io_uring_queue_exit(std::addressof(m_ring));
         throw engine_error{engine_errc::registration, errorCode,};
      }
      if (-1 == (m_eventfd = eventfd(0, EFD_NONBLOCK))) [[unlikely]]
      {
         std::error_code const errorCode{errno, std::generic_category(),};
         log_system_error("[ring] failed to create eventfd: ({}) - {}", errorCode);
         io_uring_queue_exit(std::addressof(m_ring));
         throw engine_error{engine_errc::ring_creation, errorCode,};
      }
      /// The ring is empty, so a submission queue entry is always available here
      auto *submissionQueueEntry{io_uring_get_sqe(std::addressof(m_ring)),};
      assert(nullptr != submissionQueueEntry);
      io_uring_prep_read(submissionQueueEntry, m_eventfd, std::addressof(m_eventfdValue), sizeof(m_eventfdValue), 0);
      io_uring_sqe_set_data64(submissionQueueEntry, wake_userdata);
      if (auto const returnCode{io_uring_submit(std::addressof(m_ring)),}; 0 > returnCode) [[unlikely]]
      {
         std::error_code const errorCode{-returnCode, std::generic_category(),};
         log_system_error("[ring] failed to arm eventfd: ({}) - {}", errorCode);
         release();
         throw engine_error{engine_errc::ring_creation, errorCode,};
      }
   }

   ~ring_instance_uring() override
   {
      release();
   }

   ring_instance_uring &operator = (ring_instance_uring &&) = delete;
   ring_instance_uring &operator = (ring_instance_uring const &) = delete;

   [[nodiscard]] uint32_t capacity() const noexcept override
   {
      return m_capacity;
   }

   [[nodiscard]] uint32_t submission_queue_space() const noexcept override
   {
      return io_uring_sq_space_left(std::addressof(m_ring));
   }

   [[nodiscard]] uint32_t submission_queue_ready() const noexcept override
   {
      return io_uring_sq_ready(std::addressof(m_ring));
   }

   [[nodiscard]] std::error_code submit() override
   {
      if (auto const returnCode{io_uring_submit(std::addressof(m_ring)),}; 0 > returnCode) [[unlikely]]
      {
         return std::error_code{-returnCode, std::generic_category(),};
      }
      return std::error_code{};
   }

   [[nodiscard]] std::error_code submit_and_wait(uint32_t const waitNumber) override
   {
      if (auto const returnCode{io_uring_submit_and_wait(std::addressof(m_ring), waitNumber),}; 0 > returnCode) [[unlikely]]
      {
         return std::error_code{-returnCode, std::generic_category(),};
      }
      return std::error_code{};
   }

   uint32_t drain_completions(completion_listener &completionListener) override
   {
      io_uring_cqe *completionQueueEntry{nullptr,};
      uint32_t completionQueueHead;
      uint32_t numberOfCompletionQueueEntriesRemoved{0,};
      uint32_t numberOfCompletionsHandled{0,};
      io_uring_for_each_cqe(std::addressof(m_ring), completionQueueHead, completionQueueEntry)
      {
         ++numberOfCompletionQueueEntriesRemoved;
         if (wake_userdata == completionQueueEntry->user_data)
         {
            continue;
         }
         completionListener.handle_completion(completionQueueEntry->res, completionQueueEntry->user_data, completionQueueEntry->flags);
         ++numberOfCompletionsHandled;
      }
      io_uring_cq_advance(std::addressof(m_ring), numberOfCompletionQueueEntriesRemoved);
      return numberOfCompletionsHandled;
   }

   [[nodiscard]] std::array<uint32_t, 2> query_max_workers() override
   {
      std::array<uint32_t, 2> iowqMaxWorkers = {0, 0,};
      if (auto const returnCode{io_uring_register_iowq_max_workers(std::addressof(m_ring), iowqMaxWorkers.data()),}; 0 > returnCode) [[unlikely]]
      {
         std::error_code const errorCode{-returnCode, std::generic_category(),};
         log_system_error("[ring] failed to query IO workers limits: ({}) - {}", errorCode);
         throw engine_error{engine_errc::registration, errorCode,};
      }
      return iowqMaxWorkers;
   }

   void wake() override
   {
      assert(-1 != m_eventfd);
      if (-1 == eventfd_write(m_eventfd, 1)) [[unlikely]]
      {
         log_system_error("[ring] failed to raise eventfd: ({}) - {}", errno);
         unreachable();
      }
   }

private:
   /// liburing accessors take non-const pointers even for read-only queries
   mutable io_uring m_ring{};
   uint32_t m_capacity{0,};
   int m_eventfd{-1,};
   /// Target of the single wake read, written by the kernel until the ring is released
   eventfd_t m_eventfdValue{0,};

   /// Tears the ring down before the eventfd its pending read refers to
   void release() noexcept
   {
      io_uring_queue_exit(std::addressof(m_ring));
      if (-1 == close(m_eventfd)) [[unlikely]]
      {
         log_system_error("[ring] failed to destroy eventfd: ({}) - {}", errno);
      }
   }

   void push_unchecked(submission_entry const &submissionEntry) noexcept override
   {
      auto *submissionQueueEntry{io_uring_get_sqe(std::addressof(m_ring)),};
      if (nullptr == submissionQueueEntry) [[unlikely]]
      {
         log_error(std::source_location::current(), "[ring] failed to get submission queue entry, it must be a bug");
         unreachable();
      }
      *submissionQueueEntry = submissionEntry;
   }
};

std::unique_ptr<ring_instance> ring_instance::construct(uint32_t const capacity, uint32_t const maxUnboundedWorkers)
{
   return std::make_unique<ring_instance_uring>(capacity, maxUnboundedWorkers);
}

}
#endif
