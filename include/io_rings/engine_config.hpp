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

#include "io_rings/cpu_id.hpp" ///< for io_rings::cpu_id

#include <cstdint> ///< for uint32_t
#include <vector> ///< for std::vector

namespace io_rings
{

class engine_config final
{
public:
   static constexpr uint32_t default_ring_capacity{4096,};

   [[maybe_unused, nodiscard]] engine_config() = default;
   [[maybe_unused, nodiscard]] engine_config(engine_config &&rhs) noexcept = default;
   [[maybe_unused, nodiscard]] engine_config(engine_config const &rhs) = default;

   [[maybe_unused]] engine_config &operator = (engine_config &&rhs) noexcept = default;
   [[maybe_unused]] engine_config &operator = (engine_config const &rhs) = default;

   [[maybe_unused, nodiscard]] bool abort_on_handler_error() const noexcept
   {
      return m_abortOnHandlerError;
   }

   [[maybe_unused, nodiscard]] bool async_submission() const noexcept
   {
      return m_asyncSubmission;
   }

   /// Never empty, the first CPU is used when no CPU has been configured
   [[maybe_unused, nodiscard]] std::vector<cpu_id> const &cpus() const noexcept
   {
      return m_cpus;
   }

   [[maybe_unused, nodiscard]] uint32_t max_unbounded_workers() const noexcept
   {
      return m_maxUnboundedWorkers;
   }

   [[maybe_unused, nodiscard]] uint32_t ring_capacity() const noexcept
   {
      return m_ringCapacity;
   }

   [[maybe_unused, nodiscard]] uint32_t rings_count() const noexcept
   {
      return m_ringsCount;
   }

   [[maybe_unused, nodiscard]] uint32_t submission_depth() const noexcept
   {
      return m_submissionDepth;
   }

   /// Submission depth with zero resolved to the capacity the ring actually got, which may exceed ring_capacity()
   [[nodiscard]] uint32_t target_depth(uint32_t actualRingCapacity) const noexcept;

   [[maybe_unused, nodiscard]] uint32_t threads_count() const noexcept
   {
      return m_threadsCount;
   }

   [[nodiscard]] engine_config with_abort_on_handler_error(bool value) const;
   [[nodiscard]] engine_config with_async_submission(bool value) const;
   [[nodiscard]] engine_config with_cpus(std::vector<cpu_id> value) const;
   [[nodiscard]] engine_config with_max_unbounded_workers(uint32_t value) const;
   [[nodiscard]] engine_config with_ring_capacity(uint32_t value) const;
   [[nodiscard]] engine_config with_rings_count(uint32_t value) const;
   [[nodiscard]] engine_config with_submission_depth(uint32_t value) const;
   [[nodiscard]] engine_config with_threads_count(uint32_t value) const;

private:
   bool m_abortOnHandlerError{false,};
   bool m_asyncSubmission{false,};
   std::vector<cpu_id> m_cpus{cpu_id{0,},};
   uint32_t m_maxUnboundedWorkers{0,};
   uint32_t m_ringCapacity{default_ring_capacity,};
   uint32_t m_ringsCount{1,};
   uint32_t m_submissionDepth{0,};
   uint32_t m_threadsCount{1,};
};

}
