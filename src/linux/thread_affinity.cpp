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
#include "common/logger.hpp" ///< for io_rings::log_system_error
#include "common/utility.hpp" ///< for io_rings::to_underlying
#include "io_rings/engine_error.hpp" ///< for io_rings::engine_errc, io_rings::engine_error
#include "linux/thread_affinity.hpp" ///< for io_rings::cpu_id, io_rings::scoped_cpu_affinity

#include <pthread.h> ///< for pthread_getaffinity_np, pthread_self, pthread_setaffinity_np
#include <sched.h> ///< for CPU_SET, cpu_set_t, CPU_SETSIZE, CPU_ZERO

#include <cerrno> ///< for EINVAL
#include <cstdint> ///< for uint32_t
#include <memory> ///< for std::addressof
#include <system_error> ///< for std::error_code, std::generic_category

namespace io_rings
{

int get_thread_affinity(cpu_set_t &affinityMask) noexcept
{
   CPU_ZERO(std::addressof(affinityMask));
   return pthread_getaffinity_np(pthread_self(), sizeof(affinityMask), std::addressof(affinityMask));
}

int set_thread_affinity(cpu_set_t const &affinityMask) noexcept
{
   return pthread_setaffinity_np(pthread_self(), sizeof(affinityMask), std::addressof(affinityMask));
}

int set_thread_affinity(cpu_id const cpuId) noexcept
{
   if (static_cast<uint32_t>(CPU_SETSIZE) <= to_underlying(cpuId)) [[unlikely]]
   {
      return EINVAL;
   }
   cpu_set_t affinityMask;
   CPU_ZERO(std::addressof(affinityMask));
   CPU_SET(to_underlying(cpuId), std::addressof(affinityMask));
   return set_thread_affinity(affinityMask);
}

scoped_cpu_affinity::scoped_cpu_affinity(cpu_id const cpuId)
{
   if (auto const returnCode{get_thread_affinity(m_savedAffinityMask),}; 0 != returnCode) [[unlikely]]
   {
      std::error_code const errorCode{returnCode, std::generic_category(),};
      log_system_error("[affinity] failed to get thread affinity: ({}) - {}", errorCode);
      throw engine_error{engine_errc::affinity, errorCode,};
   }
   if (auto const returnCode{set_thread_affinity(cpuId),}; 0 != returnCode) [[unlikely]]
   {
      std::error_code const errorCode{returnCode, std::generic_category(),};
      log_system_error("[affinity] failed to pin thread to cpu core: ({}) - {}", errorCode);
      throw engine_error{engine_errc::affinity, errorCode,};
   }
}

scoped_cpu_affinity::~scoped_cpu_affinity()
{
   if (auto const returnCode{set_thread_affinity(m_savedAffinityMask),}; 0 != returnCode) [[unlikely]]
   {
      log_system_error("[affinity] failed to restore thread affinity: ({}) - {}", returnCode);
   }
}

}
#endif
