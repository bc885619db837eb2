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

#include <sched.h> ///< for cpu_set_t

#include <utility> ///< for std::forward

namespace io_rings
{

/// Return zero on success, error number otherwise
[[nodiscard]] int get_thread_affinity(cpu_set_t &affinityMask) noexcept;
[[nodiscard]] int set_thread_affinity(cpu_set_t const &affinityMask) noexcept;
[[nodiscard]] int set_thread_affinity(cpu_id cpuId) noexcept;

/// Pins the calling thread to a single CPU for the lifetime of the object, then restores the previous mask
class scoped_cpu_affinity final
{
public:
   scoped_cpu_affinity() = delete;
   scoped_cpu_affinity(scoped_cpu_affinity &&) = delete;
   scoped_cpu_affinity(scoped_cpu_affinity const &) = delete;
   /// Throws io_rings::engine_error
   [[nodiscard]] explicit scoped_cpu_affinity(cpu_id cpuId);
   ~scoped_cpu_affinity();

   scoped_cpu_affinity &operator = (scoped_cpu_affinity &&) = delete;
   scoped_cpu_affinity &operator = (scoped_cpu_affinity const &) = delete;

private:
   cpu_set_t m_savedAffinityMask;
};

template<typename routine>
decltype(auto) with_cpu_pinned(cpu_id const cpuId, routine &&body)
{
   [[maybe_unused]] scoped_cpu_affinity const cpuAffinityGuard{cpuId,};
   return std::forward<routine>(body)();
}

}
