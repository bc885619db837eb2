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

#include <cassert> ///< for assert
#include <cstddef> ///< for size_t
#include <utility> ///< for std::move
#include <vector> ///< for std::vector

namespace io_rings
{

/// Endless round robin over a finite CPU list, backed by a modular index
class cpu_cycle final
{
public:
   cpu_cycle() = delete;
   [[nodiscard]] cpu_cycle(cpu_cycle &&rhs) noexcept = default;
   [[nodiscard]] cpu_cycle(cpu_cycle const &rhs) = default;

   [[nodiscard]] explicit cpu_cycle(std::vector<cpu_id> cpus) :
      m_cpus{std::move(cpus),}
   {
      if (true == m_cpus.empty())
      {
         m_cpus.push_back(cpu_id{0,});
      }
   }

   cpu_cycle &operator = (cpu_cycle &&) = delete;
   cpu_cycle &operator = (cpu_cycle const &) = delete;

   [[nodiscard]] cpu_id next() noexcept
   {
      assert(false == m_cpus.empty());
      auto const cpuId{m_cpus[m_position],};
      m_position = (m_position + 1) % m_cpus.size();
      return cpuId;
   }

   [[maybe_unused, nodiscard]] size_t position() const noexcept
   {
      return m_position;
   }

private:
   std::vector<cpu_id> m_cpus;
   size_t m_position{0,};
};

}
