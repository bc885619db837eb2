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

#include "io_rings/engine_config.hpp" ///< for io_rings::cpu_id, io_rings::engine_config

#include <cassert> ///< for assert
#include <cstdint> ///< for uint32_t
#include <utility> ///< for std::move
#include <vector> ///< for std::vector

namespace io_rings
{

uint32_t engine_config::target_depth(uint32_t const actualRingCapacity) const noexcept
{
   return (0 == m_submissionDepth) ? actualRingCapacity : m_submissionDepth;
}

engine_config engine_config::with_abort_on_handler_error(bool const value) const
{
   engine_config engineConfig{*this,};
   engineConfig.m_abortOnHandlerError = value;
   return engineConfig;
}

engine_config engine_config::with_async_submission(bool const value) const
{
   engine_config engineConfig{*this,};
   engineConfig.m_asyncSubmission = value;
   return engineConfig;
}

engine_config engine_config::with_cpus(std::vector<cpu_id> value) const
{
   engine_config engineConfig{*this,};
   if (true == value.empty())
   {
      value.push_back(cpu_id{0,});
   }
   engineConfig.m_cpus = std::move(value);
   return engineConfig;
}

engine_config engine_config::with_max_unbounded_workers(uint32_t const value) const
{
   engine_config engineConfig{*this,};
   engineConfig.m_maxUnboundedWorkers = value;
   return engineConfig;
}

engine_config engine_config::with_ring_capacity(uint32_t const value) const
{
   assert(0 < value);
   engine_config engineConfig{*this,};
   engineConfig.m_ringCapacity = value;
   return engineConfig;
}

engine_config engine_config::with_rings_count(uint32_t const value) const
{
   assert(0 < value);
   engine_config engineConfig{*this,};
   engineConfig.m_ringsCount = value;
   return engineConfig;
}

engine_config engine_config::with_submission_depth(uint32_t const value) const
{
   engine_config engineConfig{*this,};
   engineConfig.m_submissionDepth = value;
   return engineConfig;
}

engine_config engine_config::with_threads_count(uint32_t const value) const
{
   assert(0 < value);
   engine_config engineConfig{*this,};
   engineConfig.m_threadsCount = value;
   return engineConfig;
}

}
