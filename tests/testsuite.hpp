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

#include <io_rings/cpu_id.hpp>

#include <gtest/gtest.h>

#include <sched.h>

#include <cstdint>
#include <random>
#include <type_traits>

namespace io_rings::tests
{

class testsuite : public testing::Test
{
private:
   using super = testing::Test;

public:
   testsuite() = default;
   testsuite(testsuite &&) = delete;
   testsuite(testsuite const &) = delete;

   testsuite &operator = (testsuite &&) = delete;
   testsuite &operator = (testsuite const &) = delete;

   /// First CPU the test process is allowed to run on
   [[nodiscard]] static cpu_id first_cpu();
   /// Number of CPUs the test process is allowed to run on
   [[nodiscard]] static uint32_t allowed_cpus_count();
   [[nodiscard]] static cpu_set_t current_thread_affinity();

   template<typename type>
   [[nodiscard]] type random_number(type const lowerBound, type const upperBound)
      requires((true == std::is_integral_v<type>) && (sizeof(type) >= sizeof(int)))
   {
      return std::uniform_int_distribution<type>{lowerBound, upperBound}(m_randomEngine);
   }

protected:
   void SetUp() override;

private:
   std::mt19937_64 m_randomEngine{};
};

}
