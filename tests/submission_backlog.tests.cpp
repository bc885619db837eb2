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

#include "linux/submission_backlog.hpp"
#include "testsuite.hpp"

#include <cstdint>

namespace io_rings::tests
{

namespace
{

using submission_backlog_test = testsuite;

[[nodiscard]] submission_entry make_test_entry(uint64_t const userdata)
{
   submission_entry testEntry{};
   testEntry.user_data = userdata;
   return testEntry;
}

}

TEST_F(submission_backlog_test, first_in_first_out)
{
   submission_backlog testBacklog{};
   EXPECT_TRUE(testBacklog.empty());
   EXPECT_FALSE(testBacklog.pop_front().has_value());
   auto const testEntriesCount{random_number<uint64_t>(1, 100),};
   for (uint64_t testUserdata{0,}; testEntriesCount > testUserdata; ++testUserdata)
   {
      testBacklog.push(make_test_entry(testUserdata));
   }
   EXPECT_FALSE(testBacklog.empty());
   EXPECT_EQ(testEntriesCount, testBacklog.size());
   for (uint64_t testUserdata{0,}; testEntriesCount > testUserdata; ++testUserdata)
   {
      EXPECT_EQ(testUserdata, testBacklog.front().user_data);
      auto const testEntry{testBacklog.pop_front(),};
      ASSERT_TRUE(testEntry.has_value());
      EXPECT_EQ(testUserdata, testEntry->user_data);
   }
   EXPECT_TRUE(testBacklog.empty());
}

}
