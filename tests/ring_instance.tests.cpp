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

#include "linux/completion_listener.hpp"
#include "linux/ring_instance.hpp"
#include "linux/submission_template.hpp"
#include "testsuite.hpp"

#include <io_rings/engine_error.hpp>
#include <io_rings/operation_template.hpp>

#include <gmock/gmock.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace io_rings::tests
{

namespace
{

class ring_instance_test : public testsuite
{
protected:
   /// Skips the test when io_uring is not available to the test process
   [[nodiscard]] std::unique_ptr<ring_instance> construct_or_skip(uint32_t const capacity, uint32_t const maxUnboundedWorkers)
   {
      try
      {
         return ring_instance::construct(capacity, maxUnboundedWorkers);
      }
      catch (engine_error const &testError)
      {
         if ((engine_errc::ring_creation != testError.code()) && (engine_errc::registration != testError.code()))
         {
            throw;
         }
         m_unavailabilityReason = testError.what();
      }
      return nullptr;
   }

   std::string m_unavailabilityReason{};
};

class test_completion_collector final : public completion_listener
{
public:
   struct test_completion final
   {
      int32_t result;
      uint64_t userdata;
   };

   void handle_completion(int32_t const result, uint64_t const userdata, uint32_t) override
   {
      m_completions.push_back(test_completion{.result = result, .userdata = userdata,});
   }

   [[nodiscard]] std::vector<test_completion> const &completions() const noexcept
   {
      return m_completions;
   }

private:
   std::vector<test_completion> m_completions{};
};

}

TEST_F(ring_instance_test, capacity_is_a_power_of_two)
{
   auto const testRingInstance{construct_or_skip(6, 0),};
   if (nullptr == testRingInstance)
   {
      GTEST_SKIP() << m_unavailabilityReason;
   }
   EXPECT_EQ(8, testRingInstance->capacity());
   EXPECT_EQ(8, testRingInstance->submission_queue_space());
   EXPECT_EQ(0, testRingInstance->submission_queue_ready());
}

TEST_F(ring_instance_test, max_unbounded_workers)
{
   auto const testMaxUnboundedWorkers{random_number<uint32_t>(1, 16),};
   auto const testRingInstance{construct_or_skip(4, testMaxUnboundedWorkers),};
   if (nullptr == testRingInstance)
   {
      GTEST_SKIP() << m_unavailabilityReason;
   }
   EXPECT_EQ(testMaxUnboundedWorkers, testRingInstance->query_max_workers()[1]);
}

TEST_F(ring_instance_test, kernel_default_max_unbounded_workers)
{
   auto const testRingInstance{construct_or_skip(4, 0),};
   if (nullptr == testRingInstance)
   {
      GTEST_SKIP() << m_unavailabilityReason;
   }
   EXPECT_LT(0, testRingInstance->query_max_workers()[1]);
}

TEST_F(ring_instance_test, full_submission_queue)
{
   auto const testRingInstance{construct_or_skip(4, 0),};
   if (nullptr == testRingInstance)
   {
      GTEST_SKIP() << m_unavailabilityReason;
   }
   submission_template const testSubmissionTemplate{operation_template::nop(), false,};
   for (uint32_t testSlotIndex{0,}; testRingInstance->capacity() > testSlotIndex; ++testSlotIndex)
   {
      EXPECT_FALSE(testRingInstance->is_submission_queue_full());
      EXPECT_TRUE(testRingInstance->try_push(testSubmissionTemplate.prepare(testSlotIndex, nullptr)));
   }
   EXPECT_TRUE(testRingInstance->is_submission_queue_full());
   EXPECT_EQ(0, testRingInstance->submission_queue_space());
   EXPECT_EQ(testRingInstance->capacity(), testRingInstance->submission_queue_ready());
   EXPECT_FALSE(testRingInstance->try_push(testSubmissionTemplate.prepare(testRingInstance->capacity(), nullptr)));
   EXPECT_EQ(testRingInstance->capacity(), testRingInstance->submission_queue_ready());
}

TEST_F(ring_instance_test, nop_round_trip)
{
   auto const testRingInstance{construct_or_skip(4, 0),};
   if (nullptr == testRingInstance)
   {
      GTEST_SKIP() << m_unavailabilityReason;
   }
   submission_template const testSubmissionTemplate{operation_template::nop(), false,};
   ASSERT_TRUE(testRingInstance->try_push(testSubmissionTemplate.prepare(2, nullptr)));
   ASSERT_TRUE(testRingInstance->try_push(testSubmissionTemplate.prepare(3, nullptr)));
   ASSERT_FALSE(testRingInstance->submit_and_wait(2));
   EXPECT_EQ(0, testRingInstance->submission_queue_ready());
   test_completion_collector testCompletionCollector{};
   EXPECT_EQ(2, testRingInstance->drain_completions(testCompletionCollector));
   ASSERT_EQ(2, testCompletionCollector.completions().size());
   EXPECT_EQ(0, testCompletionCollector.completions()[0].result);
   EXPECT_EQ(2, testCompletionCollector.completions()[0].userdata);
   EXPECT_EQ(0, testCompletionCollector.completions()[1].result);
   EXPECT_EQ(3, testCompletionCollector.completions()[1].userdata);
   /// Drained completions are not visited twice
   EXPECT_EQ(0, testRingInstance->drain_completions(testCompletionCollector));
}

TEST_F(ring_instance_test, wake_releases_idle_wait)
{
   auto const testRingInstance{construct_or_skip(4, 0),};
   if (nullptr == testRingInstance)
   {
      GTEST_SKIP() << m_unavailabilityReason;
   }
   testRingInstance->wake();
   ASSERT_FALSE(testRingInstance->submit_and_wait(1));
   test_completion_collector testCompletionCollector{};
   /// The wake completion is consumed without reaching the listener
   EXPECT_EQ(0, testRingInstance->drain_completions(testCompletionCollector));
   EXPECT_TRUE(testCompletionCollector.completions().empty());
   EXPECT_EQ(testRingInstance->capacity(), testRingInstance->submission_queue_space());
}

}
