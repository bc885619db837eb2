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

#include "common/cpu_cycle.hpp" ///< for io_rings::cpu_cycle
#include "common/logger.hpp" ///< for io_rings::log_system_error
#include "io_rings/engine_error.hpp" ///< for io_rings::engine_errc, io_rings::engine_error
#include "linux/ring_context.hpp" ///< for io_rings::ring_context
#include "linux/ring_pool.hpp" ///< for io_rings::ring_factory, io_rings::ring_pool
#include "linux/thread_affinity.hpp" ///< for io_rings::with_cpu_pinned

#include <cassert> ///< for assert
#include <cstdint> ///< for uint32_t
#include <memory> ///< for std::make_unique
#include <stop_token> ///< for std::stop_callback, std::stop_token
#include <system_error> ///< for std::errc, std::error_code
#include <utility> ///< for std::move

namespace io_rings
{

ring_pool::ring_pool(
   engine_config const &engineConfig,
   operation_template const &operationTemplate,
   completion_handler completionHandler,
   ring_factory ringFactory
) :
   m_engineConfig{engineConfig,},
   m_submissionTemplate{operationTemplate, engineConfig.async_submission(),},
   m_completionHandler{std::move(completionHandler),},
   m_ringFactory{std::move(ringFactory),}
{
   assert(nullptr != m_ringFactory);
   m_ringContexts.reserve(m_engineConfig.rings_count());
}

void ring_pool::run(std::stop_token const &stopToken)
{
   setup();
   /// Registered once the rings exist, the callback only reads the ring list
   std::stop_callback const wakeOnStop{stopToken, [this] () { wake(); },};
   while (false == stopToken.stop_requested())
   {
      run_pass();
   }
}

void ring_pool::run_pass()
{
   assert(false == m_ringContexts.empty());
   for (auto const &ringContext : m_ringContexts)
   {
      if (auto const errorCode{ringContext->ring().submit_and_wait(1),}; errorCode)
      {
         if (std::errc::interrupted == errorCode)
         {
            continue;
         }
         log_system_error("[ring_pool] failed to submit prepared operations: ({}) - {}", errorCode);
         throw engine_error{engine_errc::submit, errorCode,};
      }
      auto const handlerErrorCode{ringContext->drain_completions(m_completionHandler),};
      if (auto const errorCode{ringContext->drain_backlog(),}; false == bool{errorCode,})
      {
         ringContext->fill();
      }
      else if ((std::errc::device_or_resource_busy != errorCode) && (std::errc::interrupted != errorCode)) [[unlikely]]
      {
         log_system_error("[ring_pool] failed to submit backlog: ({}) - {}", errorCode);
         throw engine_error{engine_errc::submit, errorCode,};
      }
      if (handlerErrorCode) [[unlikely]]
      {
         if (true == m_engineConfig.abort_on_handler_error())
         {
            throw engine_error{engine_errc::decode, handlerErrorCode,};
         }
         log_system_error("[ring_pool] failed to handle completion: ({}) - {}", handlerErrorCode);
      }
   }
}

void ring_pool::setup()
{
   assert(true == m_ringContexts.empty());
   cpu_cycle cpuCycle{m_engineConfig.cpus(),};
   for (uint32_t ringIndex{0,}; m_engineConfig.rings_count() > ringIndex; ++ringIndex)
   {
      with_cpu_pinned(
         cpuCycle.next(),
         [this] ()
         {
            auto ring{m_ringFactory(m_engineConfig.ring_capacity(), m_engineConfig.max_unbounded_workers()),};
            auto const targetDepth{m_engineConfig.target_depth(ring->capacity()),};
            auto ringContext{std::make_unique<ring_context>(std::move(ring), m_submissionTemplate, targetDepth),};
            ringContext->fill();
            if (auto const errorCode{ringContext->ring().submit(),}; errorCode) [[unlikely]]
            {
               log_system_error("[ring_pool] failed to submit initial operations: ({}) - {}", errorCode);
               throw engine_error{engine_errc::submit, errorCode,};
            }
            m_ringContexts.push_back(std::move(ringContext));
         }
      );
   }
}

void ring_pool::wake() const
{
   for (auto const &ringContext : m_ringContexts)
   {
      ringContext->ring().wake();
   }
}

}
