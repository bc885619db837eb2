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

#include "common/logger.hpp" ///< for io_rings::log_info
#include "common/worker_replication.hpp" ///< for io_rings::run_replicated
#include "io_rings/completion_record.hpp" ///< for io_rings::completion_handler
#include "io_rings/engine_config.hpp" ///< for io_rings::engine_config
#include "io_rings/operation_template.hpp" ///< for io_rings::operation_template
#include "io_rings/ring_engine.hpp" ///< for io_rings::ring_engine
#include "linux/ring_pool.hpp" ///< for io_rings::ring_pool

#include <cstdint> ///< for uint32_t
#include <source_location> ///< for std::source_location
#include <stop_token> ///< for std::stop_callback, std::stop_source, std::stop_token
#include <utility> ///< for std::move

namespace io_rings
{

ring_engine::ring_engine(engine_config engineConfig, operation_template const &operationTemplate, completion_handler completionHandler) :
   m_engineConfig{std::move(engineConfig),},
   m_operationTemplate{operationTemplate,},
   m_completionHandler{std::move(completionHandler),}
{}

void ring_engine::run() const
{
   run(std::stop_token{});
}

void ring_engine::run(std::stop_token const &stopToken) const
{
   std::stop_source stopSource{};
   std::stop_callback const stopForwarder{stopToken, [&stopSource] () { stopSource.request_stop(); },};
   run_replicated(
      m_engineConfig.threads_count(),
      stopSource,
      [this] (uint32_t const workerIndex, std::stop_token const workerStopToken)
      {
         log_info(std::source_location::current(), "[ring_engine] worker {} started with {} rings", workerIndex, m_engineConfig.rings_count());
         ring_pool ringPool{m_engineConfig, m_operationTemplate, m_completionHandler,};
         ringPool.run(workerStopToken);
      }
   );
}

}
