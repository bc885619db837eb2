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

#include "io_rings/completion_record.hpp" ///< for io_rings::completion_handler
#include "io_rings/engine_config.hpp" ///< for io_rings::engine_config
#include "io_rings/operation_template.hpp" ///< for io_rings::operation_template
#include "linux/ring_context.hpp" ///< for io_rings::ring_context
#include "linux/ring_instance.hpp" ///< for io_rings::ring_instance
#include "linux/submission_template.hpp" ///< for io_rings::submission_template

#include <cstdint> ///< for uint32_t
#include <functional> ///< for std::function
#include <memory> ///< for std::unique_ptr
#include <stop_token> ///< for std::stop_token
#include <vector> ///< for std::vector

namespace io_rings
{

using ring_factory = std::function<std::unique_ptr<ring_instance>(uint32_t capacity, uint32_t maxUnboundedWorkers)>;

/// Rings of a single thread, serviced round robin one pass at a time
class ring_pool final
{
public:
   ring_pool() = delete;
   ring_pool(ring_pool &&) = delete;
   ring_pool(ring_pool const &) = delete;
   [[nodiscard]] ring_pool(
      engine_config const &engineConfig,
      operation_template const &operationTemplate,
      completion_handler completionHandler,
      ring_factory ringFactory = ring_instance::construct
   );

   ring_pool &operator = (ring_pool &&) = delete;
   ring_pool &operator = (ring_pool const &) = delete;

   [[maybe_unused, nodiscard]] std::vector<std::unique_ptr<ring_context>> const &rings() const noexcept
   {
      return m_ringContexts;
   }

   /// setup() followed by passes until stop is requested, throws io_rings::engine_error.
   /// A stop request wakes every ring, so a pass blocked on an idle ring still completes.
   void run(std::stop_token const &stopToken);
   /// Services every ring once, throws io_rings::engine_error
   void run_pass();
   /// Creates, fills and submits every ring while pinned to its CPU, throws io_rings::engine_error
   void setup();
   /// Safe to call from any thread once setup() is done
   void wake() const;

private:
   engine_config const m_engineConfig;
   submission_template const m_submissionTemplate;
   completion_handler const m_completionHandler;
   ring_factory const m_ringFactory;
   std::vector<std::unique_ptr<ring_context>> m_ringContexts{};
};

}
