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

#include <stop_token> ///< for std::stop_token

namespace io_rings
{

/// Runs engine_config::threads_count() independent ring pools, each resubmitting the operation template forever
class ring_engine final
{
public:
   ring_engine() = delete;
   ring_engine(ring_engine &&) = delete;
   ring_engine(ring_engine const &) = delete;
   [[nodiscard]] ring_engine(engine_config engineConfig, operation_template const &operationTemplate, completion_handler completionHandler);

   ring_engine &operator = (ring_engine &&) = delete;
   ring_engine &operator = (ring_engine const &) = delete;

   /// Returns only by throwing io_rings::engine_error, after every engine thread has been joined
   void run() const;
   /// Same as run(), additionally returns once stop is requested, a stop wakes rings that are waiting for completions
   void run(std::stop_token const &stopToken) const;

private:
   engine_config const m_engineConfig;
   operation_template const m_operationTemplate;
   completion_handler const m_completionHandler;
};

}
