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

#include <cstddef> ///< for std::byte
#include <cstdint> ///< for int32_t, uint64_t
#include <functional> ///< for std::function
#include <span> ///< for std::span
#include <system_error> ///< for std::error_code

namespace io_rings
{

struct completion_record final
{
   /// Negated errno on failure, operation defined value (bytes transferred) otherwise
   int32_t result;
   /// Index of the buffer slot the completed operation was armed with
   uint64_t tag;
};

/// Invoked concurrently from every engine thread, the payload span is valid only during the call.
/// A non-zero return is reported as a decode failure of the completion.
using completion_handler = std::function<std::error_code(completion_record const &completionRecord, std::span<std::byte const> payload)>;

}
