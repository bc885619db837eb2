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

#include <string> ///< for std::string
#include <system_error> ///< for std::error_code, std::is_error_code_enum, std::system_error
#include <type_traits> ///< for std::true_type

namespace io_rings
{

enum struct engine_errc : int
{
   ring_creation = 1,
   registration,
   affinity,
   submit,
   decode,
};

[[nodiscard]] std::error_code make_error_code(engine_errc code) noexcept;

/// Fatal engine failure: code() tells what failed, cause() holds the reason reported by the system or the handler
class engine_error final : public std::system_error
{
private:
   using super = std::system_error;

public:
   [[nodiscard]] engine_error(engine_errc code, std::error_code const &cause);

   [[maybe_unused, nodiscard]] std::error_code const &cause() const noexcept
   {
      return m_cause;
   }

private:
   std::error_code m_cause;
};

}

template<>
struct std::is_error_code_enum<io_rings::engine_errc> : std::true_type
{};
