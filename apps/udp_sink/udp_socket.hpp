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

namespace io_rings::udp_sink
{

/// Datagram socket bound to "host:port", closed on destruction
class udp_socket final
{
public:
   udp_socket() = delete;
   udp_socket(udp_socket &&) = delete;
   udp_socket(udp_socket const &) = delete;
   /// Throws std::system_error
   [[nodiscard]] explicit udp_socket(std::string const &bindAddress);
   ~udp_socket();

   udp_socket &operator = (udp_socket &&) = delete;
   udp_socket &operator = (udp_socket const &) = delete;

   [[nodiscard]] int native_handle() const noexcept
   {
      return m_fileDescriptor;
   }

private:
   int m_fileDescriptor{-1,};
};

}
