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

#include <cstdint> ///< for int32_t, uint8_t, uint32_t, uint64_t

namespace io_rings
{

enum struct operation_kind : uint8_t
{
   nop = 0,
   read,
   recv,
};

struct operation_template final
{
   operation_kind kind{operation_kind::nop,};
   int32_t fileDescriptor{-1,};
   /// Size of the buffer slot attached to every in-flight copy, zero for operations without payload
   uint32_t bufferSize{0,};
   uint64_t offset{0,};
   /// recv(2) flags for operation_kind::recv, ignored otherwise
   int32_t operationFlags{0,};

   [[nodiscard]] static constexpr operation_template nop() noexcept
   {
      return operation_template{.kind = operation_kind::nop,};
   }

   [[nodiscard]] static constexpr operation_template read(int32_t const fileDescriptor, uint32_t const bufferSize, uint64_t const offset = 0) noexcept
   {
      return operation_template{.kind = operation_kind::read, .fileDescriptor = fileDescriptor, .bufferSize = bufferSize, .offset = offset,};
   }

   [[nodiscard]] static constexpr operation_template recv(int32_t const fileDescriptor, uint32_t const bufferSize, int32_t const recvFlags = 0) noexcept
   {
      return operation_template{
         .kind = operation_kind::recv,
         .fileDescriptor = fileDescriptor,
         .bufferSize = bufferSize,
         .offset = 0,
         .operationFlags = recvFlags,
      };
   }
};

}
