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

#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint32_t, uint8_t
#include <span> ///< for std::span

namespace io_rings::udp_sink
{

/// Rejects overlong forms, surrogates and code points above U+10FFFF
[[nodiscard]] constexpr bool is_valid_utf8(std::span<std::byte const> const bytes) noexcept
{
   size_t position{0,};
   while (bytes.size() > position)
   {
      auto const leadByte{static_cast<uint8_t>(bytes[position]),};
      if (0x80 > leadByte)
      {
         ++position;
         continue;
      }
      size_t sequenceLength{0,};
      uint32_t codePoint{0,};
      uint32_t minCodePoint{0,};
      if (0xC0 == (leadByte & 0xE0))
      {
         sequenceLength = 2;
         codePoint = leadByte & 0x1F;
         minCodePoint = 0x80;
      }
      else if (0xE0 == (leadByte & 0xF0))
      {
         sequenceLength = 3;
         codePoint = leadByte & 0x0F;
         minCodePoint = 0x800;
      }
      else if (0xF0 == (leadByte & 0xF8))
      {
         sequenceLength = 4;
         codePoint = leadByte & 0x07;
         minCodePoint = 0x10000;
      }
      else
      {
         return false;
      }
      if ((bytes.size() - position) < sequenceLength)
      {
         return false;
      }
      for (size_t index{1,}; sequenceLength > index; ++index)
      {
         auto const continuationByte{static_cast<uint8_t>(bytes[position + index]),};
         if (0x80 != (continuationByte & 0xC0))
         {
            return false;
         }
         codePoint = (codePoint << 6) | (continuationByte & 0x3F);
      }
      if ((minCodePoint > codePoint) || (0x10FFFF < codePoint) || ((0xD800 <= codePoint) && (0xDFFF >= codePoint)))
      {
         return false;
      }
      position += sequenceLength;
   }
   return true;
}

}
