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

#include "common/buffer_slots.hpp" ///< for io_rings::buffer_slots
#include "common/utility.hpp" ///< for io_rings::to_underlying

#include <algorithm> ///< for std::find
#include <bit> ///< for std::bit_cast
#include <cassert> ///< for assert
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint32_t
#include <cstring> ///< for std::memset
#include <new> ///< for operator delete, operator new
#include <optional> ///< for std::nullopt, std::optional

namespace io_rings
{

namespace
{

[[nodiscard]] constexpr size_t align_slot_size(size_t const slotSize) noexcept
{
   auto const alignment{to_underlying(buffer_slots::slot_alignment),};
   return (0 == (slotSize % alignment)) ? slotSize : (slotSize + alignment - (slotSize % alignment));
}

}

buffer_slots::buffer_slots(uint32_t const slotsCount, uint32_t const slotSize) :
   m_slotsCount{slotsCount,},
   m_slotSize{slotSize,},
   m_slotStep{align_slot_size(slotSize),}
{
   assert(0 < slotsCount);
   if (0 < m_slotSize)
   {
      auto const bytesLength{m_slotStep * m_slotsCount,};
      m_bytes = std::bit_cast<std::byte *>(::operator new(bytesLength, slot_alignment));
      std::memset(m_bytes, 0, bytesLength);
   }
   m_freeSlots.reserve(m_slotsCount);
   for (auto slotIndex{m_slotsCount,}; 0 < slotIndex; --slotIndex)
   {
      m_freeSlots.push_back(slotIndex - 1);
   }
}

buffer_slots::~buffer_slots()
{
   if (nullptr != m_bytes)
   {
      ::operator delete(m_bytes, slot_alignment);
   }
}

std::byte *buffer_slots::bytes(uint32_t const slotIndex) const noexcept
{
   assert(m_slotsCount > slotIndex);
   return (nullptr == m_bytes) ? nullptr : (m_bytes + m_slotStep * slotIndex);
}

std::optional<uint32_t> buffer_slots::pop_free() noexcept
{
   if (true == m_freeSlots.empty())
   {
      return std::nullopt;
   }
   auto const slotIndex{m_freeSlots.back(),};
   m_freeSlots.pop_back();
   return slotIndex;
}

void buffer_slots::push_free(uint32_t const slotIndex) noexcept
{
   assert(m_slotsCount > slotIndex);
   assert(m_freeSlots.end() == std::find(m_freeSlots.begin(), m_freeSlots.end(), slotIndex));
   m_freeSlots.push_back(slotIndex);
}

}
