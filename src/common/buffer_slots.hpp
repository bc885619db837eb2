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

#include <cassert> ///< for assert
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint32_t
#include <new> ///< for std::align_val_t
#include <optional> ///< for std::optional
#include <vector> ///< for std::vector

namespace io_rings
{

/// Fixed number of equally sized payload buffers, each one owned by at most one in-flight operation
class buffer_slots final
{
public:
   static constexpr std::align_val_t slot_alignment{64,};

   buffer_slots() = delete;
   buffer_slots(buffer_slots &&) = delete;
   buffer_slots(buffer_slots const &) = delete;
   [[nodiscard]] buffer_slots(uint32_t slotsCount, uint32_t slotSize);
   ~buffer_slots();

   buffer_slots &operator = (buffer_slots &&) = delete;
   buffer_slots &operator = (buffer_slots const &) = delete;

   /// nullptr when slots carry no payload
   [[nodiscard]] std::byte *bytes(uint32_t slotIndex) const noexcept;

   [[maybe_unused, nodiscard]] uint32_t free_count() const noexcept
   {
      return static_cast<uint32_t>(m_freeSlots.size());
   }

   [[nodiscard]] std::optional<uint32_t> pop_free() noexcept;
   void push_free(uint32_t slotIndex) noexcept;

   [[maybe_unused, nodiscard]] uint32_t slots_count() const noexcept
   {
      return m_slotsCount;
   }

   [[maybe_unused, nodiscard]] uint32_t slot_size() const noexcept
   {
      return m_slotSize;
   }

private:
   uint32_t const m_slotsCount;
   uint32_t const m_slotSize;
   size_t const m_slotStep;
   std::byte *m_bytes{nullptr,};
   std::vector<uint32_t> m_freeSlots{};
};

}
