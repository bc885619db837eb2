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

#include "io_rings/operation_template.hpp" ///< for io_rings::operation_template
#include "linux/ring_instance.hpp" ///< for io_rings::submission_entry

#include <cstddef> ///< for std::byte
#include <cstdint> ///< for uint32_t

namespace io_rings
{

/// Prebuilt submission entry of the operation template, stamped with a buffer slot per copy
class submission_template final
{
public:
   submission_template() = delete;
   [[nodiscard]] submission_template(submission_template &&rhs) noexcept = default;
   [[nodiscard]] submission_template(submission_template const &rhs) noexcept = default;
   [[nodiscard]] submission_template(operation_template const &operationTemplate, bool asyncSubmission) noexcept;

   submission_template &operator = (submission_template &&) = delete;
   submission_template &operator = (submission_template const &) = delete;

   [[nodiscard]] uint32_t buffer_size() const noexcept
   {
      return m_bufferSize;
   }

   [[nodiscard]] submission_entry prepare(uint32_t slotIndex, std::byte *slotBytes) const noexcept;

private:
   submission_entry m_prototype{};
   uint32_t m_bufferSize{0,};
};

}
