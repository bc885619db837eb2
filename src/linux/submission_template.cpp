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

#include "io_rings/operation_template.hpp" ///< for io_rings::operation_kind, io_rings::operation_template
#include "linux/submission_template.hpp" ///< for io_rings::submission_entry, io_rings::submission_template

#include <liburing.h> ///< for io_uring_prep_nop, io_uring_prep_read, io_uring_prep_recv, io_uring_sqe_set_data64, IOSQE_ASYNC

#include <bit> ///< for std::bit_cast
#include <cassert> ///< for assert
#include <cstddef> ///< for std::byte
#include <cstdint> ///< for uint32_t, uint64_t, uintptr_t
#include <memory> ///< for std::addressof

namespace io_rings
{

submission_template::submission_template(operation_template const &operationTemplate, bool const asyncSubmission) noexcept :
   m_bufferSize{(operation_kind::nop == operationTemplate.kind) ? 0 : operationTemplate.bufferSize,}
{
   switch (operationTemplate.kind)
   {
   case operation_kind::nop:
   {
      io_uring_prep_nop(std::addressof(m_prototype));
   }
   break;

   case operation_kind::read:
   {
      assert(0 < operationTemplate.bufferSize);
      io_uring_prep_read(
         std::addressof(m_prototype),
         operationTemplate.fileDescriptor,
         nullptr,
         operationTemplate.bufferSize,
         operationTemplate.offset
      );
   }
   break;

   case operation_kind::recv:
   {
      assert(0 < operationTemplate.bufferSize);
      io_uring_prep_recv(
         std::addressof(m_prototype),
         operationTemplate.fileDescriptor,
         nullptr,
         operationTemplate.bufferSize,
         operationTemplate.operationFlags
      );
   }
   break;
   }
   if (true == asyncSubmission)
   {
      m_prototype.flags |= IOSQE_ASYNC;
   }
}

submission_entry submission_template::prepare(uint32_t const slotIndex, std::byte *slotBytes) const noexcept
{
   assert((0 == m_bufferSize) || (nullptr != slotBytes));
   auto submissionEntry{m_prototype,};
   if (0 < m_bufferSize)
   {
      submissionEntry.addr = static_cast<uint64_t>(std::bit_cast<uintptr_t>(slotBytes));
   }
   io_uring_sqe_set_data64(std::addressof(submissionEntry), slotIndex);
   return submissionEntry;
}

}
