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

#include "linux/ring_instance.hpp" ///< for io_rings::submission_entry

#include <cassert> ///< for assert
#include <cstddef> ///< for size_t
#include <deque> ///< for std::deque
#include <optional> ///< for std::nullopt, std::optional

namespace io_rings
{

/// Entries refused by a full submission queue, handed back strictly in arrival order
class submission_backlog final
{
public:
   [[nodiscard]] submission_backlog() = default;
   submission_backlog(submission_backlog &&) = delete;
   submission_backlog(submission_backlog const &) = delete;

   submission_backlog &operator = (submission_backlog &&) = delete;
   submission_backlog &operator = (submission_backlog const &) = delete;

   [[nodiscard]] bool empty() const noexcept
   {
      return m_entries.empty();
   }

   [[nodiscard]] submission_entry const &front() const noexcept
   {
      assert(false == m_entries.empty());
      return m_entries.front();
   }

   [[nodiscard]] std::optional<submission_entry> pop_front()
   {
      if (true == m_entries.empty())
      {
         return std::nullopt;
      }
      auto const submissionEntry{m_entries.front(),};
      m_entries.pop_front();
      return submissionEntry;
   }

   void push(submission_entry const &submissionEntry)
   {
      m_entries.push_back(submissionEntry);
   }

   [[nodiscard]] size_t size() const noexcept
   {
      return m_entries.size();
   }

private:
   std::deque<submission_entry> m_entries{};
};

}
