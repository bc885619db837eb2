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

#include "common/utility.hpp" ///< for io_rings::to_underlying
#include "io_rings/engine_error.hpp" ///< for io_rings::engine_errc, io_rings::engine_error

#include <string> ///< for std::string
#include <system_error> ///< for std::error_category, std::error_code

namespace io_rings
{

namespace
{

struct engine_error_category final
{
private:
   class engine_error_category_impl final : public std::error_category
   {
   public:
      [[nodiscard]] constexpr engine_error_category_impl() noexcept = default;
      engine_error_category_impl(engine_error_category_impl &&) = delete;
      engine_error_category_impl(engine_error_category_impl const &) = delete;

      engine_error_category_impl &operator = (engine_error_category_impl &&) = delete;
      engine_error_category_impl &operator = (engine_error_category_impl const &) = delete;

      [[nodiscard]] const char *name() const noexcept override
      {
         return "io_rings";
      }

      [[nodiscard]] std::string message(int const value) const override
      {
         switch (static_cast<engine_errc>(value))
         {
         case engine_errc::ring_creation:
         return std::string{"Failed to create ring",};

         case engine_errc::registration:
         return std::string{"Failed to register IO workers limits",};

         case engine_errc::affinity:
         return std::string{"Failed to change thread affinity",};

         case engine_errc::submit:
         return std::string{"Failed to submit prepared operations",};

         case engine_errc::decode:
         return std::string{"Failed to handle completion payload",};

         [[unlikely]] default: return std::string{"Unknown error, it must be a bug",};
         }
      }
   };

   static inline engine_error_category_impl impl{};

public:
   [[nodiscard]] static std::error_category const &instance() noexcept
   {
      return impl;
   }
};

}

std::error_code make_error_code(engine_errc const code) noexcept
{
   return std::error_code{to_underlying(code), engine_error_category::instance(),};
}

engine_error::engine_error(engine_errc const code, std::error_code const &cause) :
   super{make_error_code(code), std::string{"("} + std::to_string(cause.value()) + ") - " + cause.message(),},
   m_cause{cause,}
{}

}
