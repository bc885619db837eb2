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

#include "common/logger.hpp" ///< for io_rings::log_error, io_rings::log_system_error
#include "options.hpp" ///< for io_rings::udp_sink::make_options, io_rings::udp_sink::to_sink_options
#include "udp_socket.hpp" ///< for io_rings::udp_sink::udp_socket
#include "utf8.hpp" ///< for io_rings::udp_sink::is_valid_utf8

#include <io_rings/completion_record.hpp>
#include <io_rings/engine_error.hpp>
#include <io_rings/operation_template.hpp>
#include <io_rings/ring_engine.hpp>

#include <cxxopts.hpp>

#include <bit> ///< for std::bit_cast
#include <cstddef> ///< for std::byte
#include <cstdlib> ///< for EXIT_FAILURE, EXIT_SUCCESS
#include <exception> ///< for std::exception
#include <format> ///< for std::format
#include <iostream> ///< for std::cout
#include <source_location> ///< for std::source_location
#include <span> ///< for std::span
#include <stdexcept> ///< for std::invalid_argument
#include <string_view> ///< for std::string_view
#include <syncstream> ///< for std::osyncstream
#include <system_error> ///< for std::errc, std::error_code, std::make_error_code, std::system_error

namespace
{

[[nodiscard]] std::error_code print_completion(io_rings::completion_record const &completionRecord, std::span<std::byte const> const payload)
{
   if (0 > completionRecord.result)
   {
      io_rings::log_system_error("[udp_sink] read failed: ({}) - {}", -completionRecord.result);
      return std::error_code{};
   }
   if (false == io_rings::udp_sink::is_valid_utf8(payload))
   {
      return std::make_error_code(std::errc::illegal_byte_sequence);
   }
   std::string_view const text{std::bit_cast<char const *>(payload.data()), payload.size(),};
   std::osyncstream{std::cout,} << std::format("\"{}\", {}\n", text, completionRecord.tag);
   return std::error_code{};
}

}

int main(int argc, char *argv[])
{
   auto options{io_rings::udp_sink::make_options(),};
   try
   {
      auto const parseResult{options.parse(argc, argv),};
      if (0 < parseResult.count("help"))
      {
         std::cout << options.help() << std::endl;
         return EXIT_SUCCESS;
      }
      auto const sinkOptions{io_rings::udp_sink::to_sink_options(parseResult),};
      io_rings::udp_sink::udp_socket const sink{sinkOptions.bindAddress,};
      io_rings::ring_engine const ringEngine
      {
         sinkOptions.engineConfig,
         io_rings::operation_template::read(sink.native_handle(), sinkOptions.bufferSize),
         print_completion,
      };
      ringEngine.run();
   }
   catch (cxxopts::exceptions::exception const &exception)
   {
      io_rings::log_error(std::source_location::current(), "[udp_sink] {}\n{}", exception.what(), options.help());
      return EXIT_FAILURE;
   }
   catch (std::invalid_argument const &exception)
   {
      io_rings::log_error(std::source_location::current(), "[udp_sink] {}\n{}", exception.what(), options.help());
      return EXIT_FAILURE;
   }
   catch (io_rings::engine_error const &exception)
   {
      io_rings::log_error(std::source_location::current(), "[udp_sink] engine stopped: {}", exception.what());
      return EXIT_FAILURE;
   }
   catch (std::system_error const &exception)
   {
      io_rings::log_error(std::source_location::current(), "[udp_sink] {}", exception.what());
      return EXIT_FAILURE;
   }
   catch (std::exception const &exception)
   {
      io_rings::log_error(std::source_location::current(), "[udp_sink] unexpected failure: {}", exception.what());
      return EXIT_FAILURE;
   }
   return EXIT_SUCCESS;
}
