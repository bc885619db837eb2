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

#include <io_rings/engine_config.hpp> ///< for io_rings::engine_config

#include <cxxopts.hpp> ///< for cxxopts::Options, cxxopts::ParseResult

#include <cstdint> ///< for uint32_t
#include <string> ///< for std::string

namespace io_rings::udp_sink
{

struct sink_options final
{
   engine_config engineConfig;
   std::string bindAddress;
   uint32_t bufferSize;
};

/// Command line table of the sink, with the defaults of every option
[[nodiscard]] cxxopts::Options make_options();
/// Throws std::invalid_argument when num-rings, num-threads or buffer-size is zero
[[nodiscard]] sink_options to_sink_options(cxxopts::ParseResult const &parseResult);

}
