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

#include "options.hpp"

#include <io_rings/cpu_id.hpp> ///< for io_rings::cpu_id
#include <io_rings/engine_config.hpp> ///< for io_rings::engine_config

#include <cxxopts.hpp> ///< for cxxopts::Options, cxxopts::ParseResult, cxxopts::value

#include <algorithm> ///< for std::transform
#include <cstdint> ///< for uint32_t
#include <iterator> ///< for std::back_inserter
#include <stdexcept> ///< for std::invalid_argument
#include <string> ///< for std::string
#include <utility> ///< for std::move
#include <vector> ///< for std::vector

namespace io_rings::udp_sink
{

cxxopts::Options make_options()
{
   cxxopts::Options options{"io_rings_udp_sink", "Keeps io_uring rings saturated with reads from a UDP socket and prints every datagram",};
   options.add_options()
      ("a,async", "Set IOSQE_ASYNC flag on submission entries")
      ("s,sqes", "Target submission depth per ring, 0 for the ring capacity", cxxopts::value<uint32_t>()->default_value("0"))
      ("m,max-unbounded-workers", "Max unbounded IO workers per ring, 0 for the kernel default", cxxopts::value<uint32_t>()->default_value("0"))
      ("r,num-rings", "Number of rings per thread", cxxopts::value<uint32_t>()->default_value("1"))
      ("t,num-threads", "Number of engine threads", cxxopts::value<uint32_t>()->default_value("1"))
      ("c,cpu", "CPUs to set up rings on, cycled over the rings", cxxopts::value<std::vector<uint32_t>>()->default_value("0"))
      ("b,bind", "UDP address to read datagrams from", cxxopts::value<std::string>()->default_value("127.0.0.1:3000"))
      ("buffer-size", "Payload buffer size of every in-flight read", cxxopts::value<uint32_t>()->default_value("1024"))
      ("abort-on-decode-error", "Stop when a datagram is not valid UTF-8")
      ("h,help", "Print usage")
   ;
   return options;
}

sink_options to_sink_options(cxxopts::ParseResult const &parseResult)
{
   auto const ringsCount{parseResult["num-rings"].as<uint32_t>(),};
   auto const threadsCount{parseResult["num-threads"].as<uint32_t>(),};
   auto const bufferSize{parseResult["buffer-size"].as<uint32_t>(),};
   if ((0 == ringsCount) || (0 == threadsCount) || (0 == bufferSize))
   {
      throw std::invalid_argument{"num-rings, num-threads and buffer-size must be positive",};
   }
   std::vector<cpu_id> cpus{};
   auto const &cpuIndices{parseResult["cpu"].as<std::vector<uint32_t>>(),};
   std::transform(
      cpuIndices.begin(),
      cpuIndices.end(),
      std::back_inserter(cpus),
      [] (uint32_t const cpuIndex) { return cpu_id{cpuIndex,}; }
   );
   return sink_options
   {
      .engineConfig = engine_config{}
         .with_async_submission(0 < parseResult.count("async"))
         .with_submission_depth(parseResult["sqes"].as<uint32_t>())
         .with_max_unbounded_workers(parseResult["max-unbounded-workers"].as<uint32_t>())
         .with_rings_count(ringsCount)
         .with_threads_count(threadsCount)
         .with_cpus(std::move(cpus))
         .with_abort_on_handler_error(0 < parseResult.count("abort-on-decode-error"))
      ,
      .bindAddress = parseResult["bind"].as<std::string>(),
      .bufferSize = bufferSize,
   };
}

}
