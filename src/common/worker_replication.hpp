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

#include <cstdint> ///< for uint32_t
#include <functional> ///< for std::function
#include <stop_token> ///< for std::stop_source, std::stop_token
#include <thread> ///< for std::jthread

namespace io_rings
{

using worker_routine = std::function<void(uint32_t workerIndex, std::stop_token stopToken)>;
using thread_launcher = std::function<std::jthread(std::function<void()> threadBody)>;

/// Runs threadsCount copies of the routine, inline when threadsCount is one.
/// Every thread is joined before the first failure (in join order) is rethrown.
/// A failing worker requests stop on stopSource, so the other workers can leave their loops.
/// When a thread cannot be launched, the already launched workers are stopped and joined before the launch error is rethrown.
void run_replicated(uint32_t threadsCount, std::stop_source stopSource, worker_routine const &workerRoutine);
void run_replicated(uint32_t threadsCount, std::stop_source stopSource, worker_routine const &workerRoutine, thread_launcher const &threadLauncher);

}
