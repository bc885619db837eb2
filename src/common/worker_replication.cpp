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

#include "common/logger.hpp" ///< for io_rings::log_error
#include "common/worker_replication.hpp" ///< for io_rings::run_replicated, io_rings::thread_launcher, io_rings::worker_routine

#include <cassert> ///< for assert
#include <cstdint> ///< for uint32_t
#include <exception> ///< for std::current_exception, std::exception
#include <functional> ///< for std::function
#include <future> ///< for std::future, std::promise
#include <source_location> ///< for std::source_location
#include <stop_token> ///< for std::stop_source
#include <thread> ///< for std::jthread
#include <utility> ///< for std::move
#include <vector> ///< for std::vector

namespace io_rings
{

void run_replicated(uint32_t const threadsCount, std::stop_source stopSource, worker_routine const &workerRoutine)
{
   run_replicated(
      threadsCount,
      std::move(stopSource),
      workerRoutine,
      [] (std::function<void()> threadBody)
      {
         return std::jthread{std::move(threadBody),};
      }
   );
}

void run_replicated(uint32_t const threadsCount, std::stop_source stopSource, worker_routine const &workerRoutine, thread_launcher const &threadLauncher)
{
   assert(0 < threadsCount);
   assert(nullptr != workerRoutine);
   assert(nullptr != threadLauncher);
   if (1 == threadsCount)
   {
      workerRoutine(0, stopSource.get_token());
      return;
   }
   /// Promises outlive the threads, which are declared later and therefore joined first
   std::vector<std::promise<void>> workerPromises(threadsCount);
   std::vector<std::future<void>> workerFutures{};
   workerFutures.reserve(threadsCount);
   for (auto &workerPromise : workerPromises)
   {
      workerFutures.push_back(workerPromise.get_future());
   }
   std::vector<std::jthread> workerThreads{};
   workerThreads.reserve(threadsCount);
   try
   {
      for (uint32_t workerIndex{0,}; threadsCount > workerIndex; ++workerIndex)
      {
         workerThreads.push_back(
            threadLauncher(
               [&workerRoutine, &workerPromise = workerPromises[workerIndex], stopSource, workerIndex] () mutable
               {
                  try
                  {
                     workerRoutine(workerIndex, stopSource.get_token());
                     workerPromise.set_value();
                  }
                  catch (std::exception const &exception)
                  {
                     log_error(std::source_location::current(), "[worker] thread {} failed: {}", workerIndex, exception.what());
                     stopSource.request_stop();
                     workerPromise.set_exception(std::current_exception());
                  }
                  catch (...)
                  {
                     stopSource.request_stop();
                     workerPromise.set_exception(std::current_exception());
                  }
               }
            )
         );
      }
   }
   catch (std::exception const &exception)
   {
      log_error(std::source_location::current(), "[worker] failed to launch thread {}: {}", workerThreads.size(), exception.what());
      stopSource.request_stop();
      for (auto &workerThread : workerThreads)
      {
         workerThread.join();
      }
      throw;
   }
   for (auto &workerThread : workerThreads)
   {
      workerThread.join();
   }
   for (auto &workerFuture : workerFutures)
   {
      workerFuture.get();
   }
}

}
