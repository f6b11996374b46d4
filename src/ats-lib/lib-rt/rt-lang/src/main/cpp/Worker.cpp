/*

  This file is part of ATS-STREAMER.

  Copyright (C) 2024 Jose Vicente Campos Martinez, <josevcm@gmail.com>

  ATS-STREAMER is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  ATS-STREAMER is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with ATS-STREAMER. If not, see <http://www.gnu.org/licenses/>.

*/

#include <atomic>
#include <chrono>
#include <mutex>
#include <utility>

#include <rt/Logger.h>
#include <rt/Worker.h>

namespace rt {

struct Worker::Impl
{
   Logger *log = Logger::getLogger("rt.Worker");

   std::string name;

   // held while run() is active
   std::mutex runMutex;

   // termination requested or run finished
   std::atomic<bool> terminated {false};

   explicit Impl(std::string name) : name(std::move(name))
   {
   }
};

Worker::Worker(const std::string &name) : impl(std::make_shared<Impl>(name))
{
}

std::string Worker::name()
{
   return impl->name;
}

bool Worker::isTerminated() const
{
   return impl->terminated;
}

void Worker::terminate()
{
   if (!impl->terminated.exchange(true))
   {
      // blocks until current run() returns
      std::lock_guard lock(impl->runMutex);
   }
}

void Worker::run()
{
   std::lock_guard lock(impl->runMutex);

   auto begin = std::chrono::steady_clock::now();

   impl->log->info("worker {} started", {impl->name});

   try
   {
      start();

      while (!impl->terminated && loop())
      {
      }
   }
   catch (std::exception &e)
   {
      impl->log->error("worker {} failed: {}", {impl->name, std::string(e.what())});
   }

   stop();

   impl->terminated = true;

   std::chrono::nanoseconds elapsed = std::chrono::steady_clock::now() - begin;

   impl->log->info("worker {} finished, running time {}", {impl->name, std::chrono::duration<long long, std::nano>(elapsed.count())});
}

void Worker::start()
{
}

bool Worker::loop()
{
   return false;
}

void Worker::stop()
{
}

}
