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
#include <list>
#include <mutex>
#include <thread>
#include <vector>

#include <rt/BlockingQueue.h>
#include <rt/Executor.h>
#include <rt/Logger.h>

namespace rt {

struct Executor::Impl
{
   Logger *log = Logger::getLogger("rt.Executor");

   const int poolSize;

   // tasks not yet taken by a thread
   BlockingQueue<std::shared_ptr<Task>> pending;

   // tasks currently inside run()
   std::list<std::shared_ptr<Task>> running;

   std::mutex runningMutex;

   std::vector<std::thread> threads;

   std::atomic<bool> shutdown {false};

   Impl(int poolSize, int threadCount) : poolSize(poolSize)
   {
      log->debug("starting executor with {} threads", {threadCount});

      for (int i = 0; i < threadCount; i++)
         threads.emplace_back([this] { exec(); });
   }

   void exec()
   {
      std::thread::id id = std::this_thread::get_id();

      // queue is closed on shutdown, get returns empty once drained
      while (auto next = pending.get(-1))
      {
         std::shared_ptr<Task> task = next.value();

         {
            std::lock_guard lock(runningMutex);

            if (shutdown)
               break;

            running.push_back(task);
         }

         log->debug("task {} running in thread {}", {task->name(), id});

         try
         {
            task->run();
         }
         catch (std::exception &e)
         {
            log->error("task {} ended with exception: {}", {task->name(), std::string(e.what())});
         }

         std::lock_guard lock(runningMutex);

         running.remove(task);
      }

      log->debug("executor thread {} finished", {id});
   }

   bool submit(const std::shared_ptr<Task> &task)
   {
      if (shutdown)
      {
         log->warn("task {} rejected, executor is shutting down", {task->name()});
         return false;
      }

      std::size_t active;

      {
         std::lock_guard lock(runningMutex);

         active = running.size();
      }

      if (static_cast<int>(active) + pending.size() >= poolSize)
      {
         log->warn("task {} rejected, pool of {} tasks exhausted", {task->name(), poolSize});
         return false;
      }

      return pending.add(task);
   }

   void terminate()
   {
      if (shutdown.exchange(true))
         return;

      // no more tasks are taken from the queue
      pending.close();

      std::list<std::shared_ptr<Task>> tasks;

      {
         std::lock_guard lock(runningMutex);

         tasks = running;
      }

      for (const auto &task: tasks)
      {
         log->debug("terminating task {}", {task->name()});

         task->terminate();
      }

      for (auto &thread: threads)
      {
         if (thread.joinable())
            thread.join();
      }

      log->debug("executor shutdown completed");
   }
};

Executor::Executor(int poolSize, int threads) : impl(std::make_shared<Impl>(poolSize, threads))
{
}

Executor::~Executor()
{
   impl->terminate();
}

bool Executor::submit(std::shared_ptr<Task> task)
{
   return impl->submit(task);
}

void Executor::shutdown()
{
   impl->terminate();
}

}
