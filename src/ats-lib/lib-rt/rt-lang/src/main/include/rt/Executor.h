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

#ifndef RT_EXECUTOR_H
#define RT_EXECUTOR_H

#include <memory>

#include <rt/Task.h>

namespace rt {

/*
 * Fixed set of threads running submitted tasks in submission order
 */
class Executor
{
      struct Impl;

   public:

      // poolSize limits queued plus running tasks
      explicit Executor(int poolSize = 100, int threads = 4);

      ~Executor();

      // returns false when the pool is full or shutting down
      bool submit(std::shared_ptr<Task> task);

      // terminate running tasks, discard queued ones and join all threads
      void shutdown();

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
