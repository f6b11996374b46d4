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

#ifndef RT_WORKER_H
#define RT_WORKER_H

#include <memory>
#include <string>

#include <rt/Task.h>

namespace rt {

/*
 * Task running start(), then loop() until it returns false or terminate() is called, and finally
 * stop(). stop() is always reached, also when start() or loop() throw.
 */
class Worker : public Task
{
      struct Impl;

   public:

      explicit Worker(const std::string &name);

      std::string name() override;

      // request termination and wait until stop() has finished
      void terminate() override;

      void run() override;

      bool isTerminated() const;

   protected:

      virtual void start();

      virtual bool loop();

      virtual void stop();

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
