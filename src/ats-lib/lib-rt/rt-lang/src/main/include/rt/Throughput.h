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

#ifndef RT_THROUGHPUT_H
#define RT_THROUGHPUT_H

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

namespace rt {

/*
 * Event rate over the last updates, in events per second
 */
class Throughput
{
      using Clock = std::chrono::steady_clock;

      struct Sample
      {
         Clock::time_point time;
         double count;
      };

   public:

      explicit Throughput(std::size_t window = 64) : window(window < 2 ? 2 : window)
      {
      }

      void begin()
      {
         std::lock_guard lock(mutex);

         samples.clear();
      }

      void update(double count = 1)
      {
         std::lock_guard lock(mutex);

         samples.push_back({Clock::now(), count});

         if (samples.size() > window)
            samples.pop_front();
      }

      // zero until two updates are recorded
      double average() const
      {
         std::lock_guard lock(mutex);

         if (samples.size() < 2)
            return 0;

         double elapsed = std::chrono::duration<double>(samples.back().time - samples.front().time).count();

         if (elapsed <= 0)
            return 0;

         double total = 0;

         // first sample only marks the window start
         for (auto it = samples.begin() + 1; it != samples.end(); ++it)
            total += it->count;

         return total / elapsed;
      }

   private:

      std::size_t window;

      std::deque<Sample> samples;

      mutable std::mutex mutex;
};

}

#endif
