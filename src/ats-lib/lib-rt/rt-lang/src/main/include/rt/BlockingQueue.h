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

#ifndef RT_BLOCKINGQUEUE_H
#define RT_BLOCKINGQUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace rt {

/*
 * Unbounded FIFO shared between threads. After close() add() is refused, but elements
 * already queued are still delivered until the queue is drained.
 */
template <typename T>
class BlockingQueue
{
   public:

      BlockingQueue() = default;

      BlockingQueue(const BlockingQueue &) = delete;

      BlockingQueue &operator=(const BlockingQueue &) = delete;

      bool add(T value)
      {
         {
            std::lock_guard lock(mutex);

            if (closed)
               return false;

            elements.push_back(std::move(value));
         }

         available.notify_one();

         return true;
      }

      // next element, waiting up to milliseconds (0 no wait, negative forever),
      // empty when timed out or closed and drained
      std::optional<T> get(int milliseconds = 0)
      {
         std::unique_lock lock(mutex);

         auto ready = [this] { return closed || !elements.empty(); };

         if (milliseconds < 0)
            available.wait(lock, ready);
         else if (milliseconds > 0)
            available.wait_for(lock, std::chrono::milliseconds(milliseconds), ready);

         if (elements.empty())
            return {};

         std::optional<T> value(std::move(elements.front()));

         elements.pop_front();

         return value;
      }

      void close()
      {
         {
            std::lock_guard lock(mutex);

            closed = true;
         }

         available.notify_all();
      }

      bool isClosed() const
      {
         std::lock_guard lock(mutex);

         return closed;
      }

      bool isDrained() const
      {
         std::lock_guard lock(mutex);

         return closed && elements.empty();
      }

      int size() const
      {
         std::lock_guard lock(mutex);

         return static_cast<int>(elements.size());
      }

   private:

      std::deque<T> elements;

      bool closed = false;

      mutable std::mutex mutex;

      std::condition_variable available;
};

}

#endif
