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

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>

#include <catch2/catch.hpp>

#include <rt/BlockingQueue.h>
#include <rt/Format.h>

#include <acq/ControlState.h>

namespace acq {

TEST_CASE("Closed queue is drained before reporting end", "[queue]")
{
   rt::BlockingQueue<int> queue;

   CHECK(queue.add(1));
   CHECK(queue.add(2));

   queue.close();

   CHECK_FALSE(queue.add(3));
   CHECK(queue.isClosed());
   CHECK_FALSE(queue.isDrained());

   CHECK(queue.get(10) == 1);
   CHECK(queue.get(10) == 2);
   CHECK_FALSE(queue.get(10).has_value());
   CHECK(queue.isDrained());
}

TEST_CASE("Queue get times out when empty", "[queue]")
{
   rt::BlockingQueue<int> queue;

   auto start = std::chrono::steady_clock::now();

   CHECK_FALSE(queue.get(20).has_value());
   CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(20));
   CHECK_FALSE(queue.get().has_value());
}

TEST_CASE("Queue close wakes up waiting consumer", "[queue]")
{
   rt::BlockingQueue<int> queue;

   std::thread closer([&queue] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      queue.close();
   });

   CHECK_FALSE(queue.get(-1).has_value());

   closer.join();
}

TEST_CASE("Queue keeps producer order across threads", "[queue]")
{
   rt::BlockingQueue<int> queue;

   std::thread producer([&queue] {
      for (int i = 0; i < 1000; i++)
         queue.add(i);

      queue.close();
   });

   int expected = 0;

   while (auto value = queue.get(1000))
   {
      REQUIRE(value.value() == expected);
      expected++;
   }

   producer.join();

   CHECK(expected == 1000);
}

TEST_CASE("Control state starts measuring", "[control]")
{
   ControlState control(200);

   CHECK(control.isMeasuring());
   CHECK(control.targetBuffers() == 200);
   CHECK(control.completedBuffers() == 0);
   CHECK_FALSE(control.isAcquisitionSafe());
   CHECK_FALSE(control.isTreatmentSafe(0));
   CHECK_FALSE(control.isTreatmentSafe(1));
   CHECK_FALSE(control.isClosed());

   control.requestStop();

   CHECK_FALSE(control.isMeasuring());
}

TEST_CASE("Control state is closed after acquisition and both treatments", "[control]")
{
   ControlState control(10);

   control.setCompletedBuffers(4);
   control.markAcquisitionSafe(4, "done", nullptr);

   CHECK(control.isAcquisitionSafe());
   CHECK(control.measuredBuffers() == 4);
   CHECK(control.message() == "done");
   CHECK_FALSE(control.failure());
   CHECK_FALSE(control.isClosed());

   control.markTreatmentSafe(1);
   CHECK_FALSE(control.isClosed());

   control.markTreatmentSafe(0);
   CHECK(control.isClosed());

   CHECK_THROWS_AS(control.markAcquisitionSafe(5, "again", nullptr), std::logic_error);
   CHECK_THROWS_AS(control.markTreatmentSafe(2), std::out_of_range);
   CHECK(control.measuredBuffers() == 4);
}

TEST_CASE("Control state keeps acquisition failure", "[control]")
{
   ControlState control(10);

   control.markAcquisitionSafe(0, "", std::make_exception_ptr(std::runtime_error("board lost")));

   REQUIRE(control.failure());
   CHECK_THROWS_WITH(std::rethrow_exception(control.failure()), "board lost");
}

TEST_CASE("Format replaces placeholders in order", "[format]")
{
   CHECK(rt::Format::format("{} of {}", {3, std::string("ten")}) == "3 of ten");
   CHECK(rt::Format::format("{.2} MB/s", {12.3456}) == "12.35 MB/s");
   CHECK(rt::Format::format("code {x}", {255}) == "code ff");
   CHECK(rt::Format::format("{} buffers", {10ul}) == "10 buffers");
   CHECK(rt::Format::format("no parameters {}", {}) == "no parameters {}");
}

}
