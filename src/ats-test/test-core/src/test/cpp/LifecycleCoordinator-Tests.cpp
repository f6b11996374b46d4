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

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include <hw/BoardException.h>
#include <hw/SimulatedBoard.h>

#include <acq/ChannelConsumer.h>
#include <acq/ConfigurationError.h>
#include <acq/LifecycleCoordinator.h>

namespace acq {

namespace {

// keeps sequence number and first sample of every buffer received, optionally published as result
class RecordingConsumer : public ChannelConsumer
{
   public:

      RecordingConsumer(const Context &context, bool publishing) : ChannelConsumer("RecordingConsumer" + std::to_string(context.channel), context), publishing(publishing)
      {
      }

      bool publishing;

      std::vector<unsigned long> sequences;
      std::vector<unsigned short> firstSamples;
      bool finished = false;

   protected:

      void process(const hw::SampleBuffer &buffer) override
      {
         sequences.push_back(buffer.sequence());
         firstSamples.push_back(buffer.as<unsigned short>()[0]);

         if (publishing)
            publish(buffer.sequence(), {static_cast<double>(buffer.as<unsigned short>()[0] >> 4)});
      }

      void finish() override
      {
         finished = true;
      }
};

struct Fixture
{
   std::shared_ptr<hw::SimulatedBoard> board = std::make_shared<hw::SimulatedBoard>(12);

   std::vector<std::shared_ptr<RecordingConsumer>> consumers;

   AcquisitionConfig config;

   bool publishing = false;

   Fixture()
   {
      config.samplesPerRecord = 256;
      config.recordsPerBuffer = 10;
      config.buffersPerAcquisition = 10;
      config.bufferPoolSize = 4;
      config.waitTimeoutMs = 1000;
      config.armDelayMs = 0;
   }

   LifecycleCoordinator::ConsumerFactory factory()
   {
      return [this](const ChannelConsumer::Context &context) {
         auto consumer = std::make_shared<RecordingConsumer>(context, publishing);
         consumers.push_back(consumer);
         return consumer;
      };
   }
};

}

TEST_CASE_METHOD(Fixture, "Full acquisition delivers every buffer to both channels", "[lifecycle]")
{
   LifecycleCoordinator coordinator(board, factory());

   coordinator.configure(config);
   coordinator.start();

   CHECK(coordinator.isRunning());
   CHECK_THROWS_AS(coordinator.start(), std::logic_error);
   CHECK_THROWS_AS(coordinator.configure(config), std::logic_error);

   auto message = coordinator.waitClosed(true);

   REQUIRE(message.has_value());
   CHECK(message->find("Attempt to capture 10 buffers") != std::string::npos);
   CHECK(message->find("Captured 10 buffers") != std::string::npos);
   CHECK(message->find("Captured 100 records") != std::string::npos);
   CHECK(message->find("Transferred 102400 bytes") != std::string::npos);
   CHECK(message->find("Transferred 51200 samples") != std::string::npos);

   CHECK_FALSE(coordinator.isRunning());
   CHECK(coordinator.pollProgress() == 0);

   // nothing published
   CHECK_FALSE(coordinator.measurement(0).has_value());

   auto control = coordinator.controlState();

   CHECK(control->isClosed());
   CHECK(control->measuredBuffers() == 10);
   CHECK(control->completedBuffers() == 10);

   REQUIRE(consumers.size() == 2);

   std::vector<unsigned long> expected {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};

   for (const auto &consumer: consumers)
   {
      CHECK(consumer->finished);
      CHECK(consumer->processedBuffers() == 10);
      CHECK(consumer->sequences == expected);
   }

   CHECK(consumers[0]->channel() == 0);
   CHECK(consumers[1]->channel() == 1);
   CHECK(consumers[0]->firstSamples.front() == 2048 << 4);
   CHECK(consumers[1]->firstSamples.front() == 3071 << 4);

   CHECK_FALSE(board->isCapturing());
   CHECK(board->completedBuffers() == 10);
}

TEST_CASE_METHOD(Fixture, "Measurement pairs treated results of both channels", "[lifecycle]")
{
   publishing = true;

   LifecycleCoordinator coordinator(board, factory());

   CHECK_THROWS_AS(coordinator.measurement(0), std::logic_error);

   coordinator.configure(config);
   coordinator.start();

   for (unsigned long sequence = 0; sequence < 10; sequence++)
   {
      auto next = coordinator.measurement(1000);

      REQUIRE(next.has_value());
      CHECK(next->channelA.channel == 0);
      CHECK(next->channelB.channel == 1);
      CHECK(next->channelA.sequence == sequence);
      CHECK(next->channelB.sequence == sequence);
      REQUIRE(next->channelA.values.size() == 1);
      REQUIRE(next->channelB.values.size() == 1);

      if (sequence == 0)
      {
         CHECK(next->channelA.values[0] == 2048);
         CHECK(next->channelB.values[0] == 3071);
      }
   }

   coordinator.waitClosed();

   // result queues are closed once treatment finished
   CHECK_FALSE(coordinator.measurement(-1).has_value());
}

TEST_CASE_METHOD(Fixture, "Progress is the exact completed fraction", "[lifecycle]")
{
   board->setTriggerPeriod(std::chrono::microseconds(1000));

   config.buffersPerAcquisition = 3000;

   LifecycleCoordinator coordinator(board, factory());

   coordinator.configure(config);
   coordinator.start();

   std::this_thread::sleep_for(std::chrono::milliseconds(20));

   auto control = coordinator.controlState();

   // progress is read after completed count, both only grow
   unsigned long before = control->completedBuffers();
   double progress = coordinator.pollProgress();
   unsigned long after = control->completedBuffers();

   CHECK(progress >= 100.0 * before / 3000);
   CHECK(progress <= 100.0 * after / 3000);

   coordinator.close(false);
}

TEST_CASE_METHOD(Fixture, "Device is configured before capture start", "[lifecycle]")
{
   LifecycleCoordinator coordinator(board, factory());

   coordinator.configure(config);
   coordinator.start();
   coordinator.waitClosed();

   std::vector<std::string> journal = board->journal();

   auto position = [&journal](const std::string &operation) {
      for (std::size_t i = 0; i < journal.size(); i++)
      {
         if (journal[i] == operation)
            return static_cast<long>(i);
      }
      return -1L;
   };

   long start = position("startCapture");

   REQUIRE(start >= 0);

   CHECK(position("setCaptureClock") < position("setInputRange"));
   CHECK(position("setInputRange") < position("setTriggerOperation"));
   CHECK(position("setTriggerOperation") < position("armContinuousCapture"));
   CHECK(position("armContinuousCapture") < position("postBuffer"));
   CHECK(position("postBuffer") < start);
   CHECK(position("abortCapture") > start);
}

TEST_CASE_METHOD(Fixture, "Stop request ends acquisition early", "[lifecycle]")
{
   LifecycleCoordinator coordinator(board, factory());

   board->setCompletionHandler([&coordinator](unsigned long completed) {
      if (completed == 3)
         coordinator.requestStop();
   });

   coordinator.configure(config);
   coordinator.start();

   auto message = coordinator.waitClosed(true);

   auto control = coordinator.controlState();

   CHECK(control->measuredBuffers() >= 3);
   CHECK(control->measuredBuffers() <= 4);
   CHECK(control->isClosed());

   REQUIRE(message.has_value());
   CHECK(message->find("Attempt to capture 10 buffers") != std::string::npos);

   for (const auto &consumer: consumers)
      CHECK(consumer->processedBuffers() == control->measuredBuffers());
}

TEST_CASE_METHOD(Fixture, "Close stops a running acquisition", "[lifecycle]")
{
   board->setTriggerPeriod(std::chrono::microseconds(1000));

   config.buffersPerAcquisition = 1000;

   LifecycleCoordinator coordinator(board, factory());

   coordinator.configure(config);
   coordinator.start();

   std::this_thread::sleep_for(std::chrono::milliseconds(50));

   double progress = coordinator.pollProgress();

   CHECK(progress >= 0);
   CHECK(progress < 100);

   CHECK_FALSE(coordinator.close(false).has_value());

   CHECK(coordinator.controlState()->measuredBuffers() < 1000);
   CHECK(coordinator.controlState()->isClosed());
}

TEST_CASE_METHOD(Fixture, "Wait timeout aborts acquisition by default", "[lifecycle]")
{
   board->setTriggerEnabled(false);

   config.waitTimeoutMs = 20;

   LifecycleCoordinator coordinator(board, factory());

   coordinator.configure(config);
   coordinator.start();

   CHECK_THROWS_AS(coordinator.waitClosed(), hw::BoardTimeout);

   auto control = coordinator.controlState();

   CHECK(control->isClosed());
   CHECK(control->measuredBuffers() == 0);
   CHECK_FALSE(coordinator.isRunning());

   for (const auto &consumer: consumers)
   {
      CHECK(consumer->finished);
      CHECK(consumer->processedBuffers() == 0);
   }
}

TEST_CASE_METHOD(Fixture, "Wait timeouts are retried with retry policy", "[lifecycle]")
{
   board->setTimeoutCount(2);

   config.waitTimeoutMs = 10;
   config.timeoutPolicy = AcquisitionConfig::RetryOnTimeout;
   config.maxWaitRetries = 3;

   LifecycleCoordinator coordinator(board, factory());

   coordinator.configure(config);
   coordinator.start();

   CHECK_NOTHROW(coordinator.waitClosed());
   CHECK(coordinator.controlState()->measuredBuffers() == 10);
}

TEST_CASE_METHOD(Fixture, "Retries are limited", "[lifecycle]")
{
   board->setTimeoutCount(3);

   config.waitTimeoutMs = 10;
   config.timeoutPolicy = AcquisitionConfig::RetryOnTimeout;
   config.maxWaitRetries = 2;

   LifecycleCoordinator coordinator(board, factory());

   coordinator.configure(config);
   coordinator.start();

   CHECK_THROWS_AS(coordinator.waitClosed(), hw::BoardTimeout);
   CHECK(coordinator.controlState()->measuredBuffers() == 0);
}

TEST_CASE_METHOD(Fixture, "Arm failure still releases every party", "[lifecycle]")
{
   board->injectFailure("armContinuousCapture");

   LifecycleCoordinator coordinator(board, factory());

   coordinator.configure(config);
   coordinator.start();

   try
   {
      coordinator.waitClosed();
      FAIL("arm failure not reported");
   }
   catch (hw::BoardException &e)
   {
      CHECK(e.operation() == "armContinuousCapture");
   }

   auto control = coordinator.controlState();

   CHECK(control->isAcquisitionSafe());
   CHECK(control->isTreatmentSafe(0));
   CHECK(control->isTreatmentSafe(1));
   CHECK(control->measuredBuffers() == 0);

   // capture was never started
   std::vector<std::string> journal = board->journal();

   CHECK(std::find(journal.begin(), journal.end(), "startCapture") == journal.end());
   CHECK(std::find(journal.begin(), journal.end(), "postBuffer") == journal.end());
}

TEST_CASE_METHOD(Fixture, "Coordinator can run consecutive acquisitions", "[lifecycle]")
{
   LifecycleCoordinator coordinator(board, factory());

   coordinator.configure(config);

   coordinator.start();
   coordinator.waitClosed();

   coordinator.start();
   coordinator.waitClosed();

   REQUIRE(consumers.size() == 4);

   for (const auto &consumer: consumers)
      CHECK(consumer->processedBuffers() == 10);
}

TEST_CASE_METHOD(Fixture, "Invalid usage is rejected", "[lifecycle]")
{
   CHECK_THROWS_AS(LifecycleCoordinator(nullptr, factory()), std::invalid_argument);
   CHECK_THROWS_AS(LifecycleCoordinator(board, nullptr), std::invalid_argument);

   LifecycleCoordinator coordinator(board, factory());

   CHECK_THROWS_AS(coordinator.start(), std::logic_error);
   CHECK_THROWS_AS(coordinator.waitClosed(), std::logic_error);
   CHECK(coordinator.pollProgress() == 0);

   config.samplesPerRecord = 100;

   CHECK_THROWS_AS(coordinator.configure(config), ConfigurationError);
}

}
