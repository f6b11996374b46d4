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
#include <thread>

#include <rt/Format.h>
#include <rt/Logger.h>
#include <rt/Throughput.h>

#include <hw/BoardException.h>

#include <acq/AcquisitionLoop.h>
#include <acq/BufferPool.h>
#include <acq/ClockConfigurator.h>
#include <acq/Deinterleave.h>
#include <acq/InputConfigurator.h>
#include <acq/TriggerConfigurator.h>

namespace acq {

struct AcquisitionLoop::Impl : AcquisitionLoop
{
   rt::Logger *log = rt::Logger::getLogger("acq.AcquisitionLoop");

   std::shared_ptr<hw::Board> board;
   std::shared_ptr<const AcquisitionConfig> config;
   std::shared_ptr<ControlState> control;
   std::shared_ptr<ChannelQueue> queueA;
   std::shared_ptr<ChannelQueue> queueB;

   // DMA buffer ring
   BufferPool pool;

   // current loop state
   std::atomic<int> current {Idle};

   // transfer counters
   unsigned long completed = 0;
   unsigned long long bytesTransferred = 0;

   // consecutive wait timeouts on current buffer
   unsigned int retries = 0;

   // terminal error, if any
   std::exception_ptr failure;

   // capture start time
   bool captureStarted = false;
   std::chrono::steady_clock::time_point captureStart;

   // throughput meter
   rt::Throughput taskThroughput;

   // last status sent
   std::chrono::steady_clock::time_point lastStatus;

   Impl(std::shared_ptr<hw::Board> board,
        std::shared_ptr<const AcquisitionConfig> config,
        std::shared_ptr<ControlState> control,
        std::shared_ptr<ChannelQueue> queueA,
        std::shared_ptr<ChannelQueue> queueB) :
      board(board),
      config(std::move(config)),
      control(std::move(control)),
      queueA(std::move(queueA)),
      queueB(std::move(queueB)),
      pool(board)
   {
   }

   State state() const override
   {
      return static_cast<State>(current.load());
   }

   void start() override
   {
      try
      {
         log->info("attempt to capture {} buffers", {config->buffersPerAcquisition});

         ClockConfigurator(board).configure(*config);

         InputConfigurator(board).configure(*config);

         TriggerConfigurator(board).configure(*config);

         pool.allocate(*config);

         current = Armed;

         // let the board settle before capture
         if (config->armDelayMs > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(config->armDelayMs));

         captureStart = std::chrono::steady_clock::now();

         board->startCapture();

         captureStarted = true;

         current = Running;

         taskThroughput.begin();

         lastStatus = std::chrono::steady_clock::now();
      }
      catch (std::exception &e)
      {
         log->error("acquisition setup failed: {}", {std::string(e.what())});

         failure = std::current_exception();

         current = Draining;
      }
   }

   bool loop() override
   {
      if (current != Running)
         return false;

      if (!(completed < config->buffersPerAcquisition && control->isMeasuring()))
         return false;

      try
      {
         const hw::DmaBuffer &buffer = pool.wait(completed, config->waitTimeoutMs);

         auto channels = Deinterleave::split(buffer.data(), pool.geometry(), completed);

         queueA->add(channels.first);
         queueB->add(channels.second);

         std::size_t size = buffer.size();

         // give buffer back to the board for reuse
         pool.repost(completed);

         completed++;
         bytesTransferred += size;
         retries = 0;

         control->setCompletedBuffers(completed);

         taskThroughput.update();
      }
      catch (hw::BoardTimeout &e)
      {
         if (config->timeoutPolicy == AcquisitionConfig::RetryOnTimeout && retries < config->maxWaitRetries)
         {
            retries++;

            log->warn("buffer {} not completed, retry {} of {}: {}", {completed, retries, config->maxWaitRetries, std::string(e.what())});

            return true;
         }

         log->error("buffer {} not completed: {}", {completed, std::string(e.what())});

         failure = std::current_exception();

         return false;
      }
      catch (std::exception &e)
      {
         log->error("acquisition failed at buffer {}: {}", {completed, std::string(e.what())});

         failure = std::current_exception();

         return false;
      }

      // trace task throughput
      if ((std::chrono::steady_clock::now() - lastStatus) > std::chrono::milliseconds(1000))
      {
         if (taskThroughput.average() > 0)
            log->info("average throughput {.2} buffers per sec, {} of {} completed", {taskThroughput.average(), completed, config->buffersPerAcquisition});

         // store last status time
         lastStatus = std::chrono::steady_clock::now();
      }

      return true;
   }

   void stop() override
   {
      current = Draining;

      // abort outstanding transfers and free DMA buffers
      pool.release();

      double transferTime = 0;

      if (captureStarted)
         transferTime = std::chrono::duration<double>(std::chrono::steady_clock::now() - captureStart).count();

      std::string message = summary(transferTime);

      log->info("acquisition finished after {} buffers in {.3} sec", {completed, transferTime});

      control->markAcquisitionSafe(completed, message, failure);

      // no more buffers for consumers
      queueA->close();
      queueB->close();

      current = Closed;
   }

   std::string summary(double transferTime) const
   {
      unsigned long long records = static_cast<unsigned long long>(config->recordsPerBuffer) * completed;
      unsigned long long samplesTransferred = records * config->samplesPerRecord * 2;

      double buffersPerSec = 0;
      double bytesPerSec = 0;
      double recordsPerSec = 0;
      double samplesPerSec = 0;

      if (transferTime > 0)
      {
         buffersPerSec = completed / transferTime;
         bytesPerSec = bytesTransferred / transferTime;
         recordsPerSec = records / transferTime;
         samplesPerSec = samplesTransferred / transferTime;
      }

      std::string message;

      message += rt::Format::format("Attempt to capture {} buffers\n", {config->buffersPerAcquisition});
      message += rt::Format::format("Capture completed in {} sec\n", {transferTime});
      message += rt::Format::format("Captured {} buffers ({} buffers per sec)\n", {completed, buffersPerSec});
      message += rt::Format::format("Captured {} records ({} records per sec)\n", {records, recordsPerSec});
      message += rt::Format::format("Transferred {} bytes ({} Mbytes per sec)\n", {bytesTransferred, bytesPerSec / (1024.0 * 1024.0)});
      message += rt::Format::format("Transferred {} samples ({} MS per sec)\n", {samplesTransferred, samplesPerSec / 1e6});

      return message;
   }
};

AcquisitionLoop::AcquisitionLoop() : Worker("AcquisitionLoop")
{
}

std::shared_ptr<AcquisitionLoop> AcquisitionLoop::construct(std::shared_ptr<hw::Board> board,
                                                            std::shared_ptr<const AcquisitionConfig> config,
                                                            std::shared_ptr<ControlState> control,
                                                            std::shared_ptr<ChannelQueue> queueA,
                                                            std::shared_ptr<ChannelQueue> queueB)
{
   return std::make_shared<Impl>(std::move(board), std::move(config), std::move(control), std::move(queueA), std::move(queueB));
}

}
