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
#include <stdexcept>
#include <thread>
#include <utility>

#include <rt/Executor.h>
#include <rt/Logger.h>

#include <acq/AcquisitionLoop.h>
#include <acq/ConfigValidator.h>
#include <acq/LifecycleCoordinator.h>

// one producer and two consumers
#define WORKER_THREADS 3

// join poll interval
#define CLOSE_POLL_INTERVAL 1

namespace acq {

struct LifecycleCoordinator::Impl
{
   rt::Logger *log = rt::Logger::getLogger("acq.LifecycleCoordinator");

   std::shared_ptr<hw::Board> board;

   ConsumerFactory factory;

   std::shared_ptr<const AcquisitionConfig> config;

   std::shared_ptr<ControlState> control;

   std::shared_ptr<ChannelQueue> queues[2];

   std::shared_ptr<TreatmentQueue> results[2];

   // result already taken while waiting for the other channel
   std::optional<Treatment> pending[2];

   std::shared_ptr<rt::Executor> executor;

   bool running = false;

   Impl(std::shared_ptr<hw::Board> board, ConsumerFactory factory) : board(std::move(board)), factory(std::move(factory))
   {
      if (!this->board)
         throw std::invalid_argument("board is required");

      if (!this->factory)
         throw std::invalid_argument("consumer factory is required");
   }

   void configure(const AcquisitionConfig &value)
   {
      if (running)
         throw std::logic_error("acquisition in progress");

      ConfigValidator::validate(value);

      config = std::make_shared<const AcquisitionConfig>(value);
   }

   void start()
   {
      if (running)
         throw std::logic_error("acquisition in progress");

      if (!config)
         throw std::logic_error("acquisition not configured");

      control = std::make_shared<ControlState>(config->buffersPerAcquisition);

      queues[0] = std::make_shared<ChannelQueue>();
      queues[1] = std::make_shared<ChannelQueue>();

      results[0] = std::make_shared<TreatmentQueue>();
      results[1] = std::make_shared<TreatmentQueue>();

      pending[0].reset();
      pending[1].reset();

      // consumers are created before any thread is started
      std::shared_ptr<ChannelConsumer> consumers[2];

      for (unsigned int channel = 0; channel < 2; channel++)
      {
         if (!(consumers[channel] = factory({channel, queues[channel], config, control, results[channel]})))
            throw std::invalid_argument("consumer factory returned no consumer for channel " + std::to_string(channel));
      }

      auto producer = AcquisitionLoop::construct(board, config, control, queues[0], queues[1]);

      log->info("starting acquisition of {} buffers on board {}", {config->buffersPerAcquisition, board->name()});

      executor = std::make_shared<rt::Executor>(WORKER_THREADS, WORKER_THREADS);

      if (!executor->submit(consumers[0]) || !executor->submit(consumers[1]) || !executor->submit(producer))
      {
         executor.reset();

         throw std::runtime_error("unable to schedule acquisition workers");
      }

      running = true;
   }

   double pollProgress() const
   {
      if (!running || !control || control->targetBuffers() == 0)
         return 0;

      return 100.0 * control->completedBuffers() / control->targetBuffers();
   }

   std::optional<Measurement> measurement(int timeoutMs)
   {
      if (!results[0])
         throw std::logic_error("acquisition not started");

      for (int channel = 0; channel < 2; channel++)
      {
         if (!pending[channel])
            pending[channel] = results[channel]->get(timeoutMs);

         if (!pending[channel])
            return {};
      }

      Measurement next {std::move(pending[0].value()), std::move(pending[1].value())};

      pending[0].reset();
      pending[1].reset();

      return next;
   }

   void requestStop()
   {
      if (control)
         control->requestStop();
   }

   std::optional<std::string> waitClosed(bool transferInfo)
   {
      if (!running)
         throw std::logic_error("acquisition not started");

      // no lock shared with workers, wait for the three safe flags
      while (!control->isClosed())
      {
         std::this_thread::sleep_for(std::chrono::milliseconds(CLOSE_POLL_INTERVAL));
      }

      queues[0]->close();
      queues[1]->close();

      executor->shutdown();
      executor.reset();

      running = false;

      log->info("acquisition closed after {} buffers", {control->measuredBuffers()});

      if (control->failure())
         std::rethrow_exception(control->failure());

      if (transferInfo)
         return control->message();

      return {};
   }
};

LifecycleCoordinator::LifecycleCoordinator(std::shared_ptr<hw::Board> board, ConsumerFactory factory) : impl(std::make_shared<Impl>(std::move(board), std::move(factory)))
{
}

LifecycleCoordinator::~LifecycleCoordinator()
{
   if (impl->running)
   {
      try
      {
         close(false);
      }
      catch (std::exception &e)
      {
         impl->log->warn("acquisition closed with error: {}", {std::string(e.what())});
      }
   }
}

void LifecycleCoordinator::configure(const AcquisitionConfig &config)
{
   impl->configure(config);
}

void LifecycleCoordinator::start()
{
   impl->start();
}

double LifecycleCoordinator::pollProgress() const
{
   return impl->pollProgress();
}

void LifecycleCoordinator::requestStop()
{
   impl->requestStop();
}

std::optional<LifecycleCoordinator::Measurement> LifecycleCoordinator::measurement(int timeoutMs)
{
   return impl->measurement(timeoutMs);
}

std::optional<std::string> LifecycleCoordinator::waitClosed(bool transferInfo)
{
   return impl->waitClosed(transferInfo);
}

std::optional<std::string> LifecycleCoordinator::close(bool transferInfo)
{
   impl->requestStop();

   return impl->waitClosed(transferInfo);
}

bool LifecycleCoordinator::isRunning() const
{
   return impl->running;
}

std::shared_ptr<const ControlState> LifecycleCoordinator::controlState() const
{
   return impl->control;
}

}
