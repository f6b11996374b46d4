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

#ifndef ACQ_CHANNELCONSUMER_H
#define ACQ_CHANNELCONSUMER_H

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <rt/Logger.h>
#include <rt/Worker.h>

#include <hw/SampleBuffer.h>

#include <acq/AcquisitionConfig.h>
#include <acq/ChannelQueue.h>
#include <acq/ControlState.h>

namespace acq {

/*
 * Base worker for the treatment of one channel, drains its queue until the acquisition loop
 * closes it and then signals treatment completion
 */
class ChannelConsumer : public rt::Worker
{
   public:

      struct Context
      {
         // channel index, 0 for A and 1 for B
         unsigned int channel;
         std::shared_ptr<ChannelQueue> queue;
         std::shared_ptr<const AcquisitionConfig> config;
         std::shared_ptr<ControlState> control;
         // treated results returned to the caller, optional
         std::shared_ptr<TreatmentQueue> results;
      };

   public:

      ChannelConsumer(const std::string &name, Context context);

      unsigned int channel() const;

      unsigned long processedBuffers() const;

   protected:

      bool loop() override;

      void stop() override;

      // called for every buffer received, in sequence order
      virtual void process(const hw::SampleBuffer &buffer) = 0;

      // called once after the last buffer
      virtual void finish();

      const AcquisitionConfig &config() const;

      // hand treated result of a buffer back to LifecycleCoordinator::measurement()
      void publish(unsigned long sequence, std::vector<double> values);

   protected:

      rt::Logger *log;

   private:

      Context context;

      std::atomic<unsigned long> processed {0};
};

}

#endif
