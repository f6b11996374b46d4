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

#ifndef ACQ_LIFECYCLECOORDINATOR_H
#define ACQ_LIFECYCLECOORDINATOR_H

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <hw/Board.h>

#include <acq/AcquisitionConfig.h>
#include <acq/ChannelConsumer.h>
#include <acq/ControlState.h>

namespace acq {

/*
 * Control surface of an acquisition, runs the acquisition loop and one consumer per channel
 * and coordinates their shutdown through the shared control state
 */
class LifecycleCoordinator
{
      struct Impl;

   public:

      typedef std::function<std::shared_ptr<ChannelConsumer>(const ChannelConsumer::Context &context)> ConsumerFactory;

      // treated results of channel A and B for the same buffer
      struct Measurement
      {
         Treatment channelA;
         Treatment channelB;
      };

   public:

      LifecycleCoordinator(std::shared_ptr<hw::Board> board, ConsumerFactory factory);

      ~LifecycleCoordinator();

      // validated copy of config is used for next start
      void configure(const AcquisitionConfig &config);

      void start();

      // 100 * completed / target buffers, 0 when not running
      double pollProgress() const;

      // next pair of treated results published by the consumers, waits up to timeoutMs for
      // each channel (negative forever), empty on timeout or when treatment has finished
      std::optional<Measurement> measurement(int timeoutMs = -1);

      void requestStop();

      // wait until producer and consumers finished, rethrows producer failure
      std::optional<std::string> waitClosed(bool transferInfo = false);

      // requestStop() followed by waitClosed()
      std::optional<std::string> close(bool transferInfo = false);

      bool isRunning() const;

      // state of last started acquisition, null before first start
      std::shared_ptr<const ControlState> controlState() const;

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
