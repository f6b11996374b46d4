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

#ifndef ACQ_ACQUISITIONLOOP_H
#define ACQ_ACQUISITIONLOOP_H

#include <memory>

#include <rt/Worker.h>

#include <hw/Board.h>

#include <acq/AcquisitionConfig.h>
#include <acq/ChannelQueue.h>
#include <acq/ControlState.h>

namespace acq {

/*
 * Producer side of the acquisition: programs the board, streams every DMA buffer into the
 * channel queues and publishes transfer statistics when finished
 */
class AcquisitionLoop : public rt::Worker
{
      struct Impl;

   public:

      enum State
      {
         Idle = 0,
         Armed = 1,
         Running = 2,
         Draining = 3,
         Closed = 4
      };

   protected:

      AcquisitionLoop();

   public:

      virtual State state() const = 0;

      static std::shared_ptr<AcquisitionLoop> construct(std::shared_ptr<hw::Board> board,
                                                        std::shared_ptr<const AcquisitionConfig> config,
                                                        std::shared_ptr<ControlState> control,
                                                        std::shared_ptr<ChannelQueue> queueA,
                                                        std::shared_ptr<ChannelQueue> queueB);
};

}

#endif
