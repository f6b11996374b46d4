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

#ifndef HW_ALAZAR_ALAZARBOARD_H
#define HW_ALAZAR_ALAZARBOARD_H

#include <memory>
#include <string>

#include <hw/Board.h>

namespace hw {

/*
 * Board implementation over the AlazarTech ATS-SDK
 */
class AlazarBoard : public Board
{
      struct Impl;

   public:

      explicit AlazarBoard(unsigned int systemId = 1, unsigned int boardId = 1);

      std::string name() const override;

      void setCaptureClock(ClockSource source, unsigned int rate, ClockEdge edge, unsigned int decimation) override;

      void setInputRange(Channel channel, Coupling coupling, InputRange range, Impedance impedance) override;

      void setTriggerOperation(TriggerEngine engine, TriggerSource source, TriggerSlope slope, unsigned int levelCode, bool secondEngineDisabled) override;

      void setExternalTrigger(Coupling coupling, TriggerRange range) override;

      void setTriggerDelaySamples(unsigned int delay) override;

      void setTriggerTimeout(unsigned int ticks) override;

      void configureAuxOutput(AuxMode mode) override;

      ChannelInfo getChannelInfo() override;

      void setRecordSize(unsigned int preTriggerSamples, unsigned int postTriggerSamples) override;

      void armContinuousCapture(unsigned int channelMask, long transferOffset, unsigned int samplesPerRecord, unsigned int recordsPerBuffer, unsigned int recordsPerAcquisition, unsigned int flags) override;

      void postBuffer(void *buffer, std::size_t size) override;

      void startCapture() override;

      void waitBufferComplete(void *buffer, unsigned int timeoutMs) override;

      void abortCapture() override;

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
