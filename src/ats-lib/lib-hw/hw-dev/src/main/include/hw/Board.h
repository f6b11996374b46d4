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

#ifndef HW_BOARD_H
#define HW_BOARD_H

#include <cstddef>
#include <string>

namespace hw {

/*
 * Capability interface of a dual channel streaming digitizer, enumeration values
 * follow the ATS-SDK numeric codes so implementations can pass them through.
 */
class Board
{
   public:

      enum ClockSource
      {
         InternalClock = 1,
         ExternalClock10MHzRef = 7
      };

      enum ClockEdge
      {
         ClockEdgeRising = 0,
         ClockEdgeFalling = 1
      };

      enum SampleRate
      {
         SampleRate1KSPS = 0x1,
         SampleRate2KSPS = 0x2,
         SampleRate5KSPS = 0x4,
         SampleRate10KSPS = 0x8,
         SampleRate20KSPS = 0xA,
         SampleRate50KSPS = 0xC,
         SampleRate100KSPS = 0xE,
         SampleRate200KSPS = 0x10,
         SampleRate500KSPS = 0x12,
         SampleRate1MSPS = 0x14,
         SampleRate2MSPS = 0x18,
         SampleRate5MSPS = 0x1A,
         SampleRate10MSPS = 0x1C,
         SampleRate20MSPS = 0x1E,
         SampleRate50MSPS = 0x22,
         SampleRate100MSPS = 0x24,
         SampleRate200MSPS = 0x28,
         SampleRate500MSPS = 0x30,
         SampleRate800MSPS = 0x32,
         SampleRate1000MSPS = 0x35,
         SampleRate1200MSPS = 0x37,
         SampleRate1500MSPS = 0x3A,
         SampleRate1800MSPS = 0x3D
      };

      enum Channel
      {
         ChannelA = 1,
         ChannelB = 2
      };

      enum Coupling
      {
         AcCoupling = 1,
         DcCoupling = 2
      };

      enum InputRange
      {
         InputRange400mV = 0x5
      };

      enum Impedance
      {
         Impedance50Ohm = 2
      };

      enum TriggerEngine
      {
         TriggerEngineJ = 0,
         TriggerEngineK = 1
      };

      enum TriggerSource
      {
         TriggerExternal = 2,
         TriggerDisabled = 3
      };

      enum TriggerSlope
      {
         TriggerSlopePositive = 1,
         TriggerSlopeNegative = 2
      };

      enum TriggerRange
      {
         TriggerRange5V = 0,
         TriggerRange1V = 1,
         TriggerRange2V5 = 3
      };

      enum AuxMode
      {
         AuxOutTrigger = 0
      };

      enum CaptureFlags
      {
         ExternalStartCapture = 0x001,
         NoPreTrigger = 0x200,
         FifoOnlyStreaming = 0x800
      };

      struct ChannelInfo
      {
         unsigned long memorySizeSamples;
         unsigned int bitsPerSample;
      };

   public:

      virtual ~Board() = default;

      virtual std::string name() const = 0;

      // rate is a SampleRate code for internal clock or frequency in Hz for external clock
      virtual void setCaptureClock(ClockSource source, unsigned int rate, ClockEdge edge, unsigned int decimation) = 0;

      virtual void setInputRange(Channel channel, Coupling coupling, InputRange range, Impedance impedance) = 0;

      virtual void setTriggerOperation(TriggerEngine engine, TriggerSource source, TriggerSlope slope, unsigned int levelCode, bool secondEngineDisabled) = 0;

      // must be called after setTriggerOperation
      virtual void setExternalTrigger(Coupling coupling, TriggerRange range) = 0;

      virtual void setTriggerDelaySamples(unsigned int delay) = 0;

      // 0 disables the automatic trigger
      virtual void setTriggerTimeout(unsigned int ticks) = 0;

      virtual void configureAuxOutput(AuxMode mode) = 0;

      virtual ChannelInfo getChannelInfo() = 0;

      virtual void setRecordSize(unsigned int preTriggerSamples, unsigned int postTriggerSamples) = 0;

      virtual void armContinuousCapture(unsigned int channelMask, long transferOffset, unsigned int samplesPerRecord, unsigned int recordsPerBuffer, unsigned int recordsPerAcquisition, unsigned int flags) = 0;

      virtual void postBuffer(void *buffer, std::size_t size) = 0;

      virtual void startCapture() = 0;

      // throws BoardTimeout when buffer is not completed within timeout
      virtual void waitBufferComplete(void *buffer, unsigned int timeoutMs) = 0;

      virtual void abortCapture() = 0;
};

}

#endif
