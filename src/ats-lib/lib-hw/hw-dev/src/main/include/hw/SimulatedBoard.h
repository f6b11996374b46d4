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

#ifndef HW_SIMULATEDBOARD_H
#define HW_SIMULATEDBOARD_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <hw/Board.h>

namespace hw {

/*
 * In-memory digitizer, generates a sine wave on channel A and a cosine wave on channel B
 * interleaved sample by sample. Keeps a journal of every call received.
 */
class SimulatedBoard : public Board
{
      struct Impl;

   public:

      // last values programmed by the client
      struct Settings
      {
         unsigned int clockSource = 0;
         unsigned int sampleRate = 0;
         unsigned int clockEdge = 0;
         unsigned int decimation = 0;
         unsigned int inputsConfigured = 0;
         unsigned int triggerEngine = 0;
         unsigned int triggerSource = 0;
         unsigned int triggerSlope = 0;
         unsigned int triggerLevel = 0;
         bool secondEngineDisabled = false;
         unsigned int triggerCoupling = 0;
         unsigned int triggerRange = 0;
         unsigned int triggerDelay = 0;
         unsigned int triggerTimeout = 0;
         unsigned int auxMode = 0;
         unsigned int preTriggerSamples = 0;
         unsigned int postTriggerSamples = 0;
         unsigned int channelMask = 0;
         long transferOffset = 0;
         unsigned int samplesPerRecord = 0;
         unsigned int recordsPerBuffer = 0;
         unsigned int recordsPerAcquisition = 0;
         unsigned int captureFlags = 0;
      };

      typedef std::function<void(unsigned long)> CompletionHandler;

   public:

      explicit SimulatedBoard(unsigned int bitsPerSample = 12, unsigned long memorySizeSamples = 0);

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

   public: // simulation control

      // time between consecutive record triggers
      void setTriggerPeriod(std::chrono::microseconds period);

      // when disabled no record is ever completed and every wait times out
      void setTriggerEnabled(bool enabled);

      // next count waits will time out
      void setTimeoutCount(int count);

      // named operation throws BoardException on next call
      void injectFailure(const std::string &operation);

      // invoked after each completed buffer with the number of buffers completed so far
      void setCompletionHandler(CompletionHandler handler);

      std::vector<std::string> journal() const;

      Settings settings() const;

      unsigned long completedBuffers() const;

      int postedBuffers() const;

      bool isCapturing() const;

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
