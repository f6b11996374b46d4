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

#include <cmath>
#include <cstring>
#include <deque>
#include <mutex>
#include <set>
#include <thread>

#include <rt/Logger.h>

#include <hw/BoardException.h>
#include <hw/SimulatedBoard.h>

// samples per waveform period
#define WAVE_PERIOD 64

namespace hw {

struct SimulatedBoard::Impl
{
   rt::Logger *log = rt::Logger::getLogger("hw.SimulatedBoard");

   unsigned int bitsPerSample;
   unsigned long memorySizeSamples;

   Settings settings;

   std::vector<std::string> journal;
   std::set<std::string> failures;

   std::deque<void *> posted;
   std::size_t bytesPerBuffer = 0;

   bool armed = false;
   bool capturing = false;
   bool triggerEnabled = true;
   int timeoutCount = 0;

   std::chrono::microseconds triggerPeriod {0};

   unsigned long completed = 0;

   CompletionHandler completionHandler;

   mutable std::mutex mutex;

   Impl(unsigned int bitsPerSample, unsigned long memorySizeSamples) : bitsPerSample(bitsPerSample), memorySizeSamples(memorySizeSamples)
   {
      log->debug("created SimulatedBoard with {} bits per sample", {bitsPerSample});
   }

   // register call and raise injected failure, must be called with mutex held
   void enter(const std::string &operation)
   {
      journal.push_back(operation);

      if (failures.erase(operation))
      {
         log->warn("injected failure in {}", {operation});

         throw BoardException(operation, "injected failure");
      }
   }

   unsigned int bytesPerSample() const
   {
      return (bitsPerSample + 7) / 8;
   }

   void fill(void *buffer) const
   {
      unsigned int spr = settings.samplesPerRecord;
      unsigned int rpb = settings.recordsPerBuffer;

      double scale = ((1 << bitsPerSample) - 1) / 2.0;

      // one interleaved record, same waveform for every record
      std::vector<unsigned short> record(static_cast<std::size_t>(spr) * 2);

      for (unsigned int s = 0; s < spr; s++)
      {
         double phase = 2 * M_PI * s / WAVE_PERIOD;

         auto a = static_cast<unsigned int>(std::lround(scale + scale * 0.5 * std::sin(phase)));
         auto b = static_cast<unsigned int>(std::lround(scale + scale * 0.5 * std::cos(phase)));

         // samples wider than 8 bits are left justified in 16 bit words
         if (bytesPerSample() > 1)
         {
            a <<= 16 - bitsPerSample;
            b <<= 16 - bitsPerSample;
         }

         record[2 * s + 0] = static_cast<unsigned short>(a);
         record[2 * s + 1] = static_cast<unsigned short>(b);
      }

      for (unsigned int r = 0; r < rpb; r++)
      {
         std::size_t offset = static_cast<std::size_t>(r) * spr * 2;

         if (bytesPerSample() == 1)
         {
            auto data = static_cast<unsigned char *>(buffer) + offset;

            for (std::size_t i = 0; i < record.size(); i++)
               data[i] = static_cast<unsigned char>(record[i]);
         }
         else
         {
            std::memcpy(static_cast<unsigned short *>(buffer) + offset, record.data(), record.size() * sizeof(unsigned short));
         }
      }
   }

   void timeout(const std::string &operation, unsigned int timeoutMs)
   {
      std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));

      throw BoardTimeout(operation, timeoutMs);
   }

   void waitBufferComplete(void *buffer, unsigned int timeoutMs)
   {
      CompletionHandler handler;
      unsigned long count;

      {
         std::unique_lock lock(mutex);

         enter("waitBufferComplete");

         if (!capturing)
            throw BoardException("waitBufferComplete", "capture not started");

         if (timeoutCount > 0)
         {
            timeoutCount--;
            lock.unlock();
            timeout("waitBufferComplete", timeoutMs);
         }

         // no more records to acquire or no triggers
         if (!triggerEnabled || static_cast<unsigned long long>(completed) * settings.recordsPerBuffer >= settings.recordsPerAcquisition)
         {
            lock.unlock();
            timeout("waitBufferComplete", timeoutMs);
         }

         if (posted.empty() || posted.front() != buffer)
            throw BoardException("waitBufferComplete", "buffer is not the next posted buffer");
      }

      // emulate trigger rate for all records in buffer
      if (triggerPeriod.count() > 0)
         std::this_thread::sleep_for(triggerPeriod * settings.recordsPerBuffer);

      {
         std::lock_guard lock(mutex);

         // capture aborted while waiting
         if (!capturing)
            throw BoardException("waitBufferComplete", "capture aborted");

         fill(buffer);

         posted.pop_front();

         count = ++completed;
         handler = completionHandler;
      }

      if (handler)
         handler(count);
   }
};

SimulatedBoard::SimulatedBoard(unsigned int bitsPerSample, unsigned long memorySizeSamples) : impl(std::make_shared<Impl>(bitsPerSample, memorySizeSamples))
{
}

std::string SimulatedBoard::name() const
{
   return "simulated";
}

void SimulatedBoard::setCaptureClock(ClockSource source, unsigned int rate, ClockEdge edge, unsigned int decimation)
{
   std::lock_guard lock(impl->mutex);

   impl->enter("setCaptureClock");

   impl->settings.clockSource = source;
   impl->settings.sampleRate = rate;
   impl->settings.clockEdge = edge;
   impl->settings.decimation = decimation;

   impl->log->debug("capture clock source {} rate {} edge {} decimation {}", {source, rate, edge, decimation});
}

void SimulatedBoard::setInputRange(Channel channel, Coupling coupling, InputRange range, Impedance impedance)
{
   std::lock_guard lock(impl->mutex);

   impl->enter("setInputRange");

   if (channel != ChannelA && channel != ChannelB)
      throw BoardException("setInputRange", "invalid channel " + std::to_string(channel));

   impl->settings.inputsConfigured |= channel;

   impl->log->debug("input channel {} coupling {} range {} impedance {}", {channel, coupling, range, impedance});
}

void SimulatedBoard::setTriggerOperation(TriggerEngine engine, TriggerSource source, TriggerSlope slope, unsigned int levelCode, bool secondEngineDisabled)
{
   std::lock_guard lock(impl->mutex);

   impl->enter("setTriggerOperation");

   if (levelCode > 255)
      throw BoardException("setTriggerOperation", "invalid trigger level code " + std::to_string(levelCode));

   impl->settings.triggerEngine = engine;
   impl->settings.triggerSource = source;
   impl->settings.triggerSlope = slope;
   impl->settings.triggerLevel = levelCode;
   impl->settings.secondEngineDisabled = secondEngineDisabled;
}

void SimulatedBoard::setExternalTrigger(Coupling coupling, TriggerRange range)
{
   std::lock_guard lock(impl->mutex);

   impl->enter("setExternalTrigger");

   impl->settings.triggerCoupling = coupling;
   impl->settings.triggerRange = range;
}

void SimulatedBoard::setTriggerDelaySamples(unsigned int delay)
{
   std::lock_guard lock(impl->mutex);

   impl->enter("setTriggerDelaySamples");

   impl->settings.triggerDelay = delay;
}

void SimulatedBoard::setTriggerTimeout(unsigned int ticks)
{
   std::lock_guard lock(impl->mutex);

   impl->enter("setTriggerTimeout");

   impl->settings.triggerTimeout = ticks;
}

void SimulatedBoard::configureAuxOutput(AuxMode mode)
{
   std::lock_guard lock(impl->mutex);

   impl->enter("configureAuxOutput");

   impl->settings.auxMode = mode;
}

Board::ChannelInfo SimulatedBoard::getChannelInfo()
{
   std::lock_guard lock(impl->mutex);

   impl->enter("getChannelInfo");

   return {impl->memorySizeSamples, impl->bitsPerSample};
}

void SimulatedBoard::setRecordSize(unsigned int preTriggerSamples, unsigned int postTriggerSamples)
{
   std::lock_guard lock(impl->mutex);

   impl->enter("setRecordSize");

   impl->settings.preTriggerSamples = preTriggerSamples;
   impl->settings.postTriggerSamples = postTriggerSamples;
}

void SimulatedBoard::armContinuousCapture(unsigned int channelMask, long transferOffset, unsigned int samplesPerRecord, unsigned int recordsPerBuffer, unsigned int recordsPerAcquisition, unsigned int flags)
{
   std::lock_guard lock(impl->mutex);

   impl->enter("armContinuousCapture");

   if (channelMask != (ChannelA | ChannelB))
      throw BoardException("armContinuousCapture", "only dual channel capture is supported");

   if (samplesPerRecord == 0 || samplesPerRecord % 128)
      throw BoardException("armContinuousCapture", "samples per record must be a multiple of 128");

   if (recordsPerBuffer == 0)
      throw BoardException("armContinuousCapture", "records per buffer must be positive");

   impl->settings.channelMask = channelMask;
   impl->settings.transferOffset = transferOffset;
   impl->settings.samplesPerRecord = samplesPerRecord;
   impl->settings.recordsPerBuffer = recordsPerBuffer;
   impl->settings.recordsPerAcquisition = recordsPerAcquisition;
   impl->settings.captureFlags = flags;

   impl->bytesPerBuffer = static_cast<std::size_t>(impl->bytesPerSample()) * samplesPerRecord * recordsPerBuffer * 2;
   impl->posted.clear();
   impl->completed = 0;
   impl->armed = true;

   impl->log->info("armed capture for {} records of {} samples, {} records per buffer", {recordsPerAcquisition, samplesPerRecord, recordsPerBuffer});
}

void SimulatedBoard::postBuffer(void *buffer, std::size_t size)
{
   std::lock_guard lock(impl->mutex);

   impl->enter("postBuffer");

   if (!impl->armed)
      throw BoardException("postBuffer", "capture not armed");

   if (!buffer || size < impl->bytesPerBuffer)
      throw BoardException("postBuffer", "buffer too small, " + std::to_string(size) + " bytes");

   impl->posted.push_back(buffer);
}

void SimulatedBoard::startCapture()
{
   std::lock_guard lock(impl->mutex);

   impl->enter("startCapture");

   if (!impl->armed)
      throw BoardException("startCapture", "capture not armed");

   impl->capturing = true;
}

void SimulatedBoard::waitBufferComplete(void *buffer, unsigned int timeoutMs)
{
   impl->waitBufferComplete(buffer, timeoutMs);
}

void SimulatedBoard::abortCapture()
{
   std::lock_guard lock(impl->mutex);

   impl->enter("abortCapture");

   if (impl->armed)
      impl->log->info("capture aborted after {} buffers", {impl->completed});

   impl->posted.clear();
   impl->capturing = false;
   impl->armed = false;
}

void SimulatedBoard::setTriggerPeriod(std::chrono::microseconds period)
{
   std::lock_guard lock(impl->mutex);

   impl->triggerPeriod = period;
}

void SimulatedBoard::setTriggerEnabled(bool enabled)
{
   std::lock_guard lock(impl->mutex);

   impl->triggerEnabled = enabled;
}

void SimulatedBoard::setTimeoutCount(int count)
{
   std::lock_guard lock(impl->mutex);

   impl->timeoutCount = count;
}

void SimulatedBoard::injectFailure(const std::string &operation)
{
   std::lock_guard lock(impl->mutex);

   impl->failures.insert(operation);
}

void SimulatedBoard::setCompletionHandler(CompletionHandler handler)
{
   std::lock_guard lock(impl->mutex);

   impl->completionHandler = std::move(handler);
}

std::vector<std::string> SimulatedBoard::journal() const
{
   std::lock_guard lock(impl->mutex);

   return impl->journal;
}

SimulatedBoard::Settings SimulatedBoard::settings() const
{
   std::lock_guard lock(impl->mutex);

   return impl->settings;
}

unsigned long SimulatedBoard::completedBuffers() const
{
   std::lock_guard lock(impl->mutex);

   return impl->completed;
}

int SimulatedBoard::postedBuffers() const
{
   std::lock_guard lock(impl->mutex);

   return static_cast<int>(impl->posted.size());
}

bool SimulatedBoard::isCapturing() const
{
   std::lock_guard lock(impl->mutex);

   return impl->capturing;
}

}
