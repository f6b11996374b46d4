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

#include <AlazarApi.h>
#include <AlazarCmd.h>

#include <rt/Logger.h>

#include <hw/BoardException.h>
#include <hw/alazar/AlazarBoard.h>

namespace hw {

struct AlazarBoard::Impl
{
   rt::Logger *log = rt::Logger::getLogger("hw.AlazarBoard");

   unsigned int systemId;
   unsigned int boardId;

   HANDLE handle = nullptr;

   Impl(unsigned int systemId, unsigned int boardId) : systemId(systemId), boardId(boardId)
   {
      handle = AlazarGetBoardBySystemID(systemId, boardId);

      if (!handle)
         throw BoardException("AlazarGetBoardBySystemID", "board " + std::to_string(systemId) + ":" + std::to_string(boardId) + " not found");

      log->info("opened board {}:{}", {systemId, boardId});
   }

   // raise exception for any result other than success
   void check(RETURN_CODE rc, const std::string &operation) const
   {
      if (rc == ApiSuccess)
         return;

      std::string text = AlazarErrorToText(rc);

      log->error("{} failed: [{}] {}", {operation, static_cast<int>(rc), text});

      if (rc == ApiWaitTimeout)
         throw BoardTimeout(operation, 0, rc);

      throw BoardException(operation, text, rc);
   }
};

AlazarBoard::AlazarBoard(unsigned int systemId, unsigned int boardId) : impl(std::make_shared<Impl>(systemId, boardId))
{
}

std::string AlazarBoard::name() const
{
   return "alazar://" + std::to_string(impl->systemId) + ":" + std::to_string(impl->boardId);
}

void AlazarBoard::setCaptureClock(ClockSource source, unsigned int rate, ClockEdge edge, unsigned int decimation)
{
   impl->check(AlazarSetCaptureClock(impl->handle, source, rate, edge, decimation), "AlazarSetCaptureClock");
}

void AlazarBoard::setInputRange(Channel channel, Coupling coupling, InputRange range, Impedance impedance)
{
   impl->check(AlazarInputControlEx(impl->handle, channel, coupling, range, impedance), "AlazarInputControlEx");
}

void AlazarBoard::setTriggerOperation(TriggerEngine engine, TriggerSource source, TriggerSlope slope, unsigned int levelCode, bool secondEngineDisabled)
{
   U32 other = engine == TriggerEngineJ ? TRIG_ENGINE_K : TRIG_ENGINE_J;
   U32 operation = engine == TriggerEngineJ ? TRIG_ENGINE_OP_J : TRIG_ENGINE_OP_K;

   if (!secondEngineDisabled)
      operation = TRIG_ENGINE_OP_J_OR_K;

   impl->check(AlazarSetTriggerOperation(impl->handle, operation,
                                         engine, source, slope, levelCode,
                                         other, secondEngineDisabled ? TRIG_DISABLE : source, TRIGGER_SLOPE_POSITIVE, 128), "AlazarSetTriggerOperation");
}

void AlazarBoard::setExternalTrigger(Coupling coupling, TriggerRange range)
{
   impl->check(AlazarSetExternalTrigger(impl->handle, coupling, range), "AlazarSetExternalTrigger");
}

void AlazarBoard::setTriggerDelaySamples(unsigned int delay)
{
   impl->check(AlazarSetTriggerDelay(impl->handle, delay), "AlazarSetTriggerDelay");
}

void AlazarBoard::setTriggerTimeout(unsigned int ticks)
{
   impl->check(AlazarSetTriggerTimeOut(impl->handle, ticks), "AlazarSetTriggerTimeOut");
}

void AlazarBoard::configureAuxOutput(AuxMode mode)
{
   impl->check(AlazarConfigureAuxIO(impl->handle, mode, 0), "AlazarConfigureAuxIO");
}

Board::ChannelInfo AlazarBoard::getChannelInfo()
{
   U32 memorySize = 0;
   U8 bitsPerSample = 0;

   impl->check(AlazarGetChannelInfo(impl->handle, &memorySize, &bitsPerSample), "AlazarGetChannelInfo");

   return {memorySize, bitsPerSample};
}

void AlazarBoard::setRecordSize(unsigned int preTriggerSamples, unsigned int postTriggerSamples)
{
   impl->check(AlazarSetRecordSize(impl->handle, preTriggerSamples, postTriggerSamples), "AlazarSetRecordSize");
}

void AlazarBoard::armContinuousCapture(unsigned int channelMask, long transferOffset, unsigned int samplesPerRecord, unsigned int recordsPerBuffer, unsigned int recordsPerAcquisition, unsigned int flags)
{
   impl->log->info("before async read, channels {} offset {} samples {} records per buffer {} records per acquisition {} flags {x}", {channelMask, transferOffset, samplesPerRecord, recordsPerBuffer, recordsPerAcquisition, flags});

   impl->check(AlazarBeforeAsyncRead(impl->handle, channelMask, transferOffset, samplesPerRecord, recordsPerBuffer, recordsPerAcquisition, flags), "AlazarBeforeAsyncRead");
}

void AlazarBoard::postBuffer(void *buffer, std::size_t size)
{
   impl->check(AlazarPostAsyncBuffer(impl->handle, buffer, static_cast<U32>(size)), "AlazarPostAsyncBuffer");
}

void AlazarBoard::startCapture()
{
   impl->check(AlazarStartCapture(impl->handle), "AlazarStartCapture");
}

void AlazarBoard::waitBufferComplete(void *buffer, unsigned int timeoutMs)
{
   RETURN_CODE rc = AlazarWaitAsyncBufferComplete(impl->handle, buffer, timeoutMs);

   if (rc == ApiWaitTimeout)
      throw BoardTimeout("AlazarWaitAsyncBufferComplete", timeoutMs, rc);

   impl->check(rc, "AlazarWaitAsyncBufferComplete");
}

void AlazarBoard::abortCapture()
{
   impl->check(AlazarAbortAsyncRead(impl->handle), "AlazarAbortAsyncRead");
}

}
