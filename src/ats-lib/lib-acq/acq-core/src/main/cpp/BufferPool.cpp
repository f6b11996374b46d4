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

#include <stdexcept>
#include <vector>

#include <rt/Logger.h>

#include <hw/BoardException.h>

#include <acq/BufferPool.h>

#define CHANNEL_COUNT 2

namespace acq {

struct BufferPool::Impl
{
   rt::Logger *log = rt::Logger::getLogger("acq.BufferPool");

   std::shared_ptr<hw::Board> board;

   Geometry geometry {};

   std::vector<hw::DmaBuffer> buffers;

   std::vector<Owner> owners;

   bool armed = false;

   explicit Impl(std::shared_ptr<hw::Board> board) : board(std::move(board))
   {
   }

   ~Impl()
   {
      release();
   }

   hw::DmaBuffer &at(unsigned int slot)
   {
      if (slot >= buffers.size())
         throw std::out_of_range("buffer slot " + std::to_string(slot) + " not allocated");

      return buffers[slot];
   }

   void allocate(const AcquisitionConfig &config)
   {
      if (!buffers.empty())
         throw std::logic_error("buffer pool already allocated");

      hw::Board::ChannelInfo info = board->getChannelInfo();

      // no pre-trigger samples in NPT mode
      geometry = BufferPool::geometry(info.bitsPerSample, config.samplesPerRecord, config.recordsPerBuffer);

      log->info("allocating {} buffers of {} bytes, {} bits per sample", {config.bufferPoolSize, geometry.bytesPerBuffer, geometry.bitsPerSample});

      for (unsigned int i = 0; i < config.bufferPoolSize; i++)
      {
         buffers.emplace_back(i, geometry.bytesPerBuffer);
         owners.push_back(Pool);
      }

      board->setRecordSize(0, geometry.samplesPerRecord);

      unsigned int recordsPerAcquisition = config.recordsPerBuffer * config.buffersPerAcquisition;

      // transfer offset is minus pre-trigger samples
      board->armContinuousCapture(hw::Board::ChannelA | hw::Board::ChannelB,
                                  0L,
                                  geometry.samplesPerRecord,
                                  geometry.recordsPerBuffer,
                                  recordsPerAcquisition,
                                  hw::Board::ExternalStartCapture | hw::Board::NoPreTrigger | hw::Board::FifoOnlyStreaming);

      armed = true;

      // all buffers must be posted before capture start
      for (unsigned int i = 0; i < buffers.size(); i++)
      {
         board->postBuffer(buffers[i].data(), buffers[i].size());

         owners[i] = Board;
      }
   }

   const hw::DmaBuffer &wait(unsigned int slot, unsigned int timeoutMs)
   {
      hw::DmaBuffer &buffer = at(slot);

      if (owners[slot] != Board)
         throw std::logic_error("buffer " + std::to_string(slot) + " is not posted to the board");

      board->waitBufferComplete(buffer.data(), timeoutMs);

      owners[slot] = Loop;

      return buffer;
   }

   void repost(unsigned int slot)
   {
      hw::DmaBuffer &buffer = at(slot);

      if (owners[slot] != Loop)
         throw std::logic_error("buffer " + std::to_string(slot) + " is not owned by the acquisition loop");

      board->postBuffer(buffer.data(), buffer.size());

      owners[slot] = Board;
   }

   void release()
   {
      if (armed)
      {
         armed = false;

         try
         {
            board->abortCapture();
         }
         catch (hw::BoardException &e)
         {
            log->warn("abort capture failed: {}", {std::string(e.what())});
         }
      }

      if (!buffers.empty())
      {
         log->debug("releasing {} buffers", {static_cast<unsigned int>(buffers.size())});

         for (auto &buffer: buffers)
            buffer.release();

         buffers.clear();
         owners.clear();
      }
   }
};

BufferPool::BufferPool(std::shared_ptr<hw::Board> board) : impl(std::make_shared<Impl>(std::move(board)))
{
}

BufferPool::~BufferPool()
{
   impl->release();
}

BufferPool::Geometry BufferPool::geometry(unsigned int bitsPerSample, unsigned int samplesPerRecord, unsigned int recordsPerBuffer)
{
   Geometry result {};

   result.bitsPerSample = bitsPerSample;
   result.bytesPerSample = (bitsPerSample + 7) / 8;
   result.sampleSize = result.bytesPerSample > 1 ? 2 : 1;
   result.samplesPerRecord = samplesPerRecord;
   result.recordsPerBuffer = recordsPerBuffer;
   result.channelCount = CHANNEL_COUNT;
   result.bytesPerBuffer = static_cast<std::size_t>(result.bytesPerSample) * samplesPerRecord * recordsPerBuffer * CHANNEL_COUNT;

   return result;
}

const BufferPool::Geometry &BufferPool::allocate(const AcquisitionConfig &config)
{
   impl->allocate(config);

   return impl->geometry;
}

const hw::DmaBuffer &BufferPool::wait(unsigned long completed, unsigned int timeoutMs)
{
   return impl->wait(slot(completed), timeoutMs);
}

void BufferPool::repost(unsigned long completed)
{
   impl->repost(slot(completed));
}

void BufferPool::release()
{
   impl->release();
}

unsigned int BufferPool::size() const
{
   return static_cast<unsigned int>(impl->buffers.size());
}

unsigned int BufferPool::slot(unsigned long completed) const
{
   if (impl->buffers.empty())
      throw std::logic_error("buffer pool not allocated");

   return static_cast<unsigned int>(completed % impl->buffers.size());
}

BufferPool::Owner BufferPool::owner(unsigned int slot) const
{
   if (slot >= impl->owners.size())
      throw std::out_of_range("buffer slot " + std::to_string(slot) + " not allocated");

   return impl->owners[slot];
}

bool BufferPool::isArmed() const
{
   return impl->armed;
}

const BufferPool::Geometry &BufferPool::geometry() const
{
   return impl->geometry;
}

}
