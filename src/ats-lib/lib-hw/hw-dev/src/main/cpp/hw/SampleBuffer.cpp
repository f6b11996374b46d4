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

#include <vector>

#include <hw/SampleBuffer.h>

namespace hw {

struct SampleBuffer::Impl
{
   unsigned int channel;
   unsigned long sequence;
   unsigned int sampleSize;
   unsigned int samplesPerRecord;
   unsigned int records;

   std::vector<unsigned char> storage;

   Impl(unsigned int channel, unsigned long sequence, unsigned int sampleSize, unsigned int samplesPerRecord, unsigned int records) :
      channel(channel),
      sequence(sequence),
      sampleSize(sampleSize),
      samplesPerRecord(samplesPerRecord),
      records(records),
      storage(static_cast<std::size_t>(sampleSize) * samplesPerRecord * records)
   {
   }
};

SampleBuffer::SampleBuffer() : impl(std::make_shared<Impl>(0, 0, 0, 0, 0))
{
}

SampleBuffer::SampleBuffer(unsigned int channel, unsigned long sequence, unsigned int sampleSize, unsigned int samplesPerRecord, unsigned int records) : impl(std::make_shared<Impl>(channel, sequence, sampleSize, samplesPerRecord, records))
{
}

unsigned int SampleBuffer::channel() const
{
   return impl->channel;
}

unsigned long SampleBuffer::sequence() const
{
   return impl->sequence;
}

unsigned int SampleBuffer::sampleSize() const
{
   return impl->sampleSize;
}

unsigned int SampleBuffer::samplesPerRecord() const
{
   return impl->samplesPerRecord;
}

unsigned int SampleBuffer::records() const
{
   return impl->records;
}

std::size_t SampleBuffer::elements() const
{
   return static_cast<std::size_t>(impl->samplesPerRecord) * impl->records;
}

std::size_t SampleBuffer::bytes() const
{
   return impl->storage.size();
}

void *SampleBuffer::data()
{
   return impl->storage.data();
}

const void *SampleBuffer::data() const
{
   return impl->storage.data();
}

bool SampleBuffer::isValid() const
{
   return !impl->storage.empty();
}

}
