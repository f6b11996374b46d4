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

#include <memory>
#include <vector>

#include <catch2/catch.hpp>

#include <hw/SimulatedBoard.h>

#include <acq/BufferPool.h>
#include <acq/Deinterleave.h>

namespace acq {

TEST_CASE("Interleaved samples are split by parity", "[deinterleave]")
{
   const unsigned short source[] = {1, 2, 3, 4, 5, 6};

   unsigned short a[3] {};
   unsigned short b[3] {};

   Deinterleave::split(source, 3, a, b);

   CHECK(std::vector<unsigned short>(a, a + 3) == std::vector<unsigned short> {1, 3, 5});
   CHECK(std::vector<unsigned short>(b, b + 3) == std::vector<unsigned short> {2, 4, 6});
}

TEST_CASE("DMA buffer is split into channel buffers", "[deinterleave]")
{
   BufferPool::Geometry geometry = BufferPool::geometry(12, 128, 2);

   std::vector<unsigned short> source(geometry.bytesPerBuffer / sizeof(unsigned short));

   for (unsigned int i = 0; i < source.size(); i++)
      source[i] = static_cast<unsigned short>(i);

   auto channels = Deinterleave::split(source.data(), geometry, 7);

   const hw::SampleBuffer &a = channels.first;
   const hw::SampleBuffer &b = channels.second;

   REQUIRE(a.elements() == 256);
   REQUIRE(b.elements() == 256);

   CHECK(a.channel() == 0);
   CHECK(b.channel() == 1);
   CHECK(a.sequence() == 7);
   CHECK(b.sequence() == 7);
   CHECK(a.records() == 2);
   CHECK(a.samplesPerRecord() == 128);
   CHECK(a.bytes() == 512);

   for (unsigned int i = 0; i < a.elements(); i++)
   {
      CHECK(a.as<unsigned short>()[i] == 2 * i);
      CHECK(b.as<unsigned short>()[i] == 2 * i + 1);
   }
}

TEST_CASE("Eight bit samples are split as bytes", "[deinterleave]")
{
   BufferPool::Geometry geometry = BufferPool::geometry(8, 128, 1);

   std::vector<unsigned char> source(geometry.bytesPerBuffer);

   for (unsigned int i = 0; i < source.size(); i++)
      source[i] = static_cast<unsigned char>(i % 2 ? 200 : 50);

   auto channels = Deinterleave::split(source.data(), geometry, 0);

   REQUIRE(channels.first.sampleSize() == 1);
   REQUIRE(channels.first.elements() == 128);

   for (unsigned int i = 0; i < channels.first.elements(); i++)
   {
      CHECK(channels.first.as<unsigned char>()[i] == 50);
      CHECK(channels.second.as<unsigned char>()[i] == 200);
   }
}

TEST_CASE("Simulated board fills channel A with sine and B with cosine", "[deinterleave]")
{
   AcquisitionConfig config;

   config.samplesPerRecord = 128;
   config.recordsPerBuffer = 2;
   config.buffersPerAcquisition = 50;
   config.bufferPoolSize = 2;

   auto board = std::make_shared<hw::SimulatedBoard>(12);

   BufferPool pool(board);

   pool.allocate(config);

   board->startCapture();

   const hw::DmaBuffer &buffer = pool.wait(0, 1000);

   auto channels = Deinterleave::split(buffer.data(), pool.geometry(), 0);

   const unsigned short *a = channels.first.as<unsigned short>();
   const unsigned short *b = channels.second.as<unsigned short>();

   // mid scale and positive peak, left justified 12 bit codes
   CHECK(a[0] == 2048 << 4);
   CHECK(b[0] == 3071 << 4);

   // same waveform on every record
   CHECK(a[128] == a[0]);
   CHECK(b[128] == b[0]);

   // quarter period later the channels are swapped
   CHECK(a[16] == b[0]);
   CHECK(b[16] == 2048 << 4);
}

}
