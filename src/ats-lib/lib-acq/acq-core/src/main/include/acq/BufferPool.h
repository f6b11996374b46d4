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

#ifndef ACQ_BUFFERPOOL_H
#define ACQ_BUFFERPOOL_H

#include <cstddef>
#include <memory>

#include <hw/Board.h>
#include <hw/DmaBuffer.h>

#include <acq/AcquisitionConfig.h>

namespace acq {

/*
 * Fixed ring of DMA buffers, each buffer is owned by the pool, by the board while posted
 * or by the acquisition loop once completed
 */
class BufferPool
{
      struct Impl;

   public:

      enum Owner
      {
         Pool = 0,
         Board = 1,
         Loop = 2
      };

      struct Geometry
      {
         unsigned int bitsPerSample;
         unsigned int bytesPerSample;
         // element width for sample copies, 1 or 2 bytes
         unsigned int sampleSize;
         unsigned int samplesPerRecord;
         unsigned int recordsPerBuffer;
         unsigned int channelCount;
         std::size_t bytesPerBuffer;
      };

   public:

      explicit BufferPool(std::shared_ptr<hw::Board> board);

      ~BufferPool();

      static Geometry geometry(unsigned int bitsPerSample, unsigned int samplesPerRecord, unsigned int recordsPerBuffer);

      // allocate buffers, arm capture and post every buffer to the board
      const Geometry &allocate(const AcquisitionConfig &config);

      // wait for completion of next buffer in ring, ownership moves to loop
      const hw::DmaBuffer &wait(unsigned long completed, unsigned int timeoutMs);

      // give buffer back to the board
      void repost(unsigned long completed);

      // abort capture if armed and free all buffers, can be called any number of times
      void release();

      unsigned int size() const;

      unsigned int slot(unsigned long completed) const;

      Owner owner(unsigned int slot) const;

      bool isArmed() const;

      const Geometry &geometry() const;

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
