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

#ifndef ACQ_DEINTERLEAVE_H
#define ACQ_DEINTERLEAVE_H

#include <cstddef>
#include <utility>

#include <hw/SampleBuffer.h>

#include <acq/BufferPool.h>

namespace acq {

class Deinterleave
{
   public:

      // even elements to a, odd elements to b, count is the number of elements per channel
      template <typename T>
      static void split(const T *source, std::size_t count, T *a, T *b)
      {
         for (std::size_t i = 0; i < count; i++)
         {
            a[i] = source[2 * i + 0];
            b[i] = source[2 * i + 1];
         }
      }

      // copy of channel A and B samples from a completed DMA buffer
      static std::pair<hw::SampleBuffer, hw::SampleBuffer> split(const void *source, const BufferPool::Geometry &geometry, unsigned long sequence);
};

}

#endif
