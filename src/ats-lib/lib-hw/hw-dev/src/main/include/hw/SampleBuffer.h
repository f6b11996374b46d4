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

#ifndef HW_SAMPLEBUFFER_H
#define HW_SAMPLEBUFFER_H

#include <cstddef>
#include <memory>

namespace hw {

/*
 * Samples of one channel extracted from a completed DMA buffer, element size is 1 or 2 bytes
 * and copies share the same storage
 */
class SampleBuffer
{
      struct Impl;

   public:

      SampleBuffer();

      SampleBuffer(unsigned int channel, unsigned long sequence, unsigned int sampleSize, unsigned int samplesPerRecord, unsigned int records);

      // channel index, 0 for A and 1 for B
      unsigned int channel() const;

      // DMA buffer sequence number in acquisition
      unsigned long sequence() const;

      // bytes per element
      unsigned int sampleSize() const;

      unsigned int samplesPerRecord() const;

      unsigned int records() const;

      // total number of elements
      std::size_t elements() const;

      std::size_t bytes() const;

      void *data();

      const void *data() const;

      template <typename T>
      T *as()
      {
         return static_cast<T *>(data());
      }

      template <typename T>
      const T *as() const
      {
         return static_cast<const T *>(data());
      }

      bool isValid() const;

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
