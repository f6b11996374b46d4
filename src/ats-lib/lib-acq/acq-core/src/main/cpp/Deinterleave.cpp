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

#include <acq/Deinterleave.h>

namespace acq {

std::pair<hw::SampleBuffer, hw::SampleBuffer> Deinterleave::split(const void *source, const BufferPool::Geometry &geometry, unsigned long sequence)
{
   hw::SampleBuffer a(0, sequence, geometry.sampleSize, geometry.samplesPerRecord, geometry.recordsPerBuffer);
   hw::SampleBuffer b(1, sequence, geometry.sampleSize, geometry.samplesPerRecord, geometry.recordsPerBuffer);

   if (geometry.sampleSize == 1)
      split(static_cast<const unsigned char *>(source), a.elements(), a.as<unsigned char>(), b.as<unsigned char>());
   else
      split(static_cast<const unsigned short *>(source), a.elements(), a.as<unsigned short>(), b.as<unsigned short>());

   return {a, b};
}

}
