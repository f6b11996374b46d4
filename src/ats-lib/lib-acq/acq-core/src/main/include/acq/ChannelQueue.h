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

#ifndef ACQ_CHANNELQUEUE_H
#define ACQ_CHANNELQUEUE_H

#include <vector>

#include <rt/BlockingQueue.h>

#include <hw/SampleBuffer.h>

namespace acq {

// single producer, single consumer, closed by the acquisition loop
typedef rt::BlockingQueue<hw::SampleBuffer> ChannelQueue;

// treated result of one buffer of one channel
struct Treatment
{
   unsigned int channel;
   unsigned long sequence;
   std::vector<double> values;
};

// filled by a channel consumer, closed when its treatment finishes
typedef rt::BlockingQueue<Treatment> TreatmentQueue;

}

#endif
