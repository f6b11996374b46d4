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

#include <rt/Logger.h>

#include <acq/InputConfigurator.h>

namespace acq {

static rt::Logger *log = rt::Logger::getLogger("acq.InputConfigurator");

InputConfigurator::InputConfigurator(std::shared_ptr<hw::Board> board) : board(std::move(board))
{
}

void InputConfigurator::configure(const AcquisitionConfig &) const
{
   for (auto channel: {hw::Board::ChannelA, hw::Board::ChannelB})
   {
      log->debug("set input control for channel {}", {channel});

      board->setInputRange(channel, hw::Board::DcCoupling, hw::Board::InputRange400mV, hw::Board::Impedance50Ohm);
   }
}

}
