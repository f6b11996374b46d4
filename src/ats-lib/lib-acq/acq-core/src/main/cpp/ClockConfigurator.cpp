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

#include <acq/ClockConfigurator.h>
#include <acq/ConfigValidator.h>

namespace acq {

static rt::Logger *log = rt::Logger::getLogger("acq.ClockConfigurator");

ClockConfigurator::ClockConfigurator(std::shared_ptr<hw::Board> board) : board(std::move(board))
{
}

void ClockConfigurator::configure(const AcquisitionConfig &config) const
{
   unsigned int rate = ConfigValidator::clockRate(config.clockSource, config.sampleRate);
   unsigned int decimation = ConfigValidator::clockDecimation(config.clockSource);

   hw::Board::ClockSource source = config.clockSource == AcquisitionConfig::InternalClock ? hw::Board::InternalClock : hw::Board::ExternalClock10MHzRef;
   hw::Board::ClockEdge edge = config.clockEdge == AcquisitionConfig::RisingEdge ? hw::Board::ClockEdgeRising : hw::Board::ClockEdgeFalling;

   log->info("set capture clock {} at {.3} MS/s (rate {}, edge {}, decimation {})", {ConfigValidator::toString(config.clockSource), config.sampleRate, rate, ConfigValidator::toString(config.clockEdge), decimation});

   board->setCaptureClock(source, rate, edge, decimation);
}

}
