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

#include <acq/TriggerConfigurator.h>
#include <acq/ConfigValidator.h>

namespace acq {

static rt::Logger *log = rt::Logger::getLogger("acq.TriggerConfigurator");

TriggerConfigurator::TriggerConfigurator(std::shared_ptr<hw::Board> board) : board(std::move(board))
{
}

void TriggerConfigurator::configure(const AcquisitionConfig &config) const
{
   unsigned int levelCode = ConfigValidator::triggerLevelCode(config.triggerLevel, config.triggerRange);
   unsigned int delayCode = ConfigValidator::triggerDelayCode(config.triggerDelay, config.sampleRate);

   hw::Board::TriggerRange range = ConfigValidator::triggerRangeCode(config.triggerRange);
   hw::Board::TriggerSlope slope = config.triggerSlope == AcquisitionConfig::PositiveSlope ? hw::Board::TriggerSlopePositive : hw::Board::TriggerSlopeNegative;

   log->info("set external trigger, slope {} level {.3} V (code {}) range {.1} V delay {.1} ns ({} samples)", {ConfigValidator::toString(config.triggerSlope), config.triggerLevel, levelCode, config.triggerRange, config.triggerDelay, delayCode});

   // only engine J is used, engine K disabled
   board->setTriggerOperation(hw::Board::TriggerEngineJ, hw::Board::TriggerExternal, slope, levelCode, true);

   // must follow trigger operation
   board->setExternalTrigger(hw::Board::DcCoupling, range);

   board->setTriggerDelaySamples(delayCode);

   // no automatic trigger when external trigger is missing
   board->setTriggerTimeout(0);

   board->configureAuxOutput(hw::Board::AuxOutTrigger);
}

}
