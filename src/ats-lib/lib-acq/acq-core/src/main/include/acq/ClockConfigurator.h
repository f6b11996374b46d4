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

#ifndef ACQ_CLOCKCONFIGURATOR_H
#define ACQ_CLOCKCONFIGURATOR_H

#include <memory>

#include <hw/Board.h>

#include <acq/AcquisitionConfig.h>

namespace acq {

class ClockConfigurator
{
   public:

      explicit ClockConfigurator(std::shared_ptr<hw::Board> board);

      // programs sample clock source, rate, edge and decimation in one call
      void configure(const AcquisitionConfig &config) const;

   private:

      std::shared_ptr<hw::Board> board;
};

}

#endif
