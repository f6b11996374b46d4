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

#ifndef ACQ_CONFIGURABLE_H
#define ACQ_CONFIGURABLE_H

#include <nlohmann/json.hpp>

namespace acq {

using json = nlohmann::json;

class Configurable
{
   public:

      virtual ~Configurable() = default;

      // current parameters
      virtual json get() const = 0;

      // validate and merge parameters, nothing is changed if any value is rejected
      virtual void set(const json &params) = 0;

      // throws ConfigurationError if params would be rejected by set()
      virtual void validate(const json &params) const = 0;
};

}

#endif
