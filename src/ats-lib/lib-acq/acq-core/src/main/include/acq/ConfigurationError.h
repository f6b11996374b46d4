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

#ifndef ACQ_CONFIGURATIONERROR_H
#define ACQ_CONFIGURATIONERROR_H

#include <stdexcept>
#include <string>

namespace acq {

/*
 * Illegal acquisition parameter, raised before any device call
 */
class ConfigurationError : public std::invalid_argument
{
   public:

      ConfigurationError(const std::string &field, const std::string &constraint) : std::invalid_argument("invalid " + field + ", must be " + constraint), field_(field), constraint_(constraint)
      {
      }

      // offending parameter name
      const std::string &field() const
      {
         return field_;
      }

      // allowed values or rule
      const std::string &constraint() const
      {
         return constraint_;
      }

   private:

      std::string field_;

      std::string constraint_;
};

}

#endif
