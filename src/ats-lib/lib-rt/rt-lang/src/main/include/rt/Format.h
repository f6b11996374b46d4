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

#ifndef RT_FORMAT_H
#define RT_FORMAT_H

#include <string>
#include <vector>

#include <rt/Variant.h>

namespace rt {

class Format
{
   public:

      // replace each {} placeholder with the next parameter, supports {.3}, {08x}, {t} modifiers
      static std::string format(const std::string &fmt, const std::vector<Variant> &parameters);

};

}

#endif
