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

#ifndef RT_VARIANT_H
#define RT_VARIANT_H

#include <chrono>
#include <string>
#include <thread>
#include <variant>

namespace rt {

typedef std::variant<
      bool,
      char,
      short,
      int,
      long,
      long long,
      unsigned char,
      unsigned short,
      unsigned int,
      unsigned long,
      unsigned long long,
      float,
      double,
      char *,
      std::string,
      std::thread::id,
      std::chrono::duration<long long, std::ratio<1, 1000000000>>
> Variant;

}

#endif
