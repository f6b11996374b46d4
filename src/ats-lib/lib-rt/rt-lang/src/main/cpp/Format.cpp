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

#include <cstdio>
#include <regex>
#include <sstream>

#include <rt/Format.h>

namespace rt {

std::string Format::format(const std::string &fmt, const std::vector<Variant> &parameters)
{
   std::regex token(R"(\{(['\-+]?\.?[0-9]*)?([xXt])?\})");

   std::string content = fmt;

   char buffer[4096];

   for (const auto &parameter: parameters)
   {
      buffer[0] = 0;

      std::smatch match;

      if (!std::regex_search(content, match, token))
         break;

      std::string opts = match[1];
      std::string mode = match[2];

      if (auto value = std::get_if<bool>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + "s").c_str(), *value ? "true" : "false");
      }
      else if (auto value = std::get_if<char>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + (mode.empty() ? "c" : mode)).c_str(), *value);
      }
      else if (auto value = std::get_if<short>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + (mode.empty() ? "d" : mode)).c_str(), *value);
      }
      else if (auto value = std::get_if<int>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + (mode.empty() ? "d" : mode)).c_str(), *value);
      }
      else if (auto value = std::get_if<long>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + "l" + (mode.empty() ? "d" : mode)).c_str(), *value);
      }
      else if (auto value = std::get_if<long long>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + "ll" + (mode.empty() ? "d" : mode)).c_str(), *value);
      }
      else if (auto value = std::get_if<unsigned char>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + (mode.empty() ? "u" : mode)).c_str(), *value);
      }
      else if (auto value = std::get_if<unsigned short>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + (mode.empty() ? "u" : mode)).c_str(), *value);
      }
      else if (auto value = std::get_if<unsigned int>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + (mode.empty() ? "u" : mode)).c_str(), *value);
      }
      else if (auto value = std::get_if<unsigned long>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + "l" + (mode.empty() ? "u" : mode)).c_str(), *value);
      }
      else if (auto value = std::get_if<unsigned long long>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + "ll" + (mode.empty() ? "u" : mode)).c_str(), *value);
      }
      else if (auto value = std::get_if<float>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + "f").c_str(), *value);
      }
      else if (auto value = std::get_if<double>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + "f").c_str(), *value);
      }
      else if (auto value = std::get_if<char *>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + "s").c_str(), *value);
      }
      else if (auto value = std::get_if<std::string>(&parameter))
      {
         snprintf(buffer, sizeof(buffer), ("%" + opts + "s").c_str(), value->c_str());
      }
      else if (auto value = std::get_if<std::thread::id>(&parameter))
      {
         std::ostringstream ss;
         ss << *value;
         snprintf(buffer, sizeof(buffer), "%s", ss.str().c_str());
      }
      else if (auto value = std::get_if<std::chrono::duration<long long, std::ratio<1, 1000000000>>>(&parameter))
      {
         int hours = static_cast<int>(std::chrono::duration_cast<std::chrono::hours>(*value).count());
         int minutes = static_cast<int>(std::chrono::duration_cast<std::chrono::minutes>(*value).count() % 60);
         int seconds = static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(*value).count() % 60);
         int milliseconds = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(*value).count() % 1000);

         if (mode == "t")
         {
            // raw nanoseconds
            snprintf(buffer, sizeof(buffer), "%lld ns", static_cast<long long>(value->count()));
         }
         else
         {
            // format as HH:MM:SS.mmm
            snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%03d", hours, minutes, seconds, milliseconds);
         }
      }

      content.replace(match.position(), match.length(), buffer);
   }

   return content;
}

}
