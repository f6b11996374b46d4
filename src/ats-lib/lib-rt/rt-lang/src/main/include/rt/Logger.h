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

#ifndef RT_LOGGER_H
#define RT_LOGGER_H

#include <ostream>
#include <string>
#include <vector>

#include <rt/Variant.h>

namespace rt {

/*
 * Named logger, messages use {} placeholders replaced by parameters in order. Events are
 * written by a background appender thread started with init().
 */
class Logger
{
   Logger(std::string name, int level);

   public:

      enum Level
      {
         NONE_LEVEL = 0,
         ERROR_LEVEL = 1,
         WARN_LEVEL = 2,
         INFO_LEVEL = 3,
         DEBUG_LEVEL = 4,
         TRACE_LEVEL = 5
      };

      void trace(const std::string &format, std::vector<Variant> params = {}) const;

      void debug(const std::string &format, std::vector<Variant> params = {}) const;

      void info(const std::string &format, std::vector<Variant> params = {}) const;

      void warn(const std::string &format, std::vector<Variant> params = {}) const;

      void error(const std::string &format, std::vector<Variant> params = {}) const;

      bool isEnabled(int level) const;

      const std::string &getName() const;

   public:

      static void init(std::ostream &stream, int level = WARN_LEVEL);

      // write pending events and stop appender thread
      static void shutdown();

      static int getRootLevel();

      static void setRootLevel(int level);

      // level for all loggers below a dotted prefix, "*" matches any single name
      static void setLoggerLevel(const std::string &target, int level);

      // level index for NONE, ERROR, WARN, INFO, DEBUG or TRACE, -1 if unknown
      static int parseLevel(const std::string &name);

      static Logger *getLogger(const std::string &name, int level = WARN_LEVEL);

   private:

      static bool matches(const std::string &name, const std::string &target);

      void push(int level, const std::string &format, std::vector<Variant> &&params) const;

   private:

      int level;

      std::string name;
};

}

#endif
