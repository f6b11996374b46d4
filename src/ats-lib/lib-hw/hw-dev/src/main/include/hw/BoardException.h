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

#ifndef HW_BOARDEXCEPTION_H
#define HW_BOARDEXCEPTION_H

#include <stdexcept>
#include <string>

namespace hw {

class BoardException : public std::runtime_error
{
   public:

      explicit BoardException(const std::string &operation, const std::string &message, int code = 0) : std::runtime_error(operation + " failed: " + message), operation_(operation), code_(code)
      {
      }

      const std::string &operation() const
      {
         return operation_;
      }

      int code() const
      {
         return code_;
      }

   private:

      std::string operation_;

      int code_;
};

class BoardTimeout : public BoardException
{
   public:

      explicit BoardTimeout(const std::string &operation, unsigned int timeoutMs, int code = 0) : BoardException(operation, "timeout after " + std::to_string(timeoutMs) + " ms", code), timeoutMs_(timeoutMs)
      {
      }

      unsigned int timeout() const
      {
         return timeoutMs_;
      }

   private:

      unsigned int timeoutMs_;
};

}

#endif
