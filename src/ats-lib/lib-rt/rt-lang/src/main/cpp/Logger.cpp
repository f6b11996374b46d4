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

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

#include <rt/BlockingQueue.h>
#include <rt/Format.h>
#include <rt/Logger.h>

namespace rt {

namespace {

const char *tags[] = {"NONE", "ERROR", "WARN", "INFO", "DEBUG", "TRACE"};

struct Event
{
   int level;
   std::string logger;
   std::string format;
   std::vector<Variant> params;
   std::thread::id thread;
   std::chrono::system_clock::time_point time;
};

// background writer
struct Appender
{
   std::atomic<int> level;

   std::ostream &stream;

   // serializes writes once the thread is stopped
   std::mutex streamMutex;

   BlockingQueue<Event> events;

   std::thread thread;

   Appender(std::ostream &stream, int level) : level(level), stream(stream), thread([this] { exec(); })
   {
   }

   ~Appender()
   {
      stop();
   }

   void push(Event &&event)
   {
      // after stop events are written by the caller
      if (events.isClosed() || !events.add(event))
         write(event);
   }

   void exec()
   {
      while (auto event = events.get(-1))
         write(event.value());

      stream.flush();
   }

   void write(const Event &event)
   {
      tm local {};
      char date[32];
      std::ostringstream line;

      auto epoch = event.time.time_since_epoch();
      auto seconds = static_cast<time_t>(std::chrono::duration_cast<std::chrono::seconds>(epoch).count());
      auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(epoch).count() % 1000;

      localtime_r(&seconds, &local);

      strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

      line << date << "." << std::setw(3) << std::setfill('0') << millis << " "
           << std::setw(5) << std::setfill(' ') << std::left << tags[event.level]
           << " [" << event.thread << "] (" << event.logger << ") "
           << Format::format(event.format, event.params) << "\n";

      std::lock_guard lock(streamMutex);

      if (stream.good())
         stream << line.str();
   }

   void stop()
   {
      events.close();

      if (thread.joinable())
         thread.join();
   }
};

std::unique_ptr<Appender> appender;

std::mutex &registryMutex()
{
   static std::mutex instance;
   return instance;
}

std::map<std::string, std::shared_ptr<Logger>> &registry()
{
   static std::map<std::string, std::shared_ptr<Logger>> instance;
   return instance;
}

// levels set by target, applied to loggers created later
std::map<std::string, int> &targets()
{
   static std::map<std::string, int> instance;
   return instance;
}

// next dot separated name starting at position, position is moved past the dot
std::string nextName(const std::string &value, std::size_t &position)
{
   std::size_t dot = value.find('.', position);

   std::string result = value.substr(position, dot == std::string::npos ? std::string::npos : dot - position);

   position = dot == std::string::npos ? value.size() + 1 : dot + 1;

   return result;
}

}

Logger::Logger(std::string name, int level) : level(level), name(std::move(name))
{
}

void Logger::trace(const std::string &format, std::vector<Variant> params) const
{
   if (isEnabled(TRACE_LEVEL))
      push(TRACE_LEVEL, format, std::move(params));
}

void Logger::debug(const std::string &format, std::vector<Variant> params) const
{
   if (isEnabled(DEBUG_LEVEL))
      push(DEBUG_LEVEL, format, std::move(params));
}

void Logger::info(const std::string &format, std::vector<Variant> params) const
{
   if (isEnabled(INFO_LEVEL))
      push(INFO_LEVEL, format, std::move(params));
}

void Logger::warn(const std::string &format, std::vector<Variant> params) const
{
   if (isEnabled(WARN_LEVEL))
      push(WARN_LEVEL, format, std::move(params));
}

void Logger::error(const std::string &format, std::vector<Variant> params) const
{
   if (isEnabled(ERROR_LEVEL))
      push(ERROR_LEVEL, format, std::move(params));
}

void Logger::push(int value, const std::string &format, std::vector<Variant> &&params) const
{
   appender->push({value, name, format, std::move(params), std::this_thread::get_id(), std::chrono::system_clock::now()});
}

bool Logger::isEnabled(int value) const
{
   return appender && (level >= value || appender->level >= value);
}

const std::string &Logger::getName() const
{
   return name;
}

bool Logger::matches(const std::string &name, const std::string &target)
{
   std::size_t n = 0;
   std::size_t t = 0;

   while (t <= target.size())
   {
      // logger name shorter than target
      if (n > name.size())
         return false;

      std::string filter = nextName(target, t);
      std::string token = nextName(name, n);

      if (filter != "*" && filter != token)
         return false;
   }

   return true;
}

Logger *Logger::getLogger(const std::string &name, int level)
{
   std::lock_guard lock(registryMutex());

   auto it = registry().find(name);

   if (it != registry().end())
      return it->second.get();

   std::shared_ptr<Logger> logger(new Logger(name, level));

   for (const auto &[target, value]: targets())
   {
      if (matches(name, target))
         logger->level = value;
   }

   registry().emplace(name, logger);

   return logger.get();
}

int Logger::getRootLevel()
{
   return appender ? appender->level.load() : NONE_LEVEL;
}

void Logger::setRootLevel(int level)
{
   if (appender)
      appender->level = level;
}

void Logger::setLoggerLevel(const std::string &target, int level)
{
   std::lock_guard lock(registryMutex());

   targets()[target] = level;

   for (const auto &[name, logger]: registry())
   {
      if (matches(name, target))
         logger->level = level;
   }
}

int Logger::parseLevel(const std::string &name)
{
   std::string upper = name;

   std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });

   for (int i = NONE_LEVEL; i <= TRACE_LEVEL; i++)
   {
      if (upper == tags[i])
         return i;
   }

   return -1;
}

void Logger::init(std::ostream &stream, int level)
{
   appender = std::make_unique<Appender>(stream, level);
}

void Logger::shutdown()
{
   if (appender)
      appender->stop();
}

}
