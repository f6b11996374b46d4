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

#include <cmath>
#include <limits>
#include <set>

#include <rt/Format.h>
#include <rt/Logger.h>

#include <acq/AcquisitionSettings.h>
#include <acq/BufferPool.h>
#include <acq/ConfigValidator.h>

// bits per sample of ATS9360 boards
#define NOMINAL_BITS_PER_SAMPLE 12

namespace acq {

namespace {

double number(const json &params, const char *key)
{
   const json &value = params.at(key);

   if (!value.is_number())
      throw ConfigurationError(key, "a number");

   return value.get<double>();
}

unsigned long integer(const json &params, const char *key, unsigned long max = std::numeric_limits<unsigned long>::max())
{
   const json &value = params.at(key);

   if (value.is_number_unsigned())
   {
      if (value.get<unsigned long>() <= max)
         return value.get<unsigned long>();
   }
   else if (value.is_number_integer())
   {
      long long number = value.get<long long>();

      if (number >= 0 && static_cast<unsigned long>(number) <= max)
         return static_cast<unsigned long>(number);
   }
   else if (value.is_number_float())
   {
      double number = value.get<double>();

      // 2^64 and above does not fit in unsigned long
      if (number >= 0 && std::floor(number) == number && number < std::ldexp(1.0, std::numeric_limits<unsigned long>::digits))
      {
         if (static_cast<unsigned long>(number) <= max)
            return static_cast<unsigned long>(number);
      }
   }

   throw ConfigurationError(key, rt::Format::format("an integer between 0 and {}", {max}));
}

unsigned int count(const json &params, const char *key)
{
   return static_cast<unsigned int>(integer(params, key, std::numeric_limits<unsigned int>::max()));
}

std::string text(const json &params, const char *key)
{
   const json &value = params.at(key);

   if (!value.is_string())
      throw ConfigurationError(key, "a string");

   return value.get<std::string>();
}

const std::set<std::string> writableKeys = {
      "clockSource", "clockEdge", "sampleRate",
      "triggerRange", "triggerLevel", "triggerDelay", "triggerSlope",
      "acquisitionTime", "averaging", "recordsPerBuffer", "bufferPoolSize",
      "waitTimeoutMs", "timeoutPolicy", "maxWaitRetries", "armDelayMs"
};

// reported by get() but derived from other values
const std::set<std::string> derivedKeys = {
      "acquiredSamples", "buffersPerAcquisition", "bytesPerBuffer"
};

}

struct AcquisitionSettings::Impl
{
   rt::Logger *log = rt::Logger::getLogger("acq.AcquisitionSettings");

   AcquisitionConfig config;

   // acquisition time in ns, recomputed from rounded sample count
   double acquisitionTime;

   Impl() : acquisitionTime(ConfigValidator::acquisitionTime(config.samplesPerRecord, config.sampleRate))
   {
   }

   void setSampleRate(double value)
   {
      ConfigValidator::checkSampleRate(config.clockSource, value);

      // keep current number of samples at the new rate
      double time = ConfigValidator::acquisitionTime(config.samplesPerRecord, value);
      unsigned int samples = ConfigValidator::acquiredSamples(time, value);

      config.sampleRate = value;
      config.samplesPerRecord = samples;
      acquisitionTime = ConfigValidator::acquisitionTime(samples, value);
   }

   void setAcquisitionTime(double value)
   {
      unsigned int samples = ConfigValidator::acquiredSamples(value, config.sampleRate);

      config.samplesPerRecord = samples;
      acquisitionTime = ConfigValidator::acquisitionTime(samples, config.sampleRate);

      if (acquisitionTime != value)
         log->debug("acquisition time {.3} ns adjusted to {.3} ns, {} samples", {value, acquisitionTime, samples});
   }

   void setTrigger(double range, double level)
   {
      ConfigValidator::checkTriggerRange(range, level);
      ConfigValidator::checkTriggerLevel(level, range);

      config.triggerRange = range;
      config.triggerLevel = level;
   }

   void setClockSource(AcquisitionConfig::ClockSource value)
   {
      try
      {
         ConfigValidator::checkSampleRate(value, config.sampleRate);
      }
      catch (ConfigurationError &e)
      {
         throw ConfigurationError("clockSource", rt::Format::format("usable at current sample rate of {.0} MS/s, {}", {config.sampleRate, e.constraint()}));
      }

      config.clockSource = value;
   }

   // averaging and records per buffer are checked as a pair
   void setAveraging(unsigned long averaging, unsigned int recordsPerBuffer)
   {
      if (recordsPerBuffer == 0)
         throw ConfigurationError("recordsPerBuffer", "positive");

      config.buffersPerAcquisition = ConfigValidator::buffersPerAcquisition(averaging, recordsPerBuffer);
      config.recordsPerBuffer = recordsPerBuffer;
   }

   void apply(const json &params)
   {
      if (!params.is_object())
         throw ConfigurationError("parameters", "a JSON object");

      for (const auto &entry: params.items())
      {
         if (!writableKeys.count(entry.key()) && !derivedKeys.count(entry.key()))
            throw ConfigurationError(entry.key(), "a known parameter");
      }

      // clock settings first, acquisition time depends on them
      if (params.contains("clockSource"))
      {
         AcquisitionConfig::ClockSource source = ConfigValidator::parseClockSource(text(params, "clockSource"));

         // a new sample rate in the same document is checked against the new source
         if (params.contains("sampleRate"))
            config.clockSource = source;
         else
            setClockSource(source);
      }

      if (params.contains("clockEdge"))
         config.clockEdge = ConfigValidator::parseClockEdge(text(params, "clockEdge"));

      if (params.contains("sampleRate"))
         setSampleRate(number(params, "sampleRate"));

      // range and level are checked together when both are present
      if (params.contains("triggerRange") || params.contains("triggerLevel"))
      {
         double range = params.contains("triggerRange") ? number(params, "triggerRange") : config.triggerRange;
         double level = params.contains("triggerLevel") ? number(params, "triggerLevel") : config.triggerLevel;

         setTrigger(range, level);
      }

      if (params.contains("triggerDelay"))
      {
         double delay = number(params, "triggerDelay");

         ConfigValidator::checkTriggerDelay(delay);

         config.triggerDelay = delay;
      }

      if (params.contains("triggerSlope"))
         config.triggerSlope = ConfigValidator::parseTriggerSlope(text(params, "triggerSlope"));

      if (params.contains("acquisitionTime"))
         setAcquisitionTime(number(params, "acquisitionTime"));

      if (params.contains("recordsPerBuffer") || params.contains("averaging"))
      {
         unsigned int records = params.contains("recordsPerBuffer") ? count(params, "recordsPerBuffer") : config.recordsPerBuffer;
         unsigned long averaging = params.contains("averaging") ? integer(params, "averaging") : config.averaging();

         setAveraging(averaging, records);
      }

      if (params.contains("bufferPoolSize"))
      {
         unsigned int value = count(params, "bufferPoolSize");

         if (value == 0)
            throw ConfigurationError("bufferPoolSize", "positive");

         config.bufferPoolSize = value;
      }

      if (params.contains("waitTimeoutMs"))
      {
         unsigned int value = count(params, "waitTimeoutMs");

         if (value == 0)
            throw ConfigurationError("waitTimeoutMs", "positive");

         config.waitTimeoutMs = value;
      }

      if (params.contains("timeoutPolicy"))
         config.timeoutPolicy = ConfigValidator::parseTimeoutPolicy(text(params, "timeoutPolicy"));

      if (params.contains("maxWaitRetries"))
         config.maxWaitRetries = count(params, "maxWaitRetries");

      if (params.contains("armDelayMs"))
         config.armDelayMs = count(params, "armDelayMs");
   }
};

AcquisitionSettings::AcquisitionSettings() : impl(std::make_shared<Impl>())
{
}

AcquisitionSettings::AcquisitionSettings(const AcquisitionSettings &other) : impl(std::make_shared<Impl>(*other.impl))
{
}

AcquisitionSettings &AcquisitionSettings::operator=(const AcquisitionSettings &other)
{
   if (this == &other)
      return *this;

   impl = std::make_shared<Impl>(*other.impl);

   return *this;
}

json AcquisitionSettings::get() const
{
   return {
         {"clockSource", clockSource()},
         {"clockEdge", clockEdge()},
         {"sampleRate", sampleRate()},
         {"triggerRange", triggerRange()},
         {"triggerLevel", triggerLevel()},
         {"triggerDelay", triggerDelay()},
         {"triggerSlope", triggerSlope()},
         {"acquisitionTime", acquisitionTime()},
         {"averaging", averaging()},
         {"recordsPerBuffer", recordsPerBuffer()},
         {"bufferPoolSize", bufferPoolSize()},
         {"waitTimeoutMs", impl->config.waitTimeoutMs},
         {"timeoutPolicy", ConfigValidator::toString(impl->config.timeoutPolicy)},
         {"maxWaitRetries", impl->config.maxWaitRetries},
         {"armDelayMs", impl->config.armDelayMs},
         {"acquiredSamples", acquiredSamples()},
         {"buffersPerAcquisition", buffersPerAcquisition()},
         {"bytesPerBuffer", bytesPerBuffer()}
   };
}

void AcquisitionSettings::set(const json &params)
{
   Impl next(*impl);

   next.apply(params);

   *impl = next;

   impl->log->info("acquisition settings updated: {}", {params.dump()});
}

void AcquisitionSettings::validate(const json &params) const
{
   Impl next(*impl);

   next.apply(params);
}

std::shared_ptr<const AcquisitionConfig> AcquisitionSettings::config() const
{
   ConfigValidator::validate(impl->config);

   return std::make_shared<const AcquisitionConfig>(impl->config);
}

void AcquisitionSettings::setClockSource(const std::string &value)
{
   impl->setClockSource(ConfigValidator::parseClockSource(value));
}

void AcquisitionSettings::setClockEdge(const std::string &value)
{
   impl->config.clockEdge = ConfigValidator::parseClockEdge(value);
}

void AcquisitionSettings::setSampleRate(double value)
{
   impl->setSampleRate(value);
}

void AcquisitionSettings::setTriggerRange(double value)
{
   impl->setTrigger(value, impl->config.triggerLevel);
}

void AcquisitionSettings::setTriggerLevel(double value)
{
   impl->setTrigger(impl->config.triggerRange, value);
}

void AcquisitionSettings::setTriggerDelay(double value)
{
   ConfigValidator::checkTriggerDelay(value);

   impl->config.triggerDelay = value;
}

void AcquisitionSettings::setTriggerSlope(const std::string &value)
{
   impl->config.triggerSlope = ConfigValidator::parseTriggerSlope(value);
}

void AcquisitionSettings::setAcquisitionTime(double value)
{
   impl->setAcquisitionTime(value);
}

void AcquisitionSettings::setAveraging(unsigned long value)
{
   impl->setAveraging(value, impl->config.recordsPerBuffer);
}

void AcquisitionSettings::setRecordsPerBuffer(unsigned int value)
{
   impl->setAveraging(impl->config.averaging(), value);
}

void AcquisitionSettings::setBufferPoolSize(unsigned int value)
{
   if (value == 0)
      throw ConfigurationError("bufferPoolSize", "positive");

   impl->config.bufferPoolSize = value;
}

void AcquisitionSettings::setWaitTimeout(unsigned int value)
{
   if (value == 0)
      throw ConfigurationError("waitTimeoutMs", "positive");

   impl->config.waitTimeoutMs = value;
}

void AcquisitionSettings::setTimeoutPolicy(const std::string &value)
{
   impl->config.timeoutPolicy = ConfigValidator::parseTimeoutPolicy(value);
}

void AcquisitionSettings::setMaxWaitRetries(unsigned int value)
{
   impl->config.maxWaitRetries = value;
}

void AcquisitionSettings::setArmDelay(unsigned int value)
{
   impl->config.armDelayMs = value;
}

std::string AcquisitionSettings::clockSource() const
{
   return ConfigValidator::toString(impl->config.clockSource);
}

std::string AcquisitionSettings::clockEdge() const
{
   return ConfigValidator::toString(impl->config.clockEdge);
}

double AcquisitionSettings::sampleRate() const
{
   return impl->config.sampleRate;
}

double AcquisitionSettings::triggerRange() const
{
   return impl->config.triggerRange;
}

double AcquisitionSettings::triggerLevel() const
{
   return impl->config.triggerLevel;
}

double AcquisitionSettings::triggerDelay() const
{
   return impl->config.triggerDelay;
}

std::string AcquisitionSettings::triggerSlope() const
{
   return ConfigValidator::toString(impl->config.triggerSlope);
}

double AcquisitionSettings::acquisitionTime() const
{
   return impl->acquisitionTime;
}

unsigned long AcquisitionSettings::averaging() const
{
   return impl->config.averaging();
}

unsigned int AcquisitionSettings::acquiredSamples() const
{
   return impl->config.samplesPerRecord;
}

unsigned int AcquisitionSettings::recordsPerBuffer() const
{
   return impl->config.recordsPerBuffer;
}

unsigned int AcquisitionSettings::buffersPerAcquisition() const
{
   return impl->config.buffersPerAcquisition;
}

unsigned int AcquisitionSettings::bufferPoolSize() const
{
   return impl->config.bufferPoolSize;
}

std::size_t AcquisitionSettings::bytesPerBuffer() const
{
   return BufferPool::geometry(NOMINAL_BITS_PER_SAMPLE, impl->config.samplesPerRecord, impl->config.recordsPerBuffer).bytesPerBuffer;
}

}
