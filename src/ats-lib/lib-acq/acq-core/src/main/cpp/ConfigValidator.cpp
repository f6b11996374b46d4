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
#include <cctype>
#include <cmath>
#include <limits>

#include <rt/Format.h>

#include <acq/ConfigValidator.h>

#define SAMPLES_ALIGNMENT 128
#define MINIMUM_SAMPLES 256
#define AVERAGING_MULTIPLE 100

#define EXTERNAL_RATE_MIN 300.0
#define EXTERNAL_RATE_MAX 1800.0

namespace acq {

namespace {

struct InternalRate
{
   double rate;
   hw::Board::SampleRate code;
};

const InternalRate internalRates[] = {
      {1e-3, hw::Board::SampleRate1KSPS},
      {2e-3, hw::Board::SampleRate2KSPS},
      {5e-3, hw::Board::SampleRate5KSPS},
      {10e-3, hw::Board::SampleRate10KSPS},
      {20e-3, hw::Board::SampleRate20KSPS},
      {50e-3, hw::Board::SampleRate50KSPS},
      {100e-3, hw::Board::SampleRate100KSPS},
      {200e-3, hw::Board::SampleRate200KSPS},
      {500e-3, hw::Board::SampleRate500KSPS},
      {1, hw::Board::SampleRate1MSPS},
      {2, hw::Board::SampleRate2MSPS},
      {5, hw::Board::SampleRate5MSPS},
      {10, hw::Board::SampleRate10MSPS},
      {20, hw::Board::SampleRate20MSPS},
      {50, hw::Board::SampleRate50MSPS},
      {100, hw::Board::SampleRate100MSPS},
      {200, hw::Board::SampleRate200MSPS},
      {500, hw::Board::SampleRate500MSPS},
      {800, hw::Board::SampleRate800MSPS},
      {1000, hw::Board::SampleRate1000MSPS},
      {1200, hw::Board::SampleRate1200MSPS},
      {1500, hw::Board::SampleRate1500MSPS},
      {1800, hw::Board::SampleRate1800MSPS}
};

// table keys are compared with relative tolerance, 0.1 and 1e-1 must match
bool sameRate(double a, double b)
{
   return std::fabs(a - b) <= 1e-9 * std::max(std::fabs(a), std::fabs(b));
}

std::string lower(std::string value)
{
   std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });

   return value;
}

}

const std::vector<double> &ConfigValidator::internalSampleRates()
{
   static std::vector<double> rates = [] {
      std::vector<double> result;

      for (const auto &entry: internalRates)
         result.push_back(entry.rate);

      return result;
   }();

   return rates;
}

const std::vector<double> &ConfigValidator::triggerRanges()
{
   static std::vector<double> ranges = {5, 2.5, 1};

   return ranges;
}

AcquisitionConfig::ClockSource ConfigValidator::parseClockSource(const std::string &value)
{
   std::string name = lower(value);

   if (name == "internal")
      return AcquisitionConfig::InternalClock;

   if (name == "external")
      return AcquisitionConfig::ExternalClock;

   throw ConfigurationError("clockSource", "\"internal\" or \"external\"");
}

AcquisitionConfig::ClockEdge ConfigValidator::parseClockEdge(const std::string &value)
{
   std::string name = lower(value);

   if (name == "rising")
      return AcquisitionConfig::RisingEdge;

   if (name == "falling")
      return AcquisitionConfig::FallingEdge;

   throw ConfigurationError("clockEdge", "\"rising\" or \"falling\"");
}

AcquisitionConfig::TriggerSlope ConfigValidator::parseTriggerSlope(const std::string &value)
{
   std::string name = lower(value);

   if (name == "positive")
      return AcquisitionConfig::PositiveSlope;

   if (name == "negative")
      return AcquisitionConfig::NegativeSlope;

   throw ConfigurationError("triggerSlope", "\"positive\" or \"negative\"");
}

AcquisitionConfig::TimeoutPolicy ConfigValidator::parseTimeoutPolicy(const std::string &value)
{
   std::string name = lower(value);

   if (name == "abort")
      return AcquisitionConfig::AbortOnTimeout;

   if (name == "retry")
      return AcquisitionConfig::RetryOnTimeout;

   throw ConfigurationError("timeoutPolicy", "\"abort\" or \"retry\"");
}

std::string ConfigValidator::toString(AcquisitionConfig::ClockSource value)
{
   return value == AcquisitionConfig::InternalClock ? "internal" : "external";
}

std::string ConfigValidator::toString(AcquisitionConfig::ClockEdge value)
{
   return value == AcquisitionConfig::RisingEdge ? "rising" : "falling";
}

std::string ConfigValidator::toString(AcquisitionConfig::TriggerSlope value)
{
   return value == AcquisitionConfig::PositiveSlope ? "positive" : "negative";
}

std::string ConfigValidator::toString(AcquisitionConfig::TimeoutPolicy value)
{
   return value == AcquisitionConfig::AbortOnTimeout ? "abort" : "retry";
}

void ConfigValidator::checkSampleRate(AcquisitionConfig::ClockSource source, double sampleRate)
{
   switch (source)
   {
      case AcquisitionConfig::InternalClock:
      {
         internalRateCode(sampleRate);
         break;
      }

      case AcquisitionConfig::ExternalClock:
      {
         if (!(sampleRate >= EXTERNAL_RATE_MIN && sampleRate <= EXTERNAL_RATE_MAX))
            throw ConfigurationError("sampleRate", "between 300 and 1800 MS/s with external clock");

         break;
      }

      default:
         throw ConfigurationError("clockSource", "\"internal\" or \"external\"");
   }
}

hw::Board::SampleRate ConfigValidator::internalRateCode(double sampleRate)
{
   for (const auto &entry: internalRates)
   {
      if (sameRate(entry.rate, sampleRate))
         return entry.code;
   }

   throw ConfigurationError("sampleRate", "one of the internal clock rates (1e-3 to 1800 MS/s)");
}

unsigned int ConfigValidator::clockRate(AcquisitionConfig::ClockSource source, double sampleRate)
{
   checkSampleRate(source, sampleRate);

   if (source == AcquisitionConfig::InternalClock)
      return internalRateCode(sampleRate);

   return static_cast<unsigned int>(std::round(sampleRate * 1e6));
}

unsigned int ConfigValidator::clockDecimation(AcquisitionConfig::ClockSource source)
{
   switch (source)
   {
      case AcquisitionConfig::InternalClock:
         return 0;

      case AcquisitionConfig::ExternalClock:
         return 1;

      default:
         throw ConfigurationError("clockSource", "\"internal\" or \"external\"");
   }
}

void ConfigValidator::checkTriggerLevel(double level, double range)
{
   if (!(level < range && level > -range))
      throw ConfigurationError("triggerLevel", rt::Format::format("inside the trigger range of {.1} V", {range}));
}

void ConfigValidator::checkTriggerRange(double range, double level)
{
   triggerRangeCode(range);

   if (!(range > std::fabs(level)))
      throw ConfigurationError("triggerRange", rt::Format::format("greater than the trigger level of {.3} V", {level}));
}

void ConfigValidator::checkTriggerDelay(double delay)
{
   if (!(delay >= 0))
      throw ConfigurationError("triggerDelay", "non negative");
}

hw::Board::TriggerRange ConfigValidator::triggerRangeCode(double range)
{
   if (range == 5)
      return hw::Board::TriggerRange5V;

   if (range == 2.5)
      return hw::Board::TriggerRange2V5;

   if (range == 1)
      return hw::Board::TriggerRange1V;

   throw ConfigurationError("triggerRange", "one of 5, 2.5 or 1 V");
}

unsigned int ConfigValidator::triggerLevelCode(double level, double range)
{
   checkTriggerLevel(level, range);

   return static_cast<unsigned int>(std::round(128.0 + 127.0 * level / range));
}

unsigned int ConfigValidator::triggerDelayCode(double delay, double sampleRate)
{
   checkTriggerDelay(delay);

   // truncation after adding 0.5, same as device reference code
   return static_cast<unsigned int>(std::floor(delay * 1e-9 * sampleRate * 1e6 + 0.5));
}

double ConfigValidator::minimumAcquisitionTime(double sampleRate)
{
   return MINIMUM_SAMPLES / sampleRate * 1e3;
}

unsigned int ConfigValidator::acquiredSamples(double time, double sampleRate)
{
   if (!(time > minimumAcquisitionTime(sampleRate)))
      throw ConfigurationError("acquisitionTime", rt::Format::format("longer than {.2} ns", {minimumAcquisitionTime(sampleRate)}));

   double samples = std::round(sampleRate * time * 1e-3);

   if (!(samples <= std::numeric_limits<unsigned int>::max() - SAMPLES_ALIGNMENT))
      throw ConfigurationError("acquisitionTime", rt::Format::format("shorter than {.2} ns", {acquisitionTime(std::numeric_limits<unsigned int>::max() - SAMPLES_ALIGNMENT, sampleRate)}));

   auto result = static_cast<unsigned int>(std::round(samples / SAMPLES_ALIGNMENT) * SAMPLES_ALIGNMENT);

   return std::max<unsigned int>(result, SAMPLES_ALIGNMENT);
}

double ConfigValidator::acquisitionTime(unsigned int samples, double sampleRate)
{
   return samples / sampleRate * 1e3;
}

unsigned int ConfigValidator::buffersPerAcquisition(unsigned long averaging, unsigned int recordsPerBuffer)
{
   if (averaging == 0 || averaging % AVERAGING_MULTIPLE)
      throw ConfigurationError("averaging", "a positive multiple of 100");

   if (recordsPerBuffer == 0)
      throw ConfigurationError("recordsPerBuffer", "positive");

   if (averaging % recordsPerBuffer)
      throw ConfigurationError("averaging", rt::Format::format("a multiple of {} records per buffer", {recordsPerBuffer}));

   if (averaging / recordsPerBuffer > std::numeric_limits<unsigned int>::max())
      throw ConfigurationError("averaging", rt::Format::format("at most {} buffers of {} records", {std::numeric_limits<unsigned int>::max(), recordsPerBuffer}));

   return static_cast<unsigned int>(averaging / recordsPerBuffer);
}

void ConfigValidator::validate(const AcquisitionConfig &config)
{
   clockDecimation(config.clockSource);

   checkSampleRate(config.clockSource, config.sampleRate);

   if (config.clockEdge != AcquisitionConfig::RisingEdge && config.clockEdge != AcquisitionConfig::FallingEdge)
      throw ConfigurationError("clockEdge", "\"rising\" or \"falling\"");

   if (config.triggerSlope != AcquisitionConfig::PositiveSlope && config.triggerSlope != AcquisitionConfig::NegativeSlope)
      throw ConfigurationError("triggerSlope", "\"positive\" or \"negative\"");

   checkTriggerRange(config.triggerRange, config.triggerLevel);

   checkTriggerLevel(config.triggerLevel, config.triggerRange);

   checkTriggerDelay(config.triggerDelay);

   if (config.samplesPerRecord < SAMPLES_ALIGNMENT || config.samplesPerRecord % SAMPLES_ALIGNMENT)
      throw ConfigurationError("samplesPerRecord", "a positive multiple of 128");

   if (config.recordsPerBuffer == 0)
      throw ConfigurationError("recordsPerBuffer", "positive");

   if (config.buffersPerAcquisition == 0)
      throw ConfigurationError("buffersPerAcquisition", "positive");

   buffersPerAcquisition(config.averaging(), config.recordsPerBuffer);

   if (config.bufferPoolSize == 0)
      throw ConfigurationError("bufferPoolSize", "positive");

   if (config.waitTimeoutMs == 0)
      throw ConfigurationError("waitTimeoutMs", "positive");
}

}
