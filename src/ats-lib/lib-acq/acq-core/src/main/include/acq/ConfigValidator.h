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

#ifndef ACQ_CONFIGVALIDATOR_H
#define ACQ_CONFIGVALIDATOR_H

#include <string>
#include <vector>

#include <hw/Board.h>

#include <acq/AcquisitionConfig.h>
#include <acq/ConfigurationError.h>

namespace acq {

/*
 * Translation of user level parameters into device codes, all methods throw ConfigurationError
 * when the value is not accepted
 */
class ConfigValidator
{
   public:

      // internal clock sample rates in MS/s
      static const std::vector<double> &internalSampleRates();

      // allowed external trigger ranges in V
      static const std::vector<double> &triggerRanges();

      static AcquisitionConfig::ClockSource parseClockSource(const std::string &value);

      static AcquisitionConfig::ClockEdge parseClockEdge(const std::string &value);

      static AcquisitionConfig::TriggerSlope parseTriggerSlope(const std::string &value);

      static AcquisitionConfig::TimeoutPolicy parseTimeoutPolicy(const std::string &value);

      static std::string toString(AcquisitionConfig::ClockSource value);

      static std::string toString(AcquisitionConfig::ClockEdge value);

      static std::string toString(AcquisitionConfig::TriggerSlope value);

      static std::string toString(AcquisitionConfig::TimeoutPolicy value);

      static void checkSampleRate(AcquisitionConfig::ClockSource source, double sampleRate);

      // device rate code for internal clock
      static hw::Board::SampleRate internalRateCode(double sampleRate);

      // value passed as rate argument of capture clock call, code or Hz
      static unsigned int clockRate(AcquisitionConfig::ClockSource source, double sampleRate);

      static unsigned int clockDecimation(AcquisitionConfig::ClockSource source);

      static void checkTriggerLevel(double level, double range);

      static void checkTriggerRange(double range, double level);

      static void checkTriggerDelay(double delay);

      static hw::Board::TriggerRange triggerRangeCode(double range);

      // round(128 + 127 * level / range)
      static unsigned int triggerLevelCode(double level, double range);

      // trigger delay in samples, delay in ns and sample rate in MS/s
      static unsigned int triggerDelayCode(double delay, double sampleRate);

      // minimum acquisition time in ns for the given sample rate
      static double minimumAcquisitionTime(double sampleRate);

      // samples for acquisition time rounded to nearest multiple of 128
      static unsigned int acquiredSamples(double time, double sampleRate);

      static double acquisitionTime(unsigned int samples, double sampleRate);

      static unsigned int buffersPerAcquisition(unsigned long averaging, unsigned int recordsPerBuffer);

      // full check of a configuration record
      static void validate(const AcquisitionConfig &config);
};

}

#endif
