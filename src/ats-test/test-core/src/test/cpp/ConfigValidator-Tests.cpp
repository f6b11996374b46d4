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

#include <catch2/catch.hpp>

#include <acq/ConfigValidator.h>

namespace acq {

TEST_CASE("Trigger level code is centered at 128", "[trigger]")
{
   CHECK(ConfigValidator::triggerLevelCode(0, 5) == 128);
   CHECK(ConfigValidator::triggerLevelCode(0.5, 5) == 141);
   CHECK(ConfigValidator::triggerLevelCode(-0.5, 5) == 115);
   CHECK(ConfigValidator::triggerLevelCode(0.5, 1) == 192);
}

TEST_CASE("Trigger level code stays inside device range", "[trigger]")
{
   for (double range: ConfigValidator::triggerRanges())
   {
      for (int i = -99; i <= 99; i++)
      {
         unsigned int code = ConfigValidator::triggerLevelCode(range * i / 100.0, range);

         CHECK(code >= 1);
         CHECK(code <= 255);
      }
   }
}

TEST_CASE("Trigger level outside range is rejected", "[trigger]")
{
   CHECK_THROWS_AS(ConfigValidator::checkTriggerLevel(5, 5), ConfigurationError);
   CHECK_THROWS_AS(ConfigValidator::checkTriggerLevel(-2.5, 2.5), ConfigurationError);
   CHECK_NOTHROW(ConfigValidator::checkTriggerLevel(-0.9, 1));
}

TEST_CASE("Trigger range must be a device range above the level", "[trigger]")
{
   CHECK(ConfigValidator::triggerRangeCode(5) == hw::Board::TriggerRange5V);
   CHECK(ConfigValidator::triggerRangeCode(2.5) == hw::Board::TriggerRange2V5);
   CHECK(ConfigValidator::triggerRangeCode(1) == hw::Board::TriggerRange1V);

   CHECK_THROWS_AS(ConfigValidator::checkTriggerRange(2, 0.5), ConfigurationError);
   CHECK_THROWS_AS(ConfigValidator::checkTriggerRange(1, 1), ConfigurationError);
   CHECK_THROWS_AS(ConfigValidator::checkTriggerRange(1, 2), ConfigurationError);
   CHECK_NOTHROW(ConfigValidator::checkTriggerRange(1, 0.5));
   CHECK_THROWS_AS(ConfigValidator::checkTriggerRange(1, -1.5), ConfigurationError);
   CHECK_NOTHROW(ConfigValidator::checkTriggerRange(2.5, -1.5));
}

TEST_CASE("Trigger delay is converted to samples", "[trigger]")
{
   CHECK(ConfigValidator::triggerDelayCode(0, 1800) == 0);
   CHECK(ConfigValidator::triggerDelayCode(100, 1800) == 180);
   CHECK(ConfigValidator::triggerDelayCode(1000, 500) == 500);

   // 0.25 samples truncated, 0.75 samples rounded up
   CHECK(ConfigValidator::triggerDelayCode(0.25, 1000) == 0);
   CHECK(ConfigValidator::triggerDelayCode(0.75, 1000) == 1);

   CHECK_THROWS_AS(ConfigValidator::triggerDelayCode(-1, 1800), ConfigurationError);
}

TEST_CASE("Averaging must be a multiple of 100 and of records per buffer", "[averaging]")
{
   CHECK(ConfigValidator::buffersPerAcquisition(200, 100) == 2);
   CHECK(ConfigValidator::buffersPerAcquisition(20000, 100) == 200);
   CHECK(ConfigValidator::buffersPerAcquisition(300, 50) == 6);

   CHECK_THROWS_AS(ConfigValidator::buffersPerAcquisition(250, 100), ConfigurationError);
   CHECK_THROWS_AS(ConfigValidator::buffersPerAcquisition(0, 100), ConfigurationError);
   CHECK_THROWS_AS(ConfigValidator::buffersPerAcquisition(100, 0), ConfigurationError);
   CHECK_THROWS_AS(ConfigValidator::buffersPerAcquisition(100, 300), ConfigurationError);
}

TEST_CASE("Acquired samples are rounded to nearest multiple of 128", "[acquisition]")
{
   CHECK(ConfigValidator::acquiredSamples(200000, 1800) == 360064);
   CHECK(ConfigValidator::acquiredSamples(5688.89, 1800) == 10240);
   CHECK(ConfigValidator::acquiredSamples(166.67, 1800) == 256);

   unsigned int samples = ConfigValidator::acquiredSamples(200000, 1800);

   CHECK(samples % 128 == 0);
   CHECK(ConfigValidator::acquisitionTime(samples, 1800) == Approx(200035.56).epsilon(1e-6));
}

TEST_CASE("Acquisition time must exceed 256 samples", "[acquisition]")
{
   CHECK(ConfigValidator::minimumAcquisitionTime(1800) == Approx(142.222).epsilon(1e-4));

   CHECK_THROWS_AS(ConfigValidator::acquiredSamples(142.2, 1800), ConfigurationError);
   CHECK_THROWS_AS(ConfigValidator::acquiredSamples(0, 1800), ConfigurationError);
   CHECK_NOTHROW(ConfigValidator::acquiredSamples(143, 1800));
}

TEST_CASE("Internal clock accepts only table rates", "[clock]")
{
   CHECK(ConfigValidator::internalSampleRates().size() == 23);
   CHECK(ConfigValidator::internalRateCode(1800) == hw::Board::SampleRate1800MSPS);
   CHECK(ConfigValidator::internalRateCode(1e-3) == hw::Board::SampleRate1KSPS);
   CHECK(ConfigValidator::internalRateCode(0.1) == hw::Board::SampleRate100KSPS);

   CHECK_THROWS_AS(ConfigValidator::checkSampleRate(AcquisitionConfig::InternalClock, 1700), ConfigurationError);
   CHECK_NOTHROW(ConfigValidator::checkSampleRate(AcquisitionConfig::InternalClock, 500));
}

TEST_CASE("External clock accepts 300 to 1800 MS/s", "[clock]")
{
   CHECK_NOTHROW(ConfigValidator::checkSampleRate(AcquisitionConfig::ExternalClock, 300));
   CHECK_NOTHROW(ConfigValidator::checkSampleRate(AcquisitionConfig::ExternalClock, 1234.5));
   CHECK_NOTHROW(ConfigValidator::checkSampleRate(AcquisitionConfig::ExternalClock, 1800));

   CHECK_THROWS_AS(ConfigValidator::checkSampleRate(AcquisitionConfig::ExternalClock, 299.9), ConfigurationError);
   CHECK_THROWS_AS(ConfigValidator::checkSampleRate(AcquisitionConfig::ExternalClock, 1800.1), ConfigurationError);

   CHECK(ConfigValidator::clockRate(AcquisitionConfig::ExternalClock, 1800) == 1800000000u);
   CHECK(ConfigValidator::clockDecimation(AcquisitionConfig::ExternalClock) == 1);
   CHECK(ConfigValidator::clockDecimation(AcquisitionConfig::InternalClock) == 0);
}

TEST_CASE("Option names are parsed without case", "[options]")
{
   CHECK(ConfigValidator::parseClockSource("Internal") == AcquisitionConfig::InternalClock);
   CHECK(ConfigValidator::parseClockEdge("FALLING") == AcquisitionConfig::FallingEdge);
   CHECK(ConfigValidator::parseTriggerSlope("negative") == AcquisitionConfig::NegativeSlope);
   CHECK(ConfigValidator::parseTimeoutPolicy("Retry") == AcquisitionConfig::RetryOnTimeout);

   try
   {
      ConfigValidator::parseClockSource("pll");
      FAIL("clock source accepted");
   }
   catch (ConfigurationError &e)
   {
      CHECK(e.field() == "clockSource");
   }
}

TEST_CASE("Default configuration is valid", "[validate]")
{
   AcquisitionConfig config;

   CHECK_NOTHROW(ConfigValidator::validate(config));
   CHECK(config.averaging() == 20000);
}

TEST_CASE("Invalid configuration records are rejected", "[validate]")
{
   AcquisitionConfig config;

   SECTION("unaligned record")
   {
      config.samplesPerRecord = 1000;
      CHECK_THROWS_AS(ConfigValidator::validate(config), ConfigurationError);
   }

   SECTION("averaging not multiple of 100")
   {
      config.recordsPerBuffer = 25;
      config.buffersPerAcquisition = 3;
      CHECK_THROWS_AS(ConfigValidator::validate(config), ConfigurationError);
   }

   SECTION("empty pool")
   {
      config.bufferPoolSize = 0;
      CHECK_THROWS_AS(ConfigValidator::validate(config), ConfigurationError);
   }

   SECTION("internal clock with non table rate")
   {
      config.clockSource = AcquisitionConfig::InternalClock;
      config.sampleRate = 1750;
      CHECK_THROWS_AS(ConfigValidator::validate(config), ConfigurationError);
   }
}

}
