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

#include <acq/AcquisitionSettings.h>
#include <acq/ConfigurationError.h>

namespace acq {

TEST_CASE("Default settings describe a 12 bit dual channel capture", "[settings]")
{
   AcquisitionSettings settings;

   CHECK(settings.clockSource() == "external");
   CHECK(settings.clockEdge() == "rising");
   CHECK(settings.sampleRate() == 1800);
   CHECK(settings.triggerSlope() == "positive");
   CHECK(settings.acquiredSamples() == 10240);
   CHECK(settings.recordsPerBuffer() == 100);
   CHECK(settings.averaging() == 20000);
   CHECK(settings.buffersPerAcquisition() == 200);
   CHECK(settings.bufferPoolSize() == 4);
   CHECK(settings.bytesPerBuffer() == 4096000);
}

TEST_CASE("Acquisition time is adjusted to reachable sample count", "[settings]")
{
   AcquisitionSettings settings;

   settings.setAcquisitionTime(200000);

   CHECK(settings.acquiredSamples() == 360064);
   CHECK(settings.acquisitionTime() != 200000);
   CHECK(settings.acquisitionTime() == Approx(200035.56).epsilon(1e-6));

   CHECK_THROWS_AS(settings.setAcquisitionTime(100), ConfigurationError);
   CHECK_THROWS_AS(settings.setAcquisitionTime(1e20), ConfigurationError);
   CHECK(settings.acquiredSamples() == 360064);
}

TEST_CASE("Averaging updates buffers per acquisition", "[settings]")
{
   AcquisitionSettings settings;

   settings.setAveraging(200);
   CHECK(settings.buffersPerAcquisition() == 2);

   CHECK_THROWS_AS(settings.setAveraging(250), ConfigurationError);
   CHECK(settings.averaging() == 200);

   settings.setAveraging(20000);
   settings.setRecordsPerBuffer(50);
   CHECK(settings.buffersPerAcquisition() == 400);
   CHECK(settings.averaging() == 20000);

   CHECK_THROWS_AS(settings.setRecordsPerBuffer(0), ConfigurationError);
   CHECK_THROWS_AS(settings.setRecordsPerBuffer(300), ConfigurationError);
   CHECK(settings.recordsPerBuffer() == 50);
}

TEST_CASE("Sample rate change keeps sample count", "[settings]")
{
   AcquisitionSettings settings;

   settings.setSampleRate(900);

   CHECK(settings.acquiredSamples() == 10240);
   CHECK(settings.acquisitionTime() == Approx(11377.78).epsilon(1e-6));

   CHECK_THROWS_AS(settings.setSampleRate(200), ConfigurationError);
   CHECK(settings.sampleRate() == 900);

   // 900 MS/s is not an internal clock rate
   CHECK_THROWS_AS(settings.setClockSource("internal"), ConfigurationError);
   CHECK(settings.clockSource() == "external");

   settings.setSampleRate(1000);
   settings.setClockSource("internal");
   CHECK(settings.sampleRate() == 1000);
   CHECK_THROWS_AS(settings.setSampleRate(1700), ConfigurationError);
}

TEST_CASE("Trigger level must stay inside trigger range", "[settings]")
{
   AcquisitionSettings settings;

   settings.setTriggerRange(1);
   CHECK(settings.triggerRange() == 1);

   CHECK_THROWS_AS(settings.setTriggerLevel(1.5), ConfigurationError);
   CHECK(settings.triggerLevel() == 0.5);

   settings.setTriggerLevel(-0.75);
   CHECK_THROWS_AS(settings.setTriggerRange(3), ConfigurationError);
   CHECK(settings.triggerRange() == 1);

   CHECK_THROWS_AS(settings.setTriggerDelay(-10), ConfigurationError);
}

TEST_CASE("Parameters are applied from JSON", "[settings][json]")
{
   AcquisitionSettings settings;

   settings.set({
         {"clockSource", "internal"},
         {"sampleRate", 500},
         {"triggerRange", 2.5},
         {"triggerLevel", 2},
         {"triggerSlope", "negative"},
         {"recordsPerBuffer", 50},
         {"averaging", 1000},
         {"timeoutPolicy", "retry"},
         {"maxWaitRetries", 5}
   });

   CHECK(settings.clockSource() == "internal");
   CHECK(settings.sampleRate() == 500);
   CHECK(settings.triggerRange() == 2.5);
   CHECK(settings.triggerLevel() == 2);
   CHECK(settings.triggerSlope() == "negative");
   CHECK(settings.buffersPerAcquisition() == 20);

   auto config = settings.config();

   CHECK(config->clockSource == AcquisitionConfig::InternalClock);
   CHECK(config->timeoutPolicy == AcquisitionConfig::RetryOnTimeout);
   CHECK(config->maxWaitRetries == 5);

   json values = settings.get();

   CHECK(values["sampleRate"] == 500);
   CHECK(values["buffersPerAcquisition"] == 20);
   CHECK(values["timeoutPolicy"] == "retry");
}

TEST_CASE("Records per buffer and averaging are checked as a pair", "[settings][json]")
{
   AcquisitionSettings settings;

   // 20000 is not a multiple of 300, 600 is
   settings.set({{"recordsPerBuffer", 300}, {"averaging", 600}});

   CHECK(settings.recordsPerBuffer() == 300);
   CHECK(settings.averaging() == 600);
   CHECK(settings.buffersPerAcquisition() == 2);

   settings.set({{"averaging", 1200}, {"recordsPerBuffer", 400}});

   CHECK(settings.buffersPerAcquisition() == 3);

   try
   {
      settings.set({{"recordsPerBuffer", 500}, {"averaging", 1200}});
      FAIL("averaging not multiple of records per buffer accepted");
   }
   catch (ConfigurationError &e)
   {
      CHECK(e.field() == "averaging");
   }

   CHECK(settings.recordsPerBuffer() == 400);
   CHECK(settings.averaging() == 1200);
}

TEST_CASE("Clock source change is checked against current sample rate", "[settings][json]")
{
   AcquisitionSettings settings;

   settings.set({{"sampleRate", 1234}});

   try
   {
      settings.set({{"clockSource", "internal"}});
      FAIL("internal clock accepted at 1234 MS/s");
   }
   catch (ConfigurationError &e)
   {
      CHECK(e.field() == "clockSource");
   }

   CHECK_THROWS_AS(settings.validate({{"clockSource", "internal"}}), ConfigurationError);
   CHECK(settings.clockSource() == "external");
   CHECK_NOTHROW(settings.config());

   // rate given in the same document is checked against the new source
   CHECK_THROWS_AS(settings.set({{"clockSource", "internal"}, {"sampleRate", 1300}}), ConfigurationError);

   settings.set({{"clockSource", "internal"}, {"sampleRate", 1200}});

   CHECK(settings.clockSource() == "internal");
   CHECK(settings.sampleRate() == 1200);

   // internal 1 MS/s is out of external clock range
   settings.set({{"sampleRate", 1}});

   CHECK_THROWS_AS(settings.set({{"clockSource", "external"}}), ConfigurationError);
   CHECK(settings.clockSource() == "internal");
}

TEST_CASE("Integer parameters out of range are rejected", "[settings][json]")
{
   AcquisitionSettings settings;

   json before = settings.get();

   for (const char *key: {"recordsPerBuffer", "bufferPoolSize", "waitTimeoutMs", "maxWaitRetries", "armDelayMs"})
   {
      try
      {
         settings.set({{key, 4294967396ul}});
         FAIL("value above 32 bits accepted");
      }
      catch (ConfigurationError &e)
      {
         CHECK(e.field() == key);
      }

      CHECK_THROWS_AS(settings.set({{key, 1e30}}), ConfigurationError);
      CHECK_THROWS_AS(settings.set({{key, -1}}), ConfigurationError);
      CHECK_THROWS_AS(settings.set({{key, 2.5}}), ConfigurationError);
   }

   CHECK_THROWS_AS(settings.set({{"averaging", 1e30}}), ConfigurationError);

   // more buffers than an unsigned int can count
   CHECK_THROWS_AS(settings.set({{"recordsPerBuffer", 1}, {"averaging", 100000000000ul}}), ConfigurationError);

   CHECK(settings.get() == before);

   settings.set({{"waitTimeoutMs", 4294967295ul}, {"armDelayMs", 250.0}});

   CHECK(settings.get()["waitTimeoutMs"] == 4294967295ul);
   CHECK(settings.get()["armDelayMs"] == 250);
}

TEST_CASE("Rejected JSON leaves settings unchanged", "[settings][json]")
{
   AcquisitionSettings settings;

   json before = settings.get();

   CHECK_THROWS_AS(settings.set({{"averaging", 1000}, {"triggerLevel", 10}}), ConfigurationError);
   CHECK_THROWS_AS(settings.set({{"averaging", 1000}, {"bufferPoolSize", 0}}), ConfigurationError);
   CHECK_THROWS_AS(settings.set({{"sampleRate", "fast"}}), ConfigurationError);
   CHECK_THROWS_AS(settings.set(json::array({1, 2})), ConfigurationError);

   CHECK(settings.get() == before);
}

TEST_CASE("Unknown JSON parameters are reported by name", "[settings][json]")
{
   AcquisitionSettings settings;

   try
   {
      settings.set({{"gain", 3}});
      FAIL("unknown parameter accepted");
   }
   catch (ConfigurationError &e)
   {
      CHECK(e.field() == "gain");
   }
}

TEST_CASE("Settings read back from get can be applied again", "[settings][json]")
{
   AcquisitionSettings settings;

   settings.setAcquisitionTime(20000);

   json values = settings.get();

   AcquisitionSettings other;

   other.set(values);

   CHECK(other.get() == values);
}

TEST_CASE("Validation does not modify settings", "[settings][json]")
{
   AcquisitionSettings settings;

   CHECK_NOTHROW(settings.validate({{"averaging", 1000}}));
   CHECK(settings.averaging() == 20000);

   CHECK_THROWS_AS(settings.validate({{"averaging", 1001}}), ConfigurationError);
}

TEST_CASE("Configuration snapshot is independent from later changes", "[settings]")
{
   AcquisitionSettings settings;

   auto config = settings.config();

   settings.setAveraging(100);

   CHECK(config->buffersPerAcquisition == 200);
   CHECK(settings.config()->buffersPerAcquisition == 1);

   AcquisitionSettings copy(settings);

   copy.setAveraging(200);

   CHECK(settings.averaging() == 100);
   CHECK(copy.averaging() == 200);
}

}
