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

#ifndef ACQ_ACQUISITIONCONFIG_H
#define ACQ_ACQUISITIONCONFIG_H

namespace acq {

/*
 * Validated acquisition parameters, shared read-only with all workers once the acquisition starts
 */
struct AcquisitionConfig
{
   enum ClockSource
   {
      InternalClock = 0,
      ExternalClock = 1
   };

   enum ClockEdge
   {
      RisingEdge = 0,
      FallingEdge = 1
   };

   enum TriggerSlope
   {
      PositiveSlope = 0,
      NegativeSlope = 1
   };

   enum TimeoutPolicy
   {
      AbortOnTimeout = 0,
      RetryOnTimeout = 1
   };

   // clock
   ClockSource clockSource = ExternalClock;
   ClockEdge clockEdge = RisingEdge;
   double sampleRate = 1800; // MS/s

   // trigger
   TriggerSlope triggerSlope = PositiveSlope;
   double triggerRange = 5; // V
   double triggerLevel = 0.5; // V
   double triggerDelay = 0; // ns

   // acquisition geometry
   unsigned int samplesPerRecord = 128 * 80;
   unsigned int recordsPerBuffer = 100;
   unsigned int buffersPerAcquisition = 200;
   unsigned int bufferPoolSize = 4;

   // transfer policy
   unsigned int waitTimeoutMs = 5000;
   TimeoutPolicy timeoutPolicy = AbortOnTimeout;
   unsigned int maxWaitRetries = 3;
   unsigned int armDelayMs = 500;

   // acquisition time in ns derived from sample count
   double acquisitionTime() const
   {
      return samplesPerRecord / sampleRate * 1e3;
   }

   unsigned long averaging() const
   {
      return static_cast<unsigned long>(buffersPerAcquisition) * recordsPerBuffer;
   }
};

}

#endif
