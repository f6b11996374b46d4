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

#ifndef ACQ_ACQUISITIONSETTINGS_H
#define ACQ_ACQUISITIONSETTINGS_H

#include <cstddef>
#include <memory>
#include <string>

#include <acq/AcquisitionConfig.h>
#include <acq/Configurable.h>

namespace acq {

/*
 * User facing acquisition parameters, every change is checked against the current state
 */
class AcquisitionSettings : public Configurable
{
      struct Impl;

   public:

      AcquisitionSettings();

      AcquisitionSettings(const AcquisitionSettings &other);

      AcquisitionSettings &operator=(const AcquisitionSettings &other);

      json get() const override;

      void set(const json &params) override;

      void validate(const json &params) const override;

      // immutable snapshot for a new acquisition
      std::shared_ptr<const AcquisitionConfig> config() const;

      void setClockSource(const std::string &value);

      void setClockEdge(const std::string &value);

      // MS/s, acquisition time is derived again from current sample count
      void setSampleRate(double value);

      // V
      void setTriggerRange(double value);

      // V
      void setTriggerLevel(double value);

      // ns
      void setTriggerDelay(double value);

      void setTriggerSlope(const std::string &value);

      // ns, rounded to the nearest reachable value
      void setAcquisitionTime(double value);

      void setAveraging(unsigned long value);

      void setRecordsPerBuffer(unsigned int value);

      void setBufferPoolSize(unsigned int value);

      void setWaitTimeout(unsigned int value);

      void setTimeoutPolicy(const std::string &value);

      void setMaxWaitRetries(unsigned int value);

      void setArmDelay(unsigned int value);

      std::string clockSource() const;

      std::string clockEdge() const;

      double sampleRate() const;

      double triggerRange() const;

      double triggerLevel() const;

      double triggerDelay() const;

      std::string triggerSlope() const;

      double acquisitionTime() const;

      unsigned long averaging() const;

      unsigned int acquiredSamples() const;

      unsigned int recordsPerBuffer() const;

      unsigned int buffersPerAcquisition() const;

      unsigned int bufferPoolSize() const;

      // bytes per DMA buffer for a 12 bit board
      std::size_t bytesPerBuffer() const;

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
