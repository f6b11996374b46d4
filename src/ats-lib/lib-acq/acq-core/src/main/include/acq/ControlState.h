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

#ifndef ACQ_CONTROLSTATE_H
#define ACQ_CONTROLSTATE_H

#include <atomic>
#include <exception>
#include <string>

namespace acq {

/*
 * State shared by the control context, the acquisition loop and the two consumers. Every field
 * has a single writer, message, measured buffers and failure are published by the release of
 * the acquisition safe flag and must only be read once isAcquisitionSafe() returns true.
 */
class ControlState
{
   public:

      explicit ControlState(unsigned long targetBuffers);

      // control context
      void requestStop();

      bool isMeasuring() const;

      // acquisition loop
      void setCompletedBuffers(unsigned long value);

      void markAcquisitionSafe(unsigned long measuredBuffers, const std::string &message, std::exception_ptr failure);

      // consumers, channel 0 or 1
      void markTreatmentSafe(unsigned int channel);

      unsigned long targetBuffers() const;

      unsigned long completedBuffers() const;

      unsigned long measuredBuffers() const;

      const std::string &message() const;

      std::exception_ptr failure() const;

      bool isAcquisitionSafe() const;

      bool isTreatmentSafe(unsigned int channel) const;

      // acquisition and both treatments finished
      bool isClosed() const;

   private:

      const unsigned long target;

      std::atomic<bool> measuring {true};

      std::atomic<bool> safeAcquisition {false};

      std::atomic<bool> safeTreatment[2] {{false}, {false}};

      std::atomic<unsigned long> completed {0};

      unsigned long measured = 0;

      std::string text;

      std::exception_ptr error;
};

}

#endif
