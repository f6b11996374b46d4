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

#include <stdexcept>

#include <acq/ControlState.h>

namespace acq {

ControlState::ControlState(unsigned long targetBuffers) : target(targetBuffers)
{
}

void ControlState::requestStop()
{
   measuring.store(false, std::memory_order_release);
}

bool ControlState::isMeasuring() const
{
   return measuring.load(std::memory_order_acquire);
}

void ControlState::setCompletedBuffers(unsigned long value)
{
   completed.store(value, std::memory_order_release);
}

void ControlState::markAcquisitionSafe(unsigned long measuredBuffers, const std::string &message, std::exception_ptr failure)
{
   if (safeAcquisition.load(std::memory_order_acquire))
      throw std::logic_error("acquisition already marked safe");

   measured = measuredBuffers;
   text = message;
   error = std::move(failure);

   safeAcquisition.store(true, std::memory_order_release);
}

void ControlState::markTreatmentSafe(unsigned int channel)
{
   if (channel > 1)
      throw std::out_of_range("invalid treatment channel " + std::to_string(channel));

   safeTreatment[channel].store(true, std::memory_order_release);
}

unsigned long ControlState::targetBuffers() const
{
   return target;
}

unsigned long ControlState::completedBuffers() const
{
   return completed.load(std::memory_order_acquire);
}

unsigned long ControlState::measuredBuffers() const
{
   return measured;
}

const std::string &ControlState::message() const
{
   return text;
}

std::exception_ptr ControlState::failure() const
{
   return error;
}

bool ControlState::isAcquisitionSafe() const
{
   return safeAcquisition.load(std::memory_order_acquire);
}

bool ControlState::isTreatmentSafe(unsigned int channel) const
{
   if (channel > 1)
      throw std::out_of_range("invalid treatment channel " + std::to_string(channel));

   return safeTreatment[channel].load(std::memory_order_acquire);
}

bool ControlState::isClosed() const
{
   return isAcquisitionSafe() && isTreatmentSafe(0) && isTreatmentSafe(1);
}

}
