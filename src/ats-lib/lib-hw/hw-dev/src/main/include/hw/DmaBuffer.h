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

#ifndef HW_DMABUFFER_H
#define HW_DMABUFFER_H

#include <cstddef>
#include <memory>

namespace hw {

/*
 * Page aligned host memory region used as DMA transfer target, copies share the same region
 */
class DmaBuffer
{
      struct Impl;

   public:

      DmaBuffer();

      DmaBuffer(unsigned int id, std::size_t size);

      unsigned int id() const;

      void *data() const;

      std::size_t size() const;

      bool isValid() const;

      void release();

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
