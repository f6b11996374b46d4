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

#include <cstdlib>
#include <cstring>
#include <new>

#include <hw/DmaBuffer.h>

#define DMA_ALIGNMENT 4096

namespace hw {

struct DmaBuffer::Impl
{
   unsigned int id;
   std::size_t size;
   void *data;

   Impl(unsigned int id, std::size_t size) : id(id), size(size), data(nullptr)
   {
      if (size > 0)
      {
         // aligned_alloc requires size multiple of alignment
         std::size_t length = (size + DMA_ALIGNMENT - 1) / DMA_ALIGNMENT * DMA_ALIGNMENT;

         if (!(data = std::aligned_alloc(DMA_ALIGNMENT, length)))
            throw std::bad_alloc();

         std::memset(data, 0, length);
      }
   }

   ~Impl()
   {
      release();
   }

   void release()
   {
      std::free(data);

      data = nullptr;
      size = 0;
   }
};

DmaBuffer::DmaBuffer() : impl(std::make_shared<Impl>(0, 0))
{
}

DmaBuffer::DmaBuffer(unsigned int id, std::size_t size) : impl(std::make_shared<Impl>(id, size))
{
}

unsigned int DmaBuffer::id() const
{
   return impl->id;
}

void *DmaBuffer::data() const
{
   return impl->data;
}

std::size_t DmaBuffer::size() const
{
   return impl->size;
}

bool DmaBuffer::isValid() const
{
   return impl->data;
}

void DmaBuffer::release()
{
   impl->release();
}

}
