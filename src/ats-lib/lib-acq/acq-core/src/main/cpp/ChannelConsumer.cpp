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

#include <utility>

#include <acq/ChannelConsumer.h>

// queue poll interval in milliseconds
#define QUEUE_POLL_INTERVAL 100

namespace acq {

ChannelConsumer::ChannelConsumer(const std::string &name, Context context) : Worker(name), log(rt::Logger::getLogger("acq." + name)), context(std::move(context))
{
}

unsigned int ChannelConsumer::channel() const
{
   return context.channel;
}

unsigned long ChannelConsumer::processedBuffers() const
{
   return processed;
}

bool ChannelConsumer::loop()
{
   if (auto buffer = context.queue->get(QUEUE_POLL_INTERVAL))
   {
      try
      {
         process(buffer.value());
      }
      catch (std::exception &e)
      {
         log->error("treatment of buffer {} failed: {}", {buffer->sequence(), std::string(e.what())});
      }

      processed++;

      return true;
   }

   // closed by producer and nothing pending
   return !context.queue->isDrained();
}

void ChannelConsumer::stop()
{
   try
   {
      finish();
   }
   catch (std::exception &e)
   {
      log->error("treatment finish failed: {}", {std::string(e.what())});
   }

   log->info("channel {} treatment finished after {} buffers", {context.channel, processed.load()});

   // no more results for measurement()
   if (context.results)
      context.results->close();

   context.control->markTreatmentSafe(context.channel);
}

void ChannelConsumer::finish()
{
}

void ChannelConsumer::publish(unsigned long sequence, std::vector<double> values)
{
   if (!context.results)
      return;

   if (!context.results->add({context.channel, sequence, std::move(values)}))
      log->warn("result of buffer {} discarded, treatment already closed", {sequence});
}

const AcquisitionConfig &ChannelConsumer::config() const
{
   return *context.config;
}

}
