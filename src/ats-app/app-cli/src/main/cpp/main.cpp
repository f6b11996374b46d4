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

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <vector>

#include <rt/Logger.h>

#include <hw/SimulatedBoard.h>

#ifdef ATS_ALAZAR_ENABLED
#include <hw/alazar/AlazarBoard.h>
#endif

#include <acq/AcquisitionSettings.h>
#include <acq/ChannelConsumer.h>
#include <acq/ConfigurationError.h>
#include <acq/LifecycleCoordinator.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// ADC resolution of ATS9360 boards
#define ADC_BITS 12

// full scale of analog inputs in volts
#define INPUT_RANGE 0.4

/*
 * Averages all records of one channel into a single trace
 */
class AveragingConsumer : public acq::ChannelConsumer
{
   public:

      explicit AveragingConsumer(const Context &context) : ChannelConsumer(context.channel == 0 ? "AveragingConsumerA" : "AveragingConsumerB", context), trace(context.config->samplesPerRecord, 0.0)
      {
      }

      const std::vector<double> &average() const
      {
         return trace;
      }

      double mean() const
      {
         double sum = 0;

         for (double value: trace)
            sum += value;

         return trace.empty() ? 0 : sum / trace.size();
      }

   protected:

      void process(const hw::SampleBuffer &buffer) override
      {
         double sum = 0;

         for (unsigned int r = 0; r < buffer.records(); r++)
         {
            std::size_t offset = static_cast<std::size_t>(r) * buffer.samplesPerRecord();

            for (unsigned int s = 0; s < buffer.samplesPerRecord() && s < trace.size(); s++)
            {
               double value = voltage(buffer, offset + s);

               trace[s] += value;
               sum += value;
            }
         }

         records += buffer.records();

         // mean voltage of this buffer
         if (buffer.elements() > 0)
            publish(buffer.sequence(), {sum / buffer.elements()});
      }

      void finish() override
      {
         if (records > 0)
         {
            for (double &value: trace)
               value /= records;
         }

         log->info("channel {} averaged {} records, mean {.6} V", {channel(), records, mean()});
      }

   private:

      static double voltage(const hw::SampleBuffer &buffer, std::size_t index)
      {
         double center;
         unsigned int code;

         if (buffer.sampleSize() == 1)
         {
            code = buffer.as<unsigned char>()[index];
            center = 127.5;
         }
         else
         {
            code = buffer.as<unsigned short>()[index] >> (16 - ADC_BITS);
            center = ((1 << ADC_BITS) - 1) / 2.0;
         }

         return INPUT_RANGE * (code - center) / center;
      }

      std::vector<double> trace;

      unsigned long records = 0;
};

struct Main
{
   rt::Logger *log = rt::Logger::getLogger("app.Main");

   std::mutex mutex;
   std::condition_variable sync;
   std::atomic_bool terminate = false;

   acq::AcquisitionSettings settings;

   std::vector<std::shared_ptr<AveragingConsumer>> consumers;

   Main()
   {
      log->info("ATS streamer, dual channel NPT acquisition");
   }

   void finish()
   {
      // stop main loop
      terminate = true;

      // notify
      sync.notify_all();
   }

   std::shared_ptr<hw::Board> createBoard(const std::string &type)
   {
      if (type == "sim")
      {
         auto board = std::make_shared<hw::SimulatedBoard>(ADC_BITS);

         // 100 kHz trigger rate
         board->setTriggerPeriod(std::chrono::microseconds(10));

         return board;
      }

#ifdef ATS_ALAZAR_ENABLED
      if (type == "alazar")
         return std::make_shared<hw::AlazarBoard>(1, 1);
#endif

      return nullptr;
   }

   bool loadConfig(const std::string &file)
   {
      std::ifstream stream(file);

      if (!stream.is_open())
      {
         fprintf(stderr, "Unable to open configuration file %s\n", file.c_str());
         return false;
      }

      try
      {
         settings.set(json::parse(stream));
      }
      catch (json::exception &e)
      {
         fprintf(stderr, "Invalid configuration file %s: %s\n", file.c_str(), e.what());
         return false;
      }
      catch (acq::ConfigurationError &e)
      {
         fprintf(stderr, "Invalid configuration parameter %s: %s\n", e.field().c_str(), e.what());
         return false;
      }

      return true;
   }

   static bool setLoggerLevel(const std::string &value)
   {
      std::size_t split = value.find('=');

      if (split == std::string::npos || split == 0)
         return false;

      int level = rt::Logger::parseLevel(value.substr(split + 1));

      if (level < 0)
         return false;

      rt::Logger::setLoggerLevel(value.substr(0, split), level);

      return true;
   }

   int run(int argc, char *argv[])
   {
      int opt;
      int nsecs = -1;
      bool transferInfo = false;
      char *endptr = nullptr;
      std::string boardType = "sim";

      while ((opt = getopt(argc, argv, "vil:c:b:t:")) != -1)
      {
         switch (opt)
         {
            // enable verbose mode
            case 'v':
            {
               if (rt::Logger::getRootLevel() < rt::Logger::INFO_LEVEL)
                  rt::Logger::setRootLevel(rt::Logger::INFO_LEVEL);
               else if (rt::Logger::getRootLevel() < rt::Logger::TRACE_LEVEL)
                  rt::Logger::setRootLevel(rt::Logger::getRootLevel() + 1);

               break;
            }

               // print transfer information
            case 'i':
            {
               transferInfo = true;
               break;
            }

               // logger level, as name=level
            case 'l':
            {
               if (!setLoggerLevel(optarg))
               {
                  printf("Invalid value for 'l' argument\n");
                  showUsage();
                  return -1;
               }

               break;
            }

               // load configuration
            case 'c':
            {
               if (!loadConfig(optarg))
                  return -1;

               break;
            }

               // board type
            case 'b':
            {
               boardType = optarg;
               break;
            }

               // limit running time
            case 't':
            {
               nsecs = strtol(optarg, &endptr, 10);

               if (endptr == optarg)
               {
                  printf("Invalid value for 't' argument\n");
                  showUsage();
                  return -1;
               }

               break;
            }

            default: /* '?' */
               printf("Unknown option '%c'\n", (char) opt);
               showUsage();
               return -1;
         }
      }

      auto board = createBoard(boardType);

      if (!board)
      {
         printf("Unsupported board type '%s'\n", boardType.c_str());
         showUsage();
         return -1;
      }

      std::shared_ptr<const acq::AcquisitionConfig> config;

      try
      {
         config = settings.config();
      }
      catch (acq::ConfigurationError &e)
      {
         fprintf(stderr, "Invalid configuration parameter %s: %s\n", e.field().c_str(), e.what());
         return -1;
      }

      fprintf(stdout, "%s\n", settings.get().dump(3).c_str());

      acq::LifecycleCoordinator coordinator(board, [this](const acq::ChannelConsumer::Context &context) {
         auto consumer = std::make_shared<AveragingConsumer>(context);
         consumers.push_back(consumer);
         return consumer;
      });

      // get start time
      auto start = std::chrono::steady_clock::now();

      try
      {
         coordinator.configure(*config);
         coordinator.start();
      }
      catch (std::exception &e)
      {
         fprintf(stderr, "Acquisition start failed: %s\n", e.what());
         return -1;
      }

      // main loop until capture finished
      while (!terminate)
      {
         std::unique_lock<std::mutex> lock(mutex);

         // wait for signal or timeout
         sync.wait_for(lock, std::chrono::milliseconds(500));

         // acquisition finished by itself
         if (coordinator.controlState()->isAcquisitionSafe())
            break;

         std::optional<acq::LifecycleCoordinator::Measurement> last;

         // keep only most recent buffer result
         while (auto next = coordinator.measurement(0))
            last = std::move(next);

         if (last)
            fprintf(stdout, "Completed %.2f%%, buffer %lu mean A %.6f V, B %.6f V\n", coordinator.pollProgress(), last->channelA.sequence, last->channelA.values[0], last->channelB.values[0]);
         else
            fprintf(stdout, "Completed %.2f%%\n", coordinator.pollProgress());

         // wait until time limit reached and exit
         if (nsecs > 0 && (std::chrono::steady_clock::now() - start) > std::chrono::seconds(nsecs))
         {
            fprintf(stdout, "Finish capture, time limit reached!\n");
            break;
         }

         // flush console output
         fflush(stdout);
      }

      try
      {
         if (auto message = coordinator.close(transferInfo))
            fprintf(stdout, "%s", message->c_str());
      }
      catch (std::exception &e)
      {
         fprintf(stderr, "Acquisition failed: %s\n", e.what());
         return -1;
      }

      for (const auto &consumer: consumers)
         fprintf(stdout, "Channel %c mean %.6f V\n", consumer->channel() == 0 ? 'A' : 'B', consumer->mean());

      return 0;
   }

   static void showUsage()
   {
      printf("Usage: [-v] [-i] [-l logger=level] [-c config.json] [-b sim|alazar] [-t nsecs]\n");
      printf("\tv: verbose mode, write logging information to stderr\n");
      printf("\ti: print transfer information when acquisition finish\n");
      printf("\tl: logger level, for example acq.*=debug\n");
      printf("\tc: load acquisition parameters from JSON file\n");
      printf("\tb: board type, simulated board by default\n");
      printf("\tt: stop capture after number of seconds\n");
   }

} *app;

void intHandler(int sig)
{
   fprintf(stderr, "Terminate on signal %d\n", sig);
   app->finish();
}

int main(int argc, char *argv[])
{
   // send logging events to stderr
   rt::Logger::init(std::cerr);

   // disable logging at all (can be enabled with -v option)
   rt::Logger::setRootLevel(rt::Logger::NONE_LEVEL);

   // register signals handlers
   signal(SIGINT, intHandler);
   signal(SIGTERM, intHandler);

   // create main object
   Main main;

   // set global pointer for signal handlers
   app = &main;

   // and run
   int result = main.run(argc, argv);

   rt::Logger::shutdown();

   return result;
}
