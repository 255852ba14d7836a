#include <storybase/log.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/function.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/make_shared.hpp>
#include <boost/program_options/value_semantic.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace storybase::loggers
{
   BOOST_LOG_GLOBAL_LOGGER_DEFAULT(generic, common_logger)

   namespace
   {
      BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", level)

      using console_sink =
          boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
      using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;

      std::mutex                      config_mutex;
      boost::shared_ptr<file_sink>    current_file;

      template <typename S, typename T>
      void format_timestamp(S& os, const T& timestamp)
      {
         auto date = std::chrono::floor<std::chrono::days>(timestamp);
         auto ymd  = std::chrono::year_month_day(date);
         auto time = std::chrono::hh_mm_ss(
             std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - date));
         os << std::setfill('0');
         os << std::setw(4) << (int)ymd.year() << '-' << std::setw(2) << (unsigned)ymd.month()
            << '-' << std::setw(2) << (unsigned)ymd.day();
         os << 'T' << std::setw(2) << time.hours().count() << ':' << std::setw(2)
            << time.minutes().count() << ':' << std::setw(2) << time.seconds().count() << '.'
            << std::setw(3) << time.subseconds().count() << 'Z';
         os << std::setfill(' ');
      }

      void format_record(const boost::log::record_view& rec, boost::log::formatting_ostream& os)
      {
         if (auto ts =
                 boost::log::extract<std::chrono::system_clock::time_point>("TimeStamp", rec))
         {
            format_timestamp(os, *ts);
            os << ' ';
         }
         if (auto sev = rec[severity])
            os << '[' << *sev << ']';
         if (auto service = rec[keyword::Service])
            os << " [" << service->str() << ']';
         os << ": " << rec[boost::log::expressions::smessage];
      }

      void add_timestamp()
      {
         static std::once_flag flag;
         std::call_once(flag,
                        []
                        {
                           boost::log::core::get()->add_global_attribute(
                               "TimeStamp", boost::log::attributes::make_function(
                                                [] { return std::chrono::system_clock::now(); }));
                        });
      }
   }  // namespace

   void add_options(boost::program_options::options_description& desc)
   {
      namespace po = boost::program_options;
      auto opt     = desc.add_options();
      opt("log-level", po::value<level>()->default_value(level::info)->value_name("level"),
          "Minimum level written to the console: debug, info, notice, warning, error, critical");
      opt("log-file", po::value<std::string>()->default_value("")->value_name("path"),
          "Also write every log record to this file");
   }

   void configure(const boost::program_options::variables_map& map)
   {
      level       consoleLevel = level::info;
      std::string filename;
      if (map.count("log-level"))
         consoleLevel = map["log-level"].as<level>();
      if (map.count("log-file"))
         filename = map["log-file"].as<std::string>();
      configure(consoleLevel, filename);
   }

   void configure(level consoleLevel, std::string_view filename)
   {
      add_timestamp();
      std::lock_guard lock{config_mutex};
      auto            core = boost::log::core::get();
      core->remove_all_sinks();
      current_file.reset();

      auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
      backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      backend->auto_flush(true);
      auto console = boost::make_shared<console_sink>(backend);
      console->set_formatter(&format_record);
      console->set_filter(severity >= consoleLevel);
      core->add_sink(console);

      if (!filename.empty())
      {
         auto fileBackend = boost::make_shared<boost::log::sinks::text_file_backend>(
             boost::log::keywords::file_name = std::string(filename),
             boost::log::keywords::open_mode = std::ios_base::out | std::ios_base::app,
             boost::log::keywords::auto_flush = true);
         current_file = boost::make_shared<file_sink>(fileBackend);
         current_file->set_formatter(&format_record);
         core->add_sink(current_file);
      }
   }

   std::ostream& operator<<(std::ostream& os, const level& l)
   {
      switch (l)
      {
         case level::debug:
            os << "debug";
            break;
         case level::info:
            os << "info";
            break;
         case level::notice:
            os << "notice";
            break;
         case level::warning:
            os << "warning";
            break;
         case level::error:
            os << "error";
            break;
         case level::critical:
            os << "critical";
            break;
      }
      return os;
   }

   std::istream& operator>>(std::istream& is, level& l)
   {
      std::string s;
      if (is >> s)
      {
         if (s == "debug")
         {
            l = level::debug;
         }
         else if (s == "info")
         {
            l = level::info;
         }
         else if (s == "notice")
         {
            l = level::notice;
         }
         else if (s == "warning")
         {
            l = level::warning;
         }
         else if (s == "error")
         {
            l = level::error;
         }
         else if (s == "critical")
         {
            l = level::critical;
         }
         else
         {
            throw std::runtime_error("not a valid log level: \"" + s + "\"");
         }
      }
      return is;
   }
}  // namespace storybase::loggers
