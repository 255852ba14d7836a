#pragma once

#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <storybase/AccountNumber.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace storybase
{
   namespace loggers
   {
      enum class level : std::uint32_t
      {
         debug,
         info,
         notice,
         warning,
         error,
         critical,
      };
      std::ostream& operator<<(std::ostream&, const level&);
      std::istream& operator>>(std::istream& is, level& l);
      using common_logger = boost::log::sources::severity_logger_mt<level>;
      BOOST_LOG_GLOBAL_LOGGER(generic, common_logger)

      namespace keyword
      {
         BOOST_LOG_ATTRIBUTE_KEYWORD(Service, "Service", storybase::AccountNumber)
      }  // namespace keyword

      /// Adds the `log-level` and `log-file` options to `desc`
      void add_options(boost::program_options::options_description& desc);

      // Installs a console sink, and a file sink if `log-file` is set.
      // Replaces any sinks installed by a previous call.
      void configure(const boost::program_options::variables_map&);
      void configure(level consoleLevel, std::string_view filename = {});
   }  // namespace loggers

#define STORYBASE_LOG(logger, log_level) \
   BOOST_LOG_SEV(logger, storybase::loggers::level::log_level)
#define STORYBASE_LOG_SERVICE(logger, log_level, service) \
   STORYBASE_LOG(logger, log_level)                       \
       << ::boost::log::add_value(::storybase::loggers::keyword::Service, (service))
}  // namespace storybase
