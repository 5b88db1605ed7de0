#pragma once

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace seprov
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

      // Installs a single stderr sink that drops records below min.
      // Replaces any sink installed by an earlier call.
      void configure(level min);
      // Reads "log-level"
      void configure(const boost::program_options::variables_map&);
      void configure_default();

      // Logs each line of output as a separate record, prefixed with "| "
      void log_output(level l, std::string_view output);

   }  // namespace loggers

#define SEPROV_LOG(logger, log_level) BOOST_LOG_SEV(logger, seprov::loggers::level::log_level)
}  // namespace seprov
