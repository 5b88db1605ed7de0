#include <seprov/log.hpp>

#include <boost/log/attributes/function.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace seprov::loggers
{
   BOOST_LOG_GLOBAL_LOGGER_DEFAULT(generic, common_logger)

   namespace
   {
      BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", level)
      BOOST_LOG_ATTRIBUTE_KEYWORD(timestamp, "TimeStamp", std::chrono::system_clock::time_point)

      using console_sink =
          boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

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
         os << '[';
         if (auto t = rec[timestamp])
         {
            format_timestamp(os, *t);
         }
         os << "] [";
         if (auto sev = rec[severity])
         {
            os << *sev;
         }
         os << "]: " << rec[boost::log::expressions::smessage];
      }

      struct log_config
      {
         static log_config& instance()
         {
            static log_config result;
            return result;
         }
         void set_level(level min)
         {
            std::lock_guard l{mutex};
            auto            core = boost::log::core::get();
            if (sink)
            {
               core->remove_sink(sink);
            }
            auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
            backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            backend->auto_flush(true);
            sink = boost::make_shared<console_sink>(backend);
            sink->set_formatter(&format_record);
            sink->set_filter(severity >= min);
            core->add_sink(sink);
         }

        private:
         log_config()
         {
            boost::log::core::get()->add_global_attribute(
                "TimeStamp", boost::log::attributes::function<std::chrono::system_clock::time_point>(
                                 [] { return std::chrono::system_clock::now(); }));
         }
         std::mutex                      mutex;
         boost::shared_ptr<console_sink> sink;
      };

   }  // namespace

   void configure(level min)
   {
      log_config::instance().set_level(min);
   }

   void configure(const boost::program_options::variables_map& map)
   {
      if (auto iter = map.find("log-level"); iter != map.end())
      {
         configure(iter->second.as<level>());
      }
      else
      {
         configure_default();
      }
   }

   void configure_default()
   {
      configure(level::info);
   }

   void log_output(level l, std::string_view output)
   {
      while (!output.empty())
      {
         auto pos  = output.find('\n');
         auto line = output.substr(0, pos);
         BOOST_LOG_SEV(generic::get(), l) << "| " << line;
         if (pos == std::string_view::npos)
         {
            break;
         }
         output.remove_prefix(pos + 1);
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

}  // namespace seprov::loggers
