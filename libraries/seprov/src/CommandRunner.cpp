#include <seprov/CommandRunner.hpp>

#include <seprov/log.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exception.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>
#include <boost/process/search_path.hpp>

#include <iterator>

using namespace seprov;

namespace bp = boost::process;

CommandResult ProcessRunner::run(const std::vector<std::string>& args)
{
   if (args.empty())
   {
      throw std::invalid_argument("empty command");
   }
   boost::filesystem::path exe;
   if (args[0].find('/') == std::string::npos)
   {
      exe = bp::search_path(args[0]);
      if (exe.empty())
      {
         return {127, args[0] + ": command not found\n"};
      }
   }
   else
   {
      exe = args[0];
   }
   try
   {
      bp::ipstream out;
      bp::child    child(exe, bp::args(std::vector<std::string>(args.begin() + 1, args.end())),
                         (bp::std_out & bp::std_err) > out, bp::std_in < bp::null);
      std::string  output{std::istreambuf_iterator<char>(out), std::istreambuf_iterator<char>()};
      child.wait();
      return {child.exit_code(), std::move(output)};
   }
   catch (bp::process_error& e)
   {
      return {127, args[0] + ": " + e.what() + "\n"};
   }
}

CommandError::CommandError(std::vector<std::string> args, int status, std::string output)
    : std::runtime_error(formatCommand(args) + " exited with status " + std::to_string(status)),
      args(std::move(args)),
      status(status),
      output(std::move(output))
{
}

std::string seprov::formatCommand(const std::vector<std::string>& args)
{
   std::string result;
   for (const auto& arg : args)
   {
      if (!result.empty())
      {
         result += ' ';
      }
      if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos)
      {
         result += '\'';
         result += arg;
         result += '\'';
      }
      else
      {
         result += arg;
      }
   }
   return result;
}

std::string seprov::checkedRun(CommandRunner& runner, const std::vector<std::string>& args)
{
   SEPROV_LOG(loggers::generic::get(), debug) << "Running " << formatCommand(args);
   auto result = runner.run(args);
   if (result.status != 0)
   {
      SEPROV_LOG(loggers::generic::get(), error)
          << formatCommand(args) << " failed with status " << result.status << ":";
      loggers::log_output(loggers::level::error, result.output);
      throw CommandError(args, result.status, std::move(result.output));
   }
   return std::move(result.output);
}
