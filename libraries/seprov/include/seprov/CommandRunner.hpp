#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace seprov
{
   struct CommandResult
   {
      int         status = 0;
      std::string output;
   };

   // Runs an external program to completion. args[0] is the program,
   // searched on PATH when it does not contain a '/'.
   struct CommandRunner
   {
      virtual CommandResult run(const std::vector<std::string>& args) = 0;
      virtual ~CommandRunner() {}
   };

   // Captures stdout and stderr into a single stream. A program that
   // cannot be started reports status 127.
   struct ProcessRunner : CommandRunner
   {
      CommandResult run(const std::vector<std::string>& args) override;
   };

   // An external command that must succeed did not
   struct CommandError : std::runtime_error
   {
      CommandError(std::vector<std::string> args, int status, std::string output);
      std::vector<std::string> args;
      int                      status;
      std::string              output;
   };

   std::string formatCommand(const std::vector<std::string>& args);

   // Returns the output of the command. Throws CommandError if it
   // exits with a non-zero status, after logging the output.
   std::string checkedRun(CommandRunner& runner, const std::vector<std::string>& args);

}  // namespace seprov
