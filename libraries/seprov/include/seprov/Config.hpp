#pragma once

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace seprov
{
   // Missing or invalid configuration, including system metadata
   struct ConfigError : std::runtime_error
   {
      using std::runtime_error::runtime_error;
   };

   struct ProvisionConfig
   {
      std::string              repoId;
      std::chrono::seconds     interval{300};
      std::string              pin          = "87654321";
      std::string              soPin        = "12345678";
      std::filesystem::path    sotaDir      = "/var/sota";
      std::vector<std::string> handlers     = {"lmp"};
      std::string              pacmanType   = "ostree+compose_apps";
      std::string              pkcs11Module = "/usr/lib/libckteec.so.0";
      std::string              tokenLabel   = "aktualizr";
      std::string              seTool       = "fio-se05x-cli";
      std::string              pkcs11Tool   = "pkcs11-tool";
      std::string              agent        = "nxp_iot_agent_demo";
      std::filesystem::path    osRelease    = "/etc/os-release";
   };

   // Options that may come from the command line, the environment, or a config file
   boost::program_options::options_description configOptions();

   // configOptions() plus the options that only make sense on the command line
   boost::program_options::options_description commandLineOptions();

   // Stores the command line, the environment and the file named by --config
   // into vm, in that order of precedence. Values already in vm are kept
   // when parsing fails. Throws ConfigError.
   void parseOptions(const std::vector<std::string>&                    args,
                     const boost::program_options::options_description& desc,
                     boost::program_options::variables_map&             vm);

   // Maps an environment variable to the option it sets. Returns an
   // empty string for variables that are not configuration.
   std::string optionFromEnvironment(const std::string& name);

   // Throws ConfigError if a required option is missing or a value is invalid
   ProvisionConfig loadConfig(const boost::program_options::variables_map& vm);

   // Splits a comma-separated list, dropping blanks and repeated names
   std::vector<std::string> parseHandlerList(std::string_view s);

   // Returns the quoted value of a KEY="value" line of the os-release file.
   std::string readReleaseValue(const std::filesystem::path& path, std::string_view key);

}  // namespace seprov
