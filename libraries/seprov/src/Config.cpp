#include <seprov/Config.hpp>

#include <seprov/log.hpp>

#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <utility>

using namespace seprov;

namespace po = boost::program_options;

namespace
{
   constexpr std::string_view ws(" \t\r\n");

   std::string_view trim(std::string_view s)
   {
      auto start = s.find_first_not_of(ws);
      if (start == std::string::npos)
      {
         return "";
      }
      else
      {
         auto end = s.find_last_not_of(ws) + 1;
         return s.substr(start, end - start);
      }
   }

   const std::pair<std::string_view, std::string_view> environmentOptions[] = {
       {"REPOID", "repo-id"},
       {"DAEMON_INTERVAL", "interval"},
       {"PIN", "pin"},
       {"SO_PIN", "so-pin"},
       {"SOTA_DIR", "sota-dir"},
       {"PROVISION_HANDLERS", "handlers"},
       {"PACMAN_TYPE", "pacman-type"},
       {"PKCS11_MODULE", "pkcs11-module"},
       {"TOKEN_LABEL", "token-label"},
       {"SE_TOOL", "se-tool"},
       {"PKCS11_TOOL", "pkcs11-tool"},
       {"PROVISION_AGENT", "agent"},
       {"OS_RELEASE", "os-release"},
       {"LOG_LEVEL", "log-level"},
   };

   template <typename T>
   void get(const po::variables_map& vm, const char* name, T& out)
   {
      if (auto iter = vm.find(name); iter != vm.end() && !iter->second.empty())
      {
         out = iter->second.as<T>();
      }
   }
}  // namespace

po::options_description seprov::configOptions()
{
   ProvisionConfig         defaults;
   po::options_description desc("Provisioning");
   auto                    opt = desc.add_options();
   opt("repo-id", po::value<std::string>()->value_name("id"),
       "Repository identifier used to build the update server URLs (required)");
   opt("interval",
       po::value<std::int64_t>()
           ->default_value(static_cast<std::int64_t>(defaults.interval.count()))
           ->value_name("seconds"),
       "Time to wait after a failed provisioning agent check-in");
   opt("pin", po::value<std::string>()->default_value(defaults.pin), "PKCS #11 user PIN");
   opt("so-pin", po::value<std::string>()->default_value(defaults.soPin),
       "PKCS #11 security officer PIN");
   opt("sota-dir",
       po::value<std::string>()->default_value(defaults.sotaDir.native())->value_name("path"),
       "Storage directory of the update client");
   opt("handlers", po::value<std::string>()->default_value("lmp")->value_name("names"),
       "Comma-separated list of identities to provision");
   opt("pacman-type", po::value<std::string>()->default_value(defaults.pacmanType),
       "Package manager type written to the update client configuration");
   opt("pkcs11-module",
       po::value<std::string>()->default_value(defaults.pkcs11Module)->value_name("path"),
       "Path to the PKCS #11 module");
   opt("token-label", po::value<std::string>()->default_value(defaults.tokenLabel),
       "Label of the PKCS #11 token");
   opt("se-tool", po::value<std::string>()->default_value(defaults.seTool)->value_name("path"),
       "Secure element command line tool");
   opt("pkcs11-tool",
       po::value<std::string>()->default_value(defaults.pkcs11Tool)->value_name("path"),
       "PKCS #11 command line tool");
   opt("agent", po::value<std::string>()->default_value(defaults.agent)->value_name("path"),
       "Remote provisioning agent");
   opt("os-release",
       po::value<std::string>()->default_value(defaults.osRelease.native())->value_name("path"),
       "System release metadata");
   opt("log-level",
       po::value<loggers::level>()->default_value(loggers::level::info)->value_name("level"),
       "Minimum severity of log messages (debug, info, notice, warning, error, critical)");
   return desc;
}

po::options_description seprov::commandLineOptions()
{
   po::options_description desc("seprovd");
   desc.add(configOptions());
   // These should be usable on the command line and shown in help
   auto opt = desc.add_options();
   opt("config,c", po::value<std::string>()->value_name("path"), "Read options from an INI file");
   opt("list-handlers", "List the identities that can be provisioned");
   opt("help,h", "Show this message");
   opt("version,V", "Print version information");
   return desc;
}

void seprov::parseOptions(const std::vector<std::string>& args,
                          const po::options_description&  desc,
                          po::variables_map&              vm)
{
   auto common_opts = configOptions();
   try
   {
      // The first value stored wins: command line, then environment, then config file
      po::store(po::command_line_parser(args).options(desc).run(), vm);
      po::store(po::parse_environment(common_opts, &optionFromEnvironment), vm);
      if (vm.count("config"))
      {
         auto          path = vm["config"].as<std::string>();
         std::ifstream in(path);
         if (!in)
         {
            throw ConfigError("Cannot read " + path);
         }
         po::store(po::parse_config_file(in, common_opts), vm);
      }
      po::notify(vm);
   }
   catch (ConfigError&)
   {
      throw;
   }
   catch (po::error& e)
   {
      throw ConfigError(e.what());
   }
   catch (std::runtime_error& e)
   {
      // An unknown --log-level name
      throw ConfigError(e.what());
   }
}

std::string seprov::optionFromEnvironment(const std::string& name)
{
   for (const auto& [env, option] : environmentOptions)
   {
      if (name == env)
      {
         return std::string(option);
      }
   }
   return "";
}

ProvisionConfig seprov::loadConfig(const po::variables_map& vm)
{
   ProvisionConfig result;
   get(vm, "repo-id", result.repoId);
   if (result.repoId.empty())
   {
      throw ConfigError("repo-id is required (set REPOID or --repo-id)");
   }
   auto interval = static_cast<std::int64_t>(result.interval.count());
   get(vm, "interval", interval);
   if (interval <= 0)
   {
      throw ConfigError("interval must be positive");
   }
   result.interval = std::chrono::seconds(interval);
   get(vm, "pin", result.pin);
   get(vm, "so-pin", result.soPin);
   std::string sotaDir;
   get(vm, "sota-dir", sotaDir);
   if (!sotaDir.empty())
   {
      result.sotaDir = sotaDir;
   }
   if (vm.count("handlers"))
   {
      result.handlers = parseHandlerList(vm["handlers"].as<std::string>());
   }
   get(vm, "pacman-type", result.pacmanType);
   get(vm, "pkcs11-module", result.pkcs11Module);
   get(vm, "token-label", result.tokenLabel);
   get(vm, "se-tool", result.seTool);
   get(vm, "pkcs11-tool", result.pkcs11Tool);
   get(vm, "agent", result.agent);
   std::string osRelease;
   get(vm, "os-release", osRelease);
   if (!osRelease.empty())
   {
      result.osRelease = osRelease;
   }
   return result;
}

std::vector<std::string> seprov::parseHandlerList(std::string_view s)
{
   std::vector<std::string> result;
   while (true)
   {
      auto pos  = s.find(',');
      auto name = trim(s.substr(0, pos));
      if (!name.empty() && std::find(result.begin(), result.end(), name) == result.end())
      {
         result.emplace_back(name);
      }
      if (pos == std::string_view::npos)
      {
         break;
      }
      s.remove_prefix(pos + 1);
   }
   return result;
}

std::string seprov::readReleaseValue(const std::filesystem::path& path, std::string_view key)
{
   std::ifstream in(path);
   if (!in)
   {
      throw ConfigError("Cannot read " + path.native());
   }
   std::string line;
   while (std::getline(in, line))
   {
      std::string_view s = trim(line);
      if (!s.starts_with(key) || s.size() <= key.size() || s[key.size()] != '=')
      {
         continue;
      }
      auto value = s.substr(key.size() + 1);
      if (value.size() < 2 || value.front() != '"' || value.back() != '"')
      {
         throw ConfigError(std::string(key) + " in " + path.native() + " must be quoted");
      }
      return std::string(value.substr(1, value.size() - 2));
   }
   throw ConfigError(std::string(key) + " not found in " + path.native());
}
