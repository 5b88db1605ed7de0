#include <seprov/CommandRunner.hpp>
#include <seprov/Config.hpp>
#include <seprov/CredentialHandler.hpp>
#include <seprov/Daemon.hpp>
#include <seprov/log.hpp>

#include <boost/preprocessor/stringize.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace seprov;

#define SEPROV_VERSION_STRING \
   BOOST_PP_STRINGIZE(SEPROV_VERSION_MAJOR) "." BOOST_PP_STRINGIZE(SEPROV_VERSION_MINOR) "." BOOST_PP_STRINGIZE(SEPROV_VERSION_PATCH)

const char usage[] = "USAGE: seprovd [OPTIONS]";

int main(int argc, char* argv[])
{
   namespace po = boost::program_options;

   auto              desc = commandLineOptions();
   po::variables_map vm;
   try
   {
      parseOptions(std::vector<std::string>(argv + 1, argv + argc), desc, vm);
   }
   catch (ConfigError& e)
   {
      if (!vm.count("help") && !vm.count("version"))
      {
         std::cerr << e.what() << "\n";
         return 2;
      }
   }

   if (vm.count("help"))
   {
      std::cerr << usage << "\n\n";
      std::cerr << desc << "\n";
      return 1;
   }

   if (vm.count("version"))
   {
      std::cerr << "seprovd " << SEPROV_VERSION_STRING << "\n";
      return 1;
   }

   if (vm.count("list-handlers"))
   {
      ProvisionConfig cfg;
      ProcessRunner   runner;
      SecureElement   se(cfg, runner);
      for (auto name : handlerNames())
      {
         const auto& identity = identityOf(makeHandler(name, cfg, se, runner));
         std::cout << name << ": key " << identity.keyId << " (slot " << identity.keySlot
                   << "), certificate " << identity.certId << " (slot " << identity.certSlot
                   << ")\n";
      }
      return 0;
   }

   try
   {
      seprov::loggers::configure(vm);
      auto config = loadConfig(vm);
      SEPROV_LOG(seprov::loggers::generic::get(), info)
          << "Provisioning " << config.handlers.size() << " identities for " << config.repoId;
      ProcessRunner runner;
      Daemon        daemon(config, runner);
      daemon.run();
      return 0;
   }
   catch (ConfigError& e)
   {
      SEPROV_LOG(seprov::loggers::generic::get(), critical) << e.what();
      return 2;
   }
   catch (CommandError& e)
   {
      SEPROV_LOG(seprov::loggers::generic::get(), error) << e.what();
   }
   catch (std::exception& e)
   {
      SEPROV_LOG(seprov::loggers::generic::get(), error) << e.what();
   }
   return 1;
}
