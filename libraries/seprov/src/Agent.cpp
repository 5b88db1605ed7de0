#include <seprov/Agent.hpp>

#include <seprov/log.hpp>

using namespace seprov;

Agent::Agent(const ProvisionConfig& config, CommandRunner& runner) : config(config), runner(runner)
{
}

bool Agent::run()
{
   SEPROV_LOG(loggers::generic::get(), debug) << "Running " << config.agent;
   auto result = runner.run({config.agent});
   if (result.status != 0)
   {
      SEPROV_LOG(loggers::generic::get(), warning)
          << "Provisioning agent failed with status " << result.status << ":";
      loggers::log_output(loggers::level::warning, result.output);
      return false;
   }
   SEPROV_LOG(loggers::generic::get(), info) << "Provisioning agent check-in succeeded";
   return true;
}
