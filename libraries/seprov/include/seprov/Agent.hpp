#pragma once

#include <seprov/CommandRunner.hpp>
#include <seprov/Config.hpp>

namespace seprov
{
   class Agent
   {
     public:
      Agent(const ProvisionConfig& config, CommandRunner& runner);
      // Checks in with the provisioning cloud once. Returns false if the
      // check-in did not succeed; any objects the cloud has issued
      // are in the secure element after a successful check-in.
      bool run();

     private:
      const ProvisionConfig& config;
      CommandRunner&         runner;
   };
}  // namespace seprov
