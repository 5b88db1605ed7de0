#pragma once

#include <seprov/Agent.hpp>
#include <seprov/CommandRunner.hpp>
#include <seprov/Config.hpp>
#include <seprov/CredentialHandler.hpp>
#include <seprov/SecureElement.hpp>
#include <seprov/Token.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

namespace seprov
{
   enum class DaemonState
   {
      polling,
      done,
   };

   using Sleeper = std::function<void(std::chrono::seconds)>;

   void sleepFor(std::chrono::seconds duration);

   // Checks in with the provisioning agent until it succeeds, then
   // provisions every configured identity whose objects have arrived
   // in the secure element.
   class Daemon
   {
     public:
      // Throws ConfigError if a configured handler does not exist
      Daemon(const ProvisionConfig& config, CommandRunner& runner, Sleeper sleeper = sleepFor);
      // The handlers refer to se
      Daemon(const Daemon&)            = delete;
      Daemon& operator=(const Daemon&) = delete;

      // Makes one attempt. Sleeps for the configured interval and
      // returns polling if the agent check-in failed.
      DaemonState step(Token& token);
      void        run();

      std::uint64_t attempts() const { return attemptCount; }

     private:
      void                           provision(Token& token);
      const ProvisionConfig&         config;
      SecureElement                  se;
      TokenManager                   tokens;
      Agent                          agent;
      std::vector<CredentialHandler> handlers;
      Sleeper                        sleeper;
      std::uint64_t                  attemptCount = 0;
   };

}  // namespace seprov
