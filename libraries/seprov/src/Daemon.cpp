#include <seprov/Daemon.hpp>

#include <seprov/log.hpp>

#include <thread>

using namespace seprov;

void seprov::sleepFor(std::chrono::seconds duration)
{
   std::this_thread::sleep_for(duration);
}

Daemon::Daemon(const ProvisionConfig& config, CommandRunner& runner, Sleeper sleeper)
    : config(config),
      se(config, runner),
      tokens(config, runner),
      agent(config, runner),
      sleeper(std::move(sleeper))
{
   for (const auto& name : config.handlers)
   {
      handlers.push_back(makeHandler(name, config, se, runner));
   }
}

void Daemon::provision(Token& token)
{
   for (auto& handler : handlers)
   {
      const auto& identity = identityOf(handler);
      if (se.hasObject(identity.keyId) && se.hasObject(identity.certId))
      {
         SEPROV_LOG(loggers::generic::get(), info) << "Provisioning " << nameOf(handler);
         ensureProvisioned(handler, token);
      }
      else
      {
         SEPROV_LOG(loggers::generic::get(), notice)
             << "Skipping " << nameOf(handler) << ": " << identity.keyId << " and "
             << identity.certId << " are not both in the secure element";
      }
   }
}

DaemonState Daemon::step(Token& token)
{
   ++attemptCount;
   if (agent.run())
   {
      provision(token);
      return DaemonState::done;
   }
   SEPROV_LOG(loggers::generic::get(), info)
       << "Check-in attempt " << attemptCount << " failed, retrying in "
       << config.interval.count() << "s";
   sleeper(config.interval);
   return DaemonState::polling;
}

void Daemon::run()
{
   auto& token = tokens.getInitialized();
   auto  state = DaemonState::polling;
   while (state == DaemonState::polling)
   {
      state = step(token);
   }
   SEPROV_LOG(loggers::generic::get(), info)
       << "Provisioning finished after " << attemptCount << " check-in attempt(s)";
}
