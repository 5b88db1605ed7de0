#include <seprov/Daemon.hpp>

#include "test_util.hpp"

#include <catch2/catch.hpp>

#include <type_traits>

using namespace seprov;
using namespace seprov::test;

static_assert(!std::is_copy_constructible_v<Daemon>);
static_assert(!std::is_copy_assignable_v<Daemon>);

namespace
{
   struct DaemonFixture
   {
      DaemonFixture()
      {
         writeFile(config.osRelease, osRelease);
         config.interval = std::chrono::seconds(42);
      }

      Sleeper sleeper()
      {
         return [this](std::chrono::seconds d) { sleeps.push_back(d); };
      }

      // The secure element has every object
      void provisionSecureElement()
      {
         for (auto id : {"0x83000042", "0x83000043", "0x83000044", "0x83000045"})
         {
            runner.on(std::string("--list-objects ") + id, 0, keyIdOutput(id));
         }
      }

      TempDirectory                     dir;
      ProvisionConfig                   config = testConfig(dir.path);
      FakeRunner                        runner;
      std::vector<std::chrono::seconds> sleeps;
   };
}  // namespace

TEST_CASE_METHOD(DaemonFixture, "Daemon retries the agent at a fixed interval")
{
   const int failures = GENERATE(0, 1, 3);
   for (int i = 0; i < failures; ++i)
   {
      runner.on("nxp_iot_agent_demo", 1, "Failed to connect to EdgeLock 2GO\n");
   }
   runner.on("nxp_iot_agent_demo", 0);
   provisionSecureElement();
   runner.on("--pin 87654321 --list-objects", 0, listing({"SE_83000044", "SE_83000045"}));
   writeFile(config.sotaDir / "sql.db", "");

   Daemon daemon(config, runner, sleeper());
   daemon.run();

   CHECK(daemon.attempts() == static_cast<std::uint64_t>(failures + 1));
   CHECK(sleeps == std::vector<std::chrono::seconds>(failures, std::chrono::seconds(42)));
   CHECK(runner.count("nxp_iot_agent_demo") == static_cast<std::size_t>(failures + 1));
   // One listing to check initialization, one for the handler
   CHECK(runner.count("pkcs11-tool") == 2);
   CHECK(runner.count("fio-se05x-cli --list-objects") == 2);
}

TEST_CASE_METHOD(DaemonFixture, "step")
{
   runner.on("nxp_iot_agent_demo", 1);
   runner.on("nxp_iot_agent_demo", 0);
   TokenManager tokens(config, runner);
   auto&        token = tokens.getInitialized();
   Daemon       daemon(config, runner, sleeper());

   CHECK(daemon.step(token) == DaemonState::polling);
   CHECK(sleeps.size() == 1);
   CHECK(runner.count("fio-se05x-cli") == 0);
   CHECK(daemon.step(token) == DaemonState::done);
   CHECK(sleeps.size() == 1);
   // The certificate is not queried once the key is known to be missing
   CHECK(runner.count("fio-se05x-cli") == 1);
   CHECK(runner.mutations() == 0);
}

TEST_CASE_METHOD(DaemonFixture, "First boot provisions the update client")
{
   provisionSecureElement();
   runner.on("--pin 87654321 --list-objects", 1, "C_Login failed\n");
   runner.on("--pin 87654321 --list-objects", 0, "");

   Daemon daemon(config, runner, sleeper());
   daemon.run();

   CHECK(sleeps.empty());
   CHECK(runner.count("--init-token --label aktualizr") == 1);
   CHECK(runner.count("--init-pin") == 1);
   CHECK(runner.count("--keypairgen") == 1);
   CHECK(runner.count("--id 01 --label SE_83000044") == 1);
   CHECK(runner.count("--import-cert 0x83000045 --id 03") == 1);
   CHECK(runner.count("systemctl start aktualizr-lite") == 1);

   auto text = readFile(config.sotaDir / "sota.toml");
   CHECK(text.find("https://factory-x.ota-lite.foundries.io:8443\"") != std::string::npos);
   CHECK(text.find("https://factory-x.ota-lite.foundries.io:8443/repo\"") != std::string::npos);
   CHECK(text.find("https://factory-x.ostree.foundries.io:8443/ostree\"") != std::string::npos);
}

TEST_CASE_METHOD(DaemonFixture, "A second pass changes nothing")
{
   provisionSecureElement();
   runner.on("--pin 87654321 --list-objects", 1);
   runner.on("--pin 87654321 --list-objects", 0, "");
   runner.on("--pin 87654321 --list-objects", 0, listing({"SE_83000044", "SE_83000045"}));

   {
      Daemon daemon(config, runner, sleeper());
      daemon.run();
   }
   // The update client creates its storage once it runs
   writeFile(config.sotaDir / "sql.db", "");
   auto text  = readFile(config.sotaDir / "sota.toml");
   auto first = runner.mutations();
   CHECK(first == 5);

   {
      Daemon daemon(config, runner, sleeper());
      daemon.run();
   }
   CHECK(runner.mutations() == first);
   CHECK(readFile(config.sotaDir / "sota.toml") == text);
}

TEST_CASE_METHOD(DaemonFixture, "Handlers run in configured order")
{
   config.handlers = {"aws-iot", "lmp"};
   provisionSecureElement();

   Daemon daemon(config, runner, sleeper());
   daemon.run();

   std::vector<std::string> keys;
   for (const auto& call : runner.calls)
   {
      auto cmd = formatCommand(call);
      if (cmd.find("--keypairgen") != std::string::npos)
      {
         keys.push_back(call.back());
      }
   }
   CHECK(keys == std::vector<std::string>{"SE_83000042", "SE_83000044"});
}

TEST_CASE_METHOD(DaemonFixture, "Handlers without secure element objects are skipped")
{
   config.handlers = {"aws-iot", "lmp"};
   runner.on("--list-objects 0x83000044", 0, keyIdOutput("0x83000044"));
   runner.on("--list-objects 0x83000045", 1, "App   :ERROR:Object not found\n");
   runner.on("--list-objects 0x83000042", 0, keyIdOutput("0x83000042"));
   runner.on("--list-objects 0x83000043", 0, keyIdOutput("0x83000042"));

   Daemon daemon(config, runner, sleeper());
   daemon.run();

   CHECK(runner.mutations() == 0);
   CHECK(!std::filesystem::exists(config.sotaDir / "sota.toml"));
}

TEST_CASE("Daemon rejects unknown handlers")
{
   ProvisionConfig config;
   config.handlers = {"lmp", "greengrass"};
   FakeRunner runner;
   CHECK_THROWS_AS(Daemon(config, runner), ConfigError);
   CHECK(runner.calls.empty());
}

TEST_CASE("Agent")
{
   TempDirectory dir;
   auto          config = testConfig(dir.path);
   FakeRunner    runner;
   Agent         agent(config, runner);

   runner.on("nxp_iot_agent_demo", 2, "Failed to connect\n");
   runner.on("nxp_iot_agent_demo", 127, "nxp_iot_agent_demo: command not found\n");
   runner.on("nxp_iot_agent_demo", 0, "Update status report:\n  success\n");
   CHECK(!agent.run());
   CHECK(!agent.run());
   CHECK(agent.run());
   REQUIRE(runner.calls.size() == 3);
   CHECK(runner.calls[0] == std::vector<std::string>{"/usr/bin/nxp_iot_agent_demo"});
   CHECK(runner.mutations() == 0);
}
