#include <seprov/CredentialHandler.hpp>

#include <seprov/log.hpp>

using namespace seprov;

bool seprov::importIdentity(const Identity& identity, Token& token, SecureElement& se)
{
   auto keyLabel  = identity.keyLabel();
   auto certLabel = identity.certLabel();
   if (token.hasLabels({keyLabel, certLabel}))
   {
      return true;
   }
   // A failure between these leaves an orphaned key pair that must be
   // cleaned up by hand.
   token.generateKeyPair(identity.keySlot, keyLabel);
   se.importCert(identity.certSlot, certLabel);
   return false;
}

UpdateClientHandler::UpdateClientHandler(const ProvisionConfig& config,
                                         SecureElement&         se,
                                         CommandRunner&         runner)
    : config(&config), se(&se), runner(&runner)
{
}

std::filesystem::path UpdateClientHandler::configPath() const
{
   return config->sotaDir / "sota.toml";
}

std::filesystem::path UpdateClientHandler::storePath() const
{
   return config->sotaDir / "sql.db";
}

ConfigFile UpdateClientHandler::makeConfig(std::string_view factoryTag) const
{
   const auto& repo      = config->repoId;
   auto        server    = "https://" + repo + ".ota-lite.foundries.io:8443";
   auto        sotaDir   = config->sotaDir.native();
   ConfigFile  file;
   file.set("tls", "server", server);
   file.set("tls", "ca_source", "file");
   file.set("tls", "pkey_source", "pkcs11");
   file.set("tls", "cert_source", "pkcs11");

   file.set("provision", "server", server);

   file.set("uptane", "repo_server", server + "/repo");
   file.set("uptane", "key_source", "file");

   file.set("pacman", "type", config->pacmanType);
   file.set("pacman", "ostree_server", "https://" + repo + ".ostree.foundries.io:8443/ostree");
   file.set("pacman", "packages_file", "/usr/package.manifest");
   file.set("pacman", "tags", factoryTag);

   file.set("storage", "type", "sqlite");
   file.set("storage", "path", sotaDir);

   file.set("import", "tls_cacert_path", (config->sotaDir / "root.crt").native());

   file.set("p11", "module", config->pkcs11Module);
   file.set("p11", "pass", config->pin);
   file.set("p11", "tls_pkey_id", identity.keySlot, "key pair generated for " + identity.keyLabel());
   file.set("p11", "tls_clientcert_id", identity.certSlot,
            "certificate imported from " + std::string(identity.certId));
   return file;
}

void UpdateClientHandler::ensureProvisioned(Token& token)
{
   bool imported = !importIdentity(identity, token, *se);
   if (!imported && std::filesystem::exists(storePath()))
   {
      SEPROV_LOG(loggers::generic::get(), info) << name << " is already provisioned";
      return;
   }
   auto tag = readReleaseValue(config->osRelease, tagKey);

   std::error_code ec;
   std::filesystem::create_directories(config->sotaDir, ec);
   if (ec)
   {
      throw ConfigError("Cannot create " + config->sotaDir.native() + ": " + ec.message());
   }
   makeConfig(tag).writeFile(configPath());
   SEPROV_LOG(loggers::generic::get(), info) << "Wrote " << configPath().native();

   checkedRun(*runner, {"systemctl", "start", std::string(serviceName)});
   SEPROV_LOG(loggers::generic::get(), info) << "Started " << serviceName;
}

FleetMessagingHandler::FleetMessagingHandler(SecureElement& se) : se(&se) {}

void FleetMessagingHandler::ensureProvisioned(Token& token)
{
   if (importIdentity(identity, token, *se))
   {
      SEPROV_LOG(loggers::generic::get(), info) << name << " is already provisioned";
   }
}

std::vector<std::string_view> seprov::handlerNames()
{
   return {UpdateClientHandler::name, FleetMessagingHandler::name};
}

CredentialHandler seprov::makeHandler(std::string_view       name,
                                      const ProvisionConfig& config,
                                      SecureElement&         se,
                                      CommandRunner&         runner)
{
   if (name == UpdateClientHandler::name)
   {
      return UpdateClientHandler(config, se, runner);
   }
   else if (name == FleetMessagingHandler::name)
   {
      return FleetMessagingHandler(se);
   }
   else
   {
      throw ConfigError("Unknown handler: " + std::string(name));
   }
}

std::string_view seprov::nameOf(const CredentialHandler& handler)
{
   return std::visit([](const auto& h) { return h.name; }, handler);
}

const Identity& seprov::identityOf(const CredentialHandler& handler)
{
   return std::visit([](const auto& h) -> const Identity& { return h.identity; }, handler);
}

void seprov::ensureProvisioned(CredentialHandler& handler, Token& token)
{
   std::visit([&](auto& h) { h.ensureProvisioned(token); }, handler);
}
