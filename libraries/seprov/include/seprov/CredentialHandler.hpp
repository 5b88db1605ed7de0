#pragma once

#include <seprov/CommandRunner.hpp>
#include <seprov/Config.hpp>
#include <seprov/ConfigFile.hpp>
#include <seprov/SecureElement.hpp>
#include <seprov/Token.hpp>

#include <filesystem>
#include <string_view>
#include <variant>
#include <vector>

namespace seprov
{
   // Secure element objects of one identity and the token slots they
   // are imported into. Slots must not be shared between identities.
   struct Identity
   {
      std::string_view keyId;
      std::string_view certId;
      std::string_view keySlot;
      std::string_view certSlot;

      std::string keyLabel() const { return labelFromId(keyId); }
      std::string certLabel() const { return labelFromId(certId); }
   };

   // Imports the key pair and certificate unless the token already has
   // both labels. Returns true if nothing needed to be imported.
   bool importIdentity(const Identity& identity, Token& token, SecureElement& se);

   // The update client (aktualizr-lite). It is complete once its
   // storage exists, which only happens after it has been configured
   // and started.
   class UpdateClientHandler
   {
     public:
      static constexpr std::string_view name        = "lmp";
      static constexpr std::string_view serviceName = "aktualizr-lite";
      static constexpr std::string_view tagKey      = "LMP_FACTORY_TAG";
      static constexpr Identity         identity{"0x83000044", "0x83000045", "01", "03"};

      UpdateClientHandler(const ProvisionConfig& config, SecureElement& se, CommandRunner& runner);
      void ensureProvisioned(Token& token);

      ConfigFile            makeConfig(std::string_view factoryTag) const;
      std::filesystem::path configPath() const;
      std::filesystem::path storePath() const;

     private:
      const ProvisionConfig* config;
      SecureElement*         se;
      CommandRunner*         runner;
   };

   // The fleet messaging client. It reads its credentials from the
   // token directly and needs no configuration.
   class FleetMessagingHandler
   {
     public:
      static constexpr std::string_view name = "aws-iot";
      static constexpr Identity         identity{"0x83000042", "0x83000043", "02", "04"};

      explicit FleetMessagingHandler(SecureElement& se);
      void ensureProvisioned(Token& token);

     private:
      SecureElement* se;
   };

   using CredentialHandler = std::variant<UpdateClientHandler, FleetMessagingHandler>;

   std::vector<std::string_view> handlerNames();
   // Throws ConfigError for an unknown name
   CredentialHandler makeHandler(std::string_view       name,
                                 const ProvisionConfig& config,
                                 SecureElement&         se,
                                 CommandRunner&         runner);
   std::string_view  nameOf(const CredentialHandler& handler);
   const Identity&   identityOf(const CredentialHandler& handler);
   void              ensureProvisioned(CredentialHandler& handler, Token& token);

}  // namespace seprov
