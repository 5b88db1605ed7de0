#pragma once

#include <seprov/CommandRunner.hpp>
#include <seprov/Config.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace seprov
{
   // PKCS #11 labels name secure element objects by replacing the
   // "0x" of the object id with "SE_".
   std::string labelFromId(std::string_view id);
   std::string idFromLabel(std::string_view label);

   // Finds the object id reported by the secure element tool as "Key-Id: 0x..."
   std::optional<std::string> parseKeyId(std::string_view output);

   class SecureElement
   {
     public:
      SecureElement(const ProvisionConfig& config, CommandRunner& runner);

      // False if the object has not been provisioned yet
      bool hasObject(std::string_view id);
      // Copies the certificate named by label into the token at slot
      void importCert(std::string_view slot, std::string_view label);

     private:
      const ProvisionConfig& config;
      CommandRunner&         runner;
   };

}  // namespace seprov
