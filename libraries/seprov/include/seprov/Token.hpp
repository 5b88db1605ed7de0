#pragma once

#include <seprov/CommandRunner.hpp>
#include <seprov/Config.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace seprov
{
   // An initialized PKCS #11 token. Only TokenManager creates these.
   class Token
   {
     public:
      // True if every label occurs in the object listing. The token is
      // listed once regardless of how many labels are requested.
      bool hasLabels(const std::vector<std::string>& labels);
      // Generates an EC key pair on the P-256 curve
      void generateKeyPair(std::string_view slot, std::string_view label);

     private:
      friend class TokenManager;
      Token(const ProvisionConfig& config, CommandRunner& runner);
      std::vector<std::string> tool() const;
      const ProvisionConfig&   config;
      CommandRunner&           runner;
   };

   // True if every label is a substring of at least one line of listing
   bool listingHasLabels(std::string_view listing, const std::vector<std::string>& labels);

   class TokenManager
   {
     public:
      TokenManager(const ProvisionConfig& config, CommandRunner& runner);

      bool isInitialized();
      // Sets the token label and SO PIN, then the user PIN. Must only
      // be called on a token that is not initialized.
      void initialize();
      // Initializes the token the first time it is needed
      Token& getInitialized();

     private:
      std::vector<std::string> tool() const;
      const ProvisionConfig&   config;
      CommandRunner&           runner;
      std::optional<Token>     token;
   };

}  // namespace seprov
