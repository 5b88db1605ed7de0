#include <seprov/Token.hpp>

#include <seprov/log.hpp>

#include <algorithm>

using namespace seprov;

namespace
{
   std::vector<std::string> with(std::vector<std::string>                 args,
                                 std::initializer_list<std::string_view> extra)
   {
      for (auto arg : extra)
      {
         args.emplace_back(arg);
      }
      return args;
   }
}  // namespace

bool seprov::listingHasLabels(std::string_view listing, const std::vector<std::string>& labels)
{
   std::vector<std::string_view> lines;
   while (!listing.empty())
   {
      auto pos = listing.find('\n');
      lines.push_back(listing.substr(0, pos));
      if (pos == std::string_view::npos)
      {
         break;
      }
      listing.remove_prefix(pos + 1);
   }
   return std::all_of(labels.begin(), labels.end(),
                      [&](const std::string& label)
                      {
                         return std::any_of(lines.begin(), lines.end(),
                                            [&](std::string_view line)
                                            { return line.find(label) != std::string_view::npos; });
                      });
}

Token::Token(const ProvisionConfig& config, CommandRunner& runner) : config(config), runner(runner)
{
}

std::vector<std::string> Token::tool() const
{
   return {config.pkcs11Tool, "--module", config.pkcs11Module, "--token-label", config.tokenLabel,
           "--pin", config.pin};
}

bool Token::hasLabels(const std::vector<std::string>& labels)
{
   auto listing = checkedRun(runner, with(tool(), {"--list-objects"}));
   return listingHasLabels(listing, labels);
}

void Token::generateKeyPair(std::string_view slot, std::string_view label)
{
   checkedRun(runner,
              with(tool(), {"--keypairgen", "--key-type", "EC:prime256v1", "--id", slot, "--label",
                            label}));
   SEPROV_LOG(loggers::generic::get(), info)
       << "Generated key pair " << label << " in slot " << slot;
}

TokenManager::TokenManager(const ProvisionConfig& config, CommandRunner& runner)
    : config(config), runner(runner)
{
}

std::vector<std::string> TokenManager::tool() const
{
   return {config.pkcs11Tool, "--module", config.pkcs11Module};
}

bool TokenManager::isInitialized()
{
   auto args =
       with(tool(), {"--token-label", config.tokenLabel, "--pin", config.pin, "--list-objects"});
   SEPROV_LOG(loggers::generic::get(), debug) << "Running " << formatCommand(args);
   // Logging in fails until the user PIN has been set
   return runner.run(args).status == 0;
}

void TokenManager::initialize()
{
   SEPROV_LOG(loggers::generic::get(), info) << "Initializing token " << config.tokenLabel;
   checkedRun(runner,
              with(tool(), {"--init-token", "--label", config.tokenLabel, "--so-pin", config.soPin}));
   checkedRun(runner, with(tool(), {"--token-label", config.tokenLabel, "--init-pin", "--so-pin",
                                    config.soPin, "--pin", config.pin}));
}

Token& TokenManager::getInitialized()
{
   if (!token)
   {
      if (!isInitialized())
      {
         initialize();
      }
      token.emplace(Token(config, runner));
   }
   return *token;
}
