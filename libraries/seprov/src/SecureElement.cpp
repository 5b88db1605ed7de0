#include <seprov/SecureElement.hpp>

#include <seprov/log.hpp>

#include <cctype>
#include <stdexcept>

using namespace seprov;

namespace
{
   constexpr std::string_view idPrefix    = "0x";
   constexpr std::string_view labelPrefix = "SE_";
   constexpr std::string_view keyIdTag    = "Key-Id:";

   std::string replacePrefix(std::string_view s, std::string_view from, std::string_view to)
   {
      if (!s.starts_with(from) || s.size() == from.size())
      {
         throw std::invalid_argument("Expected " + std::string(from) + "... but got \"" +
                                     std::string(s) + "\"");
      }
      return std::string(to) + std::string(s.substr(from.size()));
   }
}  // namespace

std::string seprov::labelFromId(std::string_view id)
{
   return replacePrefix(id, idPrefix, labelPrefix);
}

std::string seprov::idFromLabel(std::string_view label)
{
   return replacePrefix(label, labelPrefix, idPrefix);
}

std::optional<std::string> seprov::parseKeyId(std::string_view output)
{
   for (auto pos = output.find(keyIdTag); pos != std::string_view::npos;
        pos      = output.find(keyIdTag, pos + 1))
   {
      auto rest   = output.substr(pos + keyIdTag.size());
      auto digits = rest.find_first_not_of(" \t");
      if (digits == 0 || digits == std::string_view::npos)
      {
         continue;
      }
      rest = rest.substr(digits);
      if (!rest.starts_with(idPrefix))
      {
         continue;
      }
      std::size_t end = idPrefix.size();
      while (end < rest.size() && std::isxdigit(static_cast<unsigned char>(rest[end])))
      {
         ++end;
      }
      if (end > idPrefix.size())
      {
         return std::string(rest.substr(0, end));
      }
   }
   return std::nullopt;
}

SecureElement::SecureElement(const ProvisionConfig& config, CommandRunner& runner)
    : config(config), runner(runner)
{
}

bool SecureElement::hasObject(std::string_view id)
{
   std::vector<std::string> args{config.seTool, "--list-objects", std::string(id)};
   SEPROV_LOG(loggers::generic::get(), debug) << "Running " << formatCommand(args);
   // The tool fails when the object does not exist, so only the output matters
   auto result = runner.run(args);
   auto found  = parseKeyId(result.output);
   if (found && *found == id)
   {
      return true;
   }
   SEPROV_LOG(loggers::generic::get(), debug)
       << "Secure element object " << id << " is not provisioned";
   return false;
}

void SecureElement::importCert(std::string_view slot, std::string_view label)
{
   auto id = idFromLabel(label);
   checkedRun(runner, {config.seTool, "--token-label", config.tokenLabel, "--import-cert", id,
                       "--id", std::string(slot), "--label", std::string(label)});
   SEPROV_LOG(loggers::generic::get(), info)
       << "Imported certificate " << id << " into slot " << slot << " as " << label;
}
