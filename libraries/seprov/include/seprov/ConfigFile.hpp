#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace seprov
{
   // TOML document with string values. Sections and keys are written
   // in the order they were first set.
   class ConfigFile
   {
     public:
      // Sets the value of a property.  For top level properties, the section
      // should be the empty string.  If a comment is specified, it will be
      // appended to the line.
      void set(std::string_view section,
               std::string_view key,
               std::string_view value,
               std::string_view comment = "");
      std::optional<std::string> get(std::string_view section, std::string_view key) const;
      void                       write(std::ostream& out) const;
      // Replaces path atomically. Throws ConfigError on failure.
      void writeFile(const std::filesystem::path& path) const;

     private:
      struct Property
      {
         std::string key;
         std::string value;
         std::string comment;
      };
      struct Section
      {
         std::string           name;
         std::vector<Property> properties;
      };
      Section&             findSection(std::string_view section);
      std::vector<Section> sections;
   };

}  // namespace seprov
