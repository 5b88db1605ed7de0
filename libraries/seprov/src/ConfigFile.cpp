#include <seprov/ConfigFile.hpp>

#include <seprov/Config.hpp>

#include <algorithm>
#include <cerrno>
#include <ostream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

using namespace seprov;

namespace
{
   struct FileDescriptor
   {
      int fd;
      explicit FileDescriptor(int fd) : fd(fd) {}
      FileDescriptor(const FileDescriptor&) = delete;
      ~FileDescriptor()
      {
         if (fd >= 0)
            ::close(fd);
      }
   };

   [[noreturn]] void throwErrno(const std::string& message)
   {
      throw ConfigError(message + ": " + std::generic_category().message(errno));
   }

   [[noreturn]] void removeAndThrow(const std::filesystem::path& tmp, const std::string& message)
   {
      auto err = errno;
      ::unlink(tmp.c_str());
      errno = err;
      throwErrno(message);
   }

   std::string escape(std::string_view s)
   {
      std::string_view escaped = "\\\"";
      std::string      result;
      for (char ch : s)
      {
         if (ch == '\n')
         {
            result += "\\n";
         }
         else
         {
            if (escaped.find(ch) != std::string::npos)
            {
               result += '\\';
            }
            result += ch;
         }
      }
      return result;
   }

   std::string editLine(std::string_view key, std::string_view value, std::string_view comment)
   {
      std::string result(key);
      result += " = \"";
      result += escape(value);
      result += '"';
      if (!comment.empty())
      {
         result += " # ";
         result += comment;
      }
      result += "\n";
      return result;
   }
}  // namespace

ConfigFile::Section& ConfigFile::findSection(std::string_view section)
{
   auto pos = std::find_if(sections.begin(), sections.end(),
                           [&](const Section& s) { return s.name == section; });
   if (pos != sections.end())
   {
      return *pos;
   }
   // top level properties must precede the first table
   if (section.empty())
   {
      return *sections.insert(sections.begin(), Section{});
   }
   sections.push_back(Section{std::string(section), {}});
   return sections.back();
}

void ConfigFile::set(std::string_view section,
                     std::string_view key,
                     std::string_view value,
                     std::string_view comment)
{
   auto& properties = findSection(section).properties;
   auto  pos        = std::find_if(properties.begin(), properties.end(),
                                   [&](const Property& p) { return p.key == key; });
   if (pos != properties.end())
   {
      pos->value = value;
      if (!comment.empty())
      {
         pos->comment = comment;
      }
   }
   else
   {
      properties.push_back(Property{std::string(key), std::string(value), std::string(comment)});
   }
}

std::optional<std::string> ConfigFile::get(std::string_view section, std::string_view key) const
{
   for (const auto& s : sections)
   {
      if (s.name != section)
      {
         continue;
      }
      for (const auto& p : s.properties)
      {
         if (p.key == key)
         {
            return p.value;
         }
      }
   }
   return std::nullopt;
}

void ConfigFile::write(std::ostream& out) const
{
   bool first = true;
   for (const auto& section : sections)
   {
      if (!section.name.empty())
      {
         if (!first)
         {
            out << '\n';
         }
         out << '[' << section.name << "]\n";
      }
      for (const auto& p : section.properties)
      {
         out << editLine(p.key, p.value, p.comment);
      }
      first = false;
   }
}

void ConfigFile::writeFile(const std::filesystem::path& path) const
{
   std::ostringstream ss;
   write(ss);
   auto data = ss.str();

   auto tmp = path;
   tmp += ".tmp";
   {
      FileDescriptor fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
      if (fd.fd < 0)
      {
         throwErrno("Cannot create " + tmp.native());
      }
      std::string_view rest = data;
      while (!rest.empty())
      {
         auto n = ::write(fd.fd, rest.data(), rest.size());
         if (n < 0)
         {
            if (errno == EINTR)
               continue;
            removeAndThrow(tmp, "Cannot write " + tmp.native());
         }
         rest.remove_prefix(static_cast<std::size_t>(n));
      }
      // The data must reach the disk before the rename does
      if (::fsync(fd.fd) != 0)
      {
         removeAndThrow(tmp, "Cannot sync " + tmp.native());
      }
   }
   if (::rename(tmp.c_str(), path.c_str()) != 0)
   {
      removeAndThrow(tmp, "Cannot replace " + path.native());
   }
   auto           dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
   FileDescriptor dirfd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
   if (dirfd.fd < 0 || ::fsync(dirfd.fd) != 0)
   {
      throwErrno("Cannot sync " + dir.native());
   }
}
