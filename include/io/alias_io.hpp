#pragma once
#include <map>
#include <string>

namespace plotter::io {

// Alias file (jumppoints.json): a JSON object of custom name -> canonical
// system name. Non-string values are ignored.
class AliasIO {
public:
  // Throws ConfigError if the text is not a JSON object.
  static std::map<std::string, std::string> Parse(const std::string& text,
                                                  const std::string& hint = "alias file");

  // Throws ConfigError if the file is missing or invalid.
  static std::map<std::string, std::string> Load(const std::string& path);

  // Writes DefaultAliases() to `path` first when the file does not exist.
  static std::map<std::string, std::string> LoadOrCreateDefault(const std::string& path);

  static std::map<std::string, std::string> DefaultAliases();
};

} // namespace plotter::io
