#include "io/alias_io.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "common/errors.hpp"
#include "io/file_util.hpp"

namespace fs = std::filesystem;

namespace plotter::io {

std::map<std::string, std::string> AliasIO::DefaultAliases() {
  return {
      {"Sol", "Jackson's Lighthouse"},
      {"Colonia", "Magellan"},
  };
}

std::map<std::string, std::string> AliasIO::Parse(const std::string& text, const std::string& hint) {
  const nlohmann::json root = ParseJson(text, hint);
  if (!root.is_object()) {
    throw ConfigError(hint + " must be a JSON object of name -> system");
  }

  std::map<std::string, std::string> out;
  for (auto it = root.begin(); it != root.end(); ++it) {
    if (!it.value().is_string()) continue;
    out.emplace(it.key(), it.value().get<std::string>());
  }
  return out;
}

std::map<std::string, std::string> AliasIO::Load(const std::string& path) {
  if (!fs::exists(path)) {
    throw ConfigError("Alias file not found: " + path);
  }
  return Parse(ReadAllText(path), path);
}

std::map<std::string, std::string> AliasIO::LoadOrCreateDefault(const std::string& path) {
  if (!fs::exists(path)) {
    nlohmann::json def = nlohmann::json::object();
    for (const auto& kv : DefaultAliases()) def[kv.first] = kv.second;

    std::ofstream ofs(path);
    if (!ofs) throw ConfigError("Failed to write default alias file: " + path);
    ofs << def.dump(2) << "\n";
    if (!ofs) throw ConfigError("Failed to write default alias file: " + path);
  }
  return Load(path);
}

} // namespace plotter::io
