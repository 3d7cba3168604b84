#include "io/file_util.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "common/errors.hpp"

namespace fs = std::filesystem;

namespace plotter::io {

std::string ReadAllText(const std::string& path) {
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

std::string ReadAllTextIfExists(const std::string& path) {
  if (!fs::exists(path)) return {};
  return ReadAllText(path);
}

nlohmann::json ParseJson(const std::string& text, const std::string& hint) {
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

void EnsureDir(const std::string& dir) {
  if (dir.empty()) return;
  const fs::path p(dir);
  if (!fs::exists(p)) {
    fs::create_directories(p);
  }
}

} // namespace plotter::io
