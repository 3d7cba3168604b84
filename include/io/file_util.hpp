#pragma once
#include <string>

#include <nlohmann/json.hpp>

namespace plotter::io {

// Throws std::runtime_error when the file cannot be opened.
std::string ReadAllText(const std::string& path);

// Empty string when the file does not exist.
std::string ReadAllTextIfExists(const std::string& path);

// Throws ConfigError naming `hint` on a parse failure.
nlohmann::json ParseJson(const std::string& text, const std::string& hint);

void EnsureDir(const std::string& dir);

} // namespace plotter::io
