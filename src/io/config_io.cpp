#include "io/config_io.hpp"

#include <cmath>

#include "common/errors.hpp"
#include "io/file_util.hpp"

namespace plotter::io {

TieBreak ConfigIO::ParseTieBreak(const std::string& s) {
  if (s == "total_distance") return TieBreak::kTotalDistance;
  if (s == "longest_hop") return TieBreak::kLongestHop;
  throw ConfigError("Unknown tie_break '" + s + "' (expected total_distance or longest_hop)");
}

void ConfigIO::Validate(const PlotterConfig& cfg) {
  if (!std::isfinite(cfg.range.base_jump_ly) || cfg.range.base_jump_ly <= 0.0) {
    throw ConfigError("base_jump_ly must be > 0");
  }
  if (!std::isfinite(cfg.range.neutron_boost) || cfg.range.neutron_boost < 1.0) {
    throw ConfigError("neutron_boost must be >= 1");
  }
  if (cfg.max_expanded_nodes == 0) {
    throw ConfigError("max_expanded_nodes must be > 0");
  }
  if (cfg.worker_threads == 0) {
    throw ConfigError("worker_threads must be >= 1");
  }
}

PlotterConfig ConfigIO::Parse(const std::string& text, const std::string& hint) {
  using json = nlohmann::json;

  const json root = ParseJson(text, hint);
  if (!root.is_object()) {
    throw ConfigError(hint + " must be a JSON object");
  }

  PlotterConfig cfg;
  try {
    cfg.snapshot_path = root.value("snapshot_path", cfg.snapshot_path);
    cfg.alias_path = root.value("alias_path", cfg.alias_path);
    cfg.output_dir = root.value("output_dir", cfg.output_dir);

    cfg.range.base_jump_ly = root.value("base_jump_ly", cfg.range.base_jump_ly);
    cfg.range.neutron_boost = root.value("neutron_boost", cfg.range.neutron_boost);

    cfg.tie_break = ParseTieBreak(root.value("tie_break", std::string(TieBreakName(cfg.tie_break))));

    // signed read so that a negative value is rejected instead of wrapping
    const long long max_nodes =
        root.value("max_expanded_nodes", static_cast<long long>(cfg.max_expanded_nodes));
    if (max_nodes <= 0) throw ConfigError("max_expanded_nodes must be > 0");
    cfg.max_expanded_nodes = static_cast<std::size_t>(max_nodes);

    const int threads = root.value("worker_threads", static_cast<int>(cfg.worker_threads));
    if (threads <= 0) throw ConfigError("worker_threads must be >= 1");
    cfg.worker_threads = static_cast<unsigned>(threads);
  } catch (const json::exception& e) {
    throw ConfigError("Invalid value in " + hint + ": " + std::string(e.what()));
  }

  Validate(cfg);
  return cfg;
}

PlotterConfig ConfigIO::Load(const std::string& path) {
  const std::string text = ReadAllTextIfExists(path);
  if (text.empty()) return PlotterConfig{};
  return Parse(text, path);
}

} // namespace plotter::io
