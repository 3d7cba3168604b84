#pragma once
#include <string>

#include "common/types.hpp"

namespace plotter::io {

// plotter_config.json (every key optional):
//   {
//     "snapshot_path": "data/stars.bin",
//     "alias_path": "jumppoints.json",
//     "output_dir": ".",
//     "base_jump_ly": 30.0,
//     "neutron_boost": 6.0,
//     "tie_break": "total_distance" | "longest_hop",
//     "max_expanded_nodes": 2000000,
//     "worker_threads": 1
//   }
class ConfigIO {
public:
  // Throws ConfigError on bad JSON or invalid values.
  static PlotterConfig Parse(const std::string& text, const std::string& hint = "config");

  // Missing file -> defaults.
  static PlotterConfig Load(const std::string& path);

  // Throws ConfigError.
  static TieBreak ParseTieBreak(const std::string& s);
  static void Validate(const PlotterConfig& cfg);
};

} // namespace plotter::io
