#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace plotter {

// All run-level failures derive from PlotterError so the entry point can
// tell them apart from programming errors (std::logic_error etc.).
//
// Fatal:     DataLoadError, ConfigError, UnknownAliasError, UnknownPointError,
//            ResourceExhaustionError
// Non-fatal: NoRouteFoundError (the run completes with an empty route)
class PlotterError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Snapshot missing, malformed, truncated or of an unsupported schema version.
class DataLoadError : public PlotterError {
public:
  using PlotterError::PlotterError;
};

// plotter_config.json present but invalid.
class ConfigError : public PlotterError {
public:
  using PlotterError::PlotterError;
};

// "JP:<name>" whose <name> has no entry in the alias table.
class UnknownAliasError : public PlotterError {
public:
  explicit UnknownAliasError(std::string label)
      : PlotterError("Unknown alias: " + label), label_(std::move(label)) {}

  const std::string& label() const { return label_; }

private:
  std::string label_;
};

// Canonical name (given directly or via an alias) not present in the catalog.
class UnknownPointError : public PlotterError {
public:
  explicit UnknownPointError(std::string label)
      : PlotterError("System not found: " + label), label_(std::move(label)) {}

  const std::string& label() const { return label_; }

private:
  std::string label_;
};

class NoRouteFoundError : public PlotterError {
public:
  using PlotterError::PlotterError;
};

// The search expanded more nodes than PlotterConfig::max_expanded_nodes.
class ResourceExhaustionError : public PlotterError {
public:
  using PlotterError::PlotterError;
};

} // namespace plotter
