#pragma once
#include <map>
#include <string>
#include <utility>

#include "common/types.hpp"

namespace plotter {

// Maps user labels to canonical catalog names.
//
//   "Sol"      -> canonical name, looked up as is
//   "JP:Home"  -> alias "Home" (prefix case-insensitive, alias key case-sensitive)
class AliasResolver {
public:
  static constexpr const char* kAliasPrefix = "JP:";

  AliasResolver() = default;
  explicit AliasResolver(std::map<std::string, std::string> aliases) : aliases_(std::move(aliases)) {}

  // Canonical name for a label. Throws UnknownAliasError for a prefixed label
  // with no alias entry.
  std::string CanonicalName(const std::string& label) const;

  // Throws UnknownAliasError / UnknownPointError.
  PointId Resolve(const std::string& label, const StarCatalog& catalog) const;

  static bool HasAliasPrefix(const std::string& label);

  std::size_t Size() const { return aliases_.size(); }
  const std::map<std::string, std::string>& Entries() const { return aliases_; }

private:
  std::map<std::string, std::string> aliases_;
};

} // namespace plotter
