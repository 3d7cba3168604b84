#include "catalog/alias_resolver.hpp"

#include <cctype>
#include <cstring>

#include "catalog/star_catalog.hpp"
#include "common/errors.hpp"

namespace plotter {

namespace {

std::string Trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

} // namespace

bool AliasResolver::HasAliasPrefix(const std::string& label) {
  const std::size_t n = std::strlen(kAliasPrefix);
  if (label.size() < n) return false;
  for (std::size_t i = 0; i < n; ++i) {
    const auto a = static_cast<unsigned char>(label[i]);
    const auto b = static_cast<unsigned char>(kAliasPrefix[i]);
    if (std::toupper(a) != std::toupper(b)) return false;
  }
  return true;
}

std::string AliasResolver::CanonicalName(const std::string& label) const {
  const std::string trimmed = Trim(label);
  if (!HasAliasPrefix(trimmed)) return trimmed;

  const std::string key = trimmed.substr(std::strlen(kAliasPrefix));
  auto it = aliases_.find(key);
  if (it == aliases_.end()) throw UnknownAliasError(trimmed);
  return it->second;
}

PointId AliasResolver::Resolve(const std::string& label, const StarCatalog& catalog) const {
  const std::string name = CanonicalName(label);
  const auto id = catalog.FindByName(name);
  if (!id) {
    // report the alias target too when the label went through the table
    throw UnknownPointError(name == Trim(label) ? name : Trim(label) + " (-> " + name + ")");
  }
  return *id;
}

} // namespace plotter
