#include "catalog/star_catalog.hpp"

#include <algorithm>
#include <utility>

#include "io/snapshot_io.hpp"

namespace plotter {

StarCatalog StarCatalog::Load(const std::vector<std::uint8_t>& snapshot) {
  io::SnapshotIO::Decoded decoded = io::SnapshotIO::Decode(snapshot);
  StarCatalog cat = FromPoints(std::move(decoded.points));
  cat.schema_version_ = decoded.version;
  return cat;
}

StarCatalog StarCatalog::LoadFile(const std::string& path) {
  return Load(io::SnapshotIO::ReadFile(path));
}

StarCatalog StarCatalog::FromPoints(std::vector<StarPoint> points) {
  StarCatalog cat;
  cat.points_ = std::move(points);
  cat.name_to_id_.reserve(cat.points_.size());
  for (std::size_t i = 0; i < cat.points_.size(); ++i) {
    auto& p = cat.points_[i];
    p.id = static_cast<PointId>(i);
    // a later record with the same name takes over the lookup
    cat.name_to_id_[p.name] = p.id;
  }
  return cat;
}

std::size_t StarCatalog::CountOf(StarCategory c) const {
  return static_cast<std::size_t>(std::count_if(points_.begin(), points_.end(),
                                                [c](const StarPoint& p) { return p.category == c; }));
}

std::optional<PointId> StarCatalog::FindByName(const std::string& name) const {
  auto it = name_to_id_.find(name);
  if (it == name_to_id_.end()) return std::nullopt;
  return it->second;
}

} // namespace plotter
