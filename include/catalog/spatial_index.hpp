#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "common/types.hpp"

namespace plotter {

class StarCatalog;

struct IndexHit {
  PointId point{kInvalidPoint};
  double distance_ly{0.0};
};

// ======================
// Spatial index: one flat 3-D k-d tree per category.
//
// Pure geometric oracle. It knows nothing about jump ranges: the caller
// supplies the query radius. Immutable after Build(), so concurrent queries
// from several threads are safe.
// ======================
class SpatialIndex {
public:
  SpatialIndex() = default;

  // O(n log n). Points of unknown category are not indexed.
  static SpatialIndex Build(const StarCatalog& catalog);

  // Points of `category` with distance <= radius_ly, ascending distance,
  // ties by ascending id. max_results > 0 keeps only the nearest ones.
  std::vector<IndexHit> Query(const Vec3& position, StarCategory category, double radius_ly,
                              std::size_t max_results = 0) const;

  // The k nearest points of `category`, ascending distance (ties by id).
  std::vector<IndexHit> Nearest(const Vec3& position, StarCategory category, std::size_t k) const;

  std::size_t Size(StarCategory category) const;

private:
  struct Node {
    Vec3 pos;
    PointId point{kInvalidPoint};
    std::int32_t left{-1};
    std::int32_t right{-1};
    std::uint8_t axis{0};
  };

  struct Tree {
    std::vector<Node> nodes;
    std::int32_t root{-1};
  };

  const Tree* TreeFor(StarCategory category) const;

  static std::int32_t BuildRec(Tree& tree, std::vector<Node>& items, std::size_t l, std::size_t r,
                               int depth);

  Tree neutron_;
  Tree fuel_;
};

} // namespace plotter
