#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "catalog/star_catalog.hpp"
#include "common/types.hpp"

// Small fixtures and brute-force references shared by the test executables.
namespace plotter::test {

inline StarPoint MakeStar(const std::string& name, StarCategory cat, double x, double y, double z,
                          std::optional<double> max_jump = std::nullopt) {
  StarPoint p;
  p.name = name;
  p.category = cat;
  p.position = {x, y, z};
  p.max_jump_ly = max_jump;
  return p;
}

// Neutron / fuel stars scattered uniformly in a cube of side `extent`.
// Every 7th star carries a per-point jump override.
inline StarCatalog RandomCatalog(std::uint32_t seed, int n, double extent) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> coord(0.0, extent);
  std::uniform_real_distribution<double> jump(extent * 0.05, extent * 0.3);
  std::bernoulli_distribution neutron(0.35);

  std::vector<StarPoint> pts;
  pts.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    const StarCategory cat = neutron(rng) ? StarCategory::kNeutron : StarCategory::kFuel;
    const double x = coord(rng);
    const double y = coord(rng);
    const double z = coord(rng);
    const double j = jump(rng);
    std::optional<double> mj;
    if (i % 7 == 3) mj = j;
    pts.push_back(MakeStar("S" + std::to_string(i), cat, x, y, z, mj));
  }
  return StarCatalog::FromPoints(std::move(pts));
}

inline bool HasEdge(const StarCatalog& cat, const RangeRule& rule, PointId from, PointId to) {
  const StarPoint& a = cat.Point(from);
  const StarPoint& b = cat.Point(to);
  if (a.category == StarCategory::kUnknown || b.category == StarCategory::kUnknown) return false;
  if (a.category == b.category) return false;
  const double r = rule.RangeLimit(a);
  return DistanceSq(a.position, b.position) <= r * r;
}

struct BruteForceResult {
  int hops{-1};                 // -1: unreachable
  double min_distance{0.0};     // min total distance among min-hop paths
  double min_longest_hop{0.0};  // min over min-hop paths of the longest hop
};

// O(n^2) per layer: layered BFS that also keeps, per star, the cheapest
// distance and the smallest longest hop over paths of exactly its layer.
inline BruteForceResult BruteForceRoute(const StarCatalog& cat, const RangeRule& rule, PointId s,
                                        PointId e) {
  BruteForceResult res;
  if (s == e) {
    res.hops = 0;
    return res;
  }

  const std::size_t n = cat.PointCount();
  const double inf = std::numeric_limits<double>::infinity();
  std::vector<int> layer(n, -1);
  std::vector<double> dist(n, inf);
  std::vector<double> longest(n, inf);
  layer[s] = 0;
  dist[s] = 0.0;
  longest[s] = 0.0;

  std::vector<PointId> current{s};
  for (int h = 1; !current.empty(); ++h) {
    std::vector<PointId> next;
    for (PointId u : current) {
      for (PointId v = 0; v < n; ++v) {
        if (!HasEdge(cat, rule, u, v)) continue;
        if (layer[v] != -1 && layer[v] < h) continue;
        const double hop = Distance(cat.Point(u).position, cat.Point(v).position);
        const double d = dist[u] + hop;
        const double l = std::max(longest[u], hop);
        if (layer[v] == -1) {
          layer[v] = h;
          next.push_back(v);
        }
        if (d < dist[v]) dist[v] = d;
        if (l < longest[v]) longest[v] = l;
      }
    }
    if (layer[e] != -1) {
      res.hops = layer[e];
      res.min_distance = dist[e];
      res.min_longest_hop = longest[e];
      return res;
    }
    current.swap(next);
  }
  return res;
}

} // namespace plotter::test
