#pragma once
/**
 * @file route_search_engine.hpp
 *
 * Hop-count-first search over alternating neutron / fuel stars.
 *
 *   INITIALIZED  frontier = { start }
 *   EXPANDING    pop the best node, query the index for opposite-category
 *                stars within RangeLimit(node), push improved successors
 *   FOUND        the end star is popped
 *   EXHAUSTED    frontier empty -> NoRouteFoundError
 *
 * Frontier key: (hops, secondary, cumulative distance, point id), where
 * secondary is the cumulative distance (TieBreak::kTotalDistance) or the
 * longest hop so far (TieBreak::kLongestHop). Because every hop adds exactly
 * one to the primary key, the first time the end star is popped the route is
 * hop-count optimal and, among those, optimal for the secondary key.
 *
 * Each star keeps only its best label; a successor is pushed only when it
 * beats that label lexicographically.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "catalog/spatial_index.hpp"
#include "common/types.hpp"

namespace plotter {

class StarCatalog;

struct SearchOptions {
  RangeRule range;
  TieBreak tie_break{TieBreak::kTotalDistance};

  /// ResourceExhaustionError once more nodes than this have been expanded.
  std::size_t max_expanded_nodes{2000000};

  /// > 1: successor queries of same-layer frontier nodes run on worker threads.
  unsigned worker_threads{1};

  /// Called every `progress_every` expansions with (stats, current hop layer).
  std::function<void(const SearchStats&, std::size_t)> progress;
  std::size_t progress_every{100000};

  static SearchOptions FromConfig(const PlotterConfig& cfg);
};

class RouteSearchEngine {
public:
  /// Both handles must outlive the engine.
  RouteSearchEngine(const StarCatalog& catalog, const SpatialIndex& index, SearchOptions options = {});

  /// Throws NoRouteFoundError, ResourceExhaustionError, std::out_of_range (bad id).
  Route Search(PointId start, PointId end) const;

  const SearchOptions& options() const { return options_; }

private:
  struct SearchNode {
    PointId point{kInvalidPoint};
    std::uint32_t hops{0};
    double cumulative_ly{0.0};
    double longest_hop_ly{0.0};
    double hop_ly{0.0};            // distance from parent
    std::int64_t parent{-1};       // arena index, -1 for the start node
  };

  double Secondary(const SearchNode& n) const;
  bool Better(const SearchNode& a, const SearchNode& b) const;

  std::vector<std::vector<IndexHit>> QueryBatch(const std::vector<SearchNode>& arena,
                                                const std::vector<std::uint32_t>& batch) const;

  Route BuildRoute(const std::vector<SearchNode>& arena, std::uint32_t last, const SearchStats& stats) const;

  // Hop invariants (alternation, range). Throws std::logic_error on violation.
  void CheckRoute(const Route& route) const;

  const StarCatalog& catalog_;
  const SpatialIndex& index_;
  SearchOptions options_;
};

} // namespace plotter
