#include "search/route_search_engine.hpp"

#include <algorithm>
#include <queue>
#include <stdexcept>
#include <string>
#include <utility>

#include "catalog/star_catalog.hpp"
#include "common/errors.hpp"
#include "search/parallel_for.hpp"

namespace plotter {

namespace {

constexpr std::uint32_t kNoNode = 0xFFFFFFFFu;

// Nodes handed to each worker per round.
constexpr std::size_t kBatchPerWorker = 16;

// Slack for the post-search range check (distances are recomputed in double).
constexpr double kRangeEps = 1e-9;

struct FrontierEntry {
  std::uint32_t hops;
  double secondary;
  double cumulative;
  PointId point;
  std::uint32_t node;
};

// min-heap ordering for std::priority_queue
struct FrontierGreater {
  bool operator()(const FrontierEntry& a, const FrontierEntry& b) const {
    if (a.hops != b.hops) return a.hops > b.hops;
    if (a.secondary != b.secondary) return a.secondary > b.secondary;
    if (a.cumulative != b.cumulative) return a.cumulative > b.cumulative;
    if (a.point != b.point) return a.point > b.point;
    return a.node > b.node;
  }
};

} // namespace

SearchOptions SearchOptions::FromConfig(const PlotterConfig& cfg) {
  SearchOptions o;
  o.range = cfg.range;
  o.tie_break = cfg.tie_break;
  o.max_expanded_nodes = cfg.max_expanded_nodes;
  o.worker_threads = cfg.worker_threads;
  return o;
}

RouteSearchEngine::RouteSearchEngine(const StarCatalog& catalog, const SpatialIndex& index,
                                     SearchOptions options)
    : catalog_(catalog), index_(index), options_(std::move(options)) {
  if (options_.worker_threads == 0) options_.worker_threads = 1;
}

double RouteSearchEngine::Secondary(const SearchNode& n) const {
  return options_.tie_break == TieBreak::kLongestHop ? n.longest_hop_ly : n.cumulative_ly;
}

bool RouteSearchEngine::Better(const SearchNode& a, const SearchNode& b) const {
  if (a.hops != b.hops) return a.hops < b.hops;
  const double sa = Secondary(a);
  const double sb = Secondary(b);
  if (sa != sb) return sa < sb;
  return a.cumulative_ly < b.cumulative_ly;
}

std::vector<std::vector<IndexHit>> RouteSearchEngine::QueryBatch(
    const std::vector<SearchNode>& arena, const std::vector<std::uint32_t>& batch) const {
  std::vector<std::vector<IndexHit>> results(batch.size());

  auto query_one = [&](std::size_t i) {
    const StarPoint& p = catalog_.Point(arena[batch[i]].point);
    results[i] = index_.Query(p.position, Opposite(p.category), options_.range.RangeLimit(p));
  };

  // The index and catalog are read-only; each call writes its own slot.
  ParallelFor(batch.size(), options_.worker_threads, query_one);
  return results;
}

Route RouteSearchEngine::Search(PointId start, PointId end) const {
  const StarPoint& sp = catalog_.Point(start);
  const StarPoint& ep = catalog_.Point(end);

  SearchStats stats;
  stats.state = SearchState::kInitialized;

  if (start == end) {
    Route r;
    r.points.push_back(start);
    stats.state = SearchState::kFound;
    r.stats = stats;
    return r;
  }

  if (sp.category == StarCategory::kUnknown || ep.category == StarCategory::kUnknown) {
    throw NoRouteFoundError("No route: " + std::string(sp.category == StarCategory::kUnknown ? sp.name : ep.name) +
                            " is neither a neutron nor a fuel star");
  }

  std::vector<SearchNode> arena;
  std::vector<std::uint32_t> best_node(catalog_.PointCount(), kNoNode);
  std::priority_queue<FrontierEntry, std::vector<FrontierEntry>, FrontierGreater> frontier;

  auto push = [&](const SearchNode& n) {
    const auto id = static_cast<std::uint32_t>(arena.size());
    arena.push_back(n);
    best_node[n.point] = id;
    frontier.push({n.hops, Secondary(n), n.cumulative_ly, n.point, id});
    ++stats.pushed_nodes;
  };

  SearchNode root;
  root.point = start;
  push(root);

  const std::size_t batch_limit =
      options_.worker_threads > 1 ? options_.worker_threads * kBatchPerWorker : 1;

  stats.state = SearchState::kExpanding;
  std::size_t next_progress = options_.progress_every;

  std::vector<std::uint32_t> batch;
  batch.reserve(batch_limit);

  while (!frontier.empty()) {
    // Pop up to batch_limit live nodes of the same hop count. Their
    // successors all land in the next layer, so expanding them together
    // gives the same labels as expanding them one by one.
    batch.clear();
    std::uint32_t found = kNoNode;
    while (!frontier.empty() && batch.size() < batch_limit) {
      const FrontierEntry top = frontier.top();
      if (!batch.empty() && top.hops != arena[batch.front()].hops) break;
      frontier.pop();
      if (best_node[top.point] != top.node) continue; // stale
      if (top.point == end) {
        found = top.node;
        break;
      }
      batch.push_back(top.node);
    }

    if (found != kNoNode) {
      stats.state = SearchState::kFound;
      return BuildRoute(arena, found, stats);
    }
    if (batch.empty()) continue;

    stats.expanded_nodes += batch.size();
    if (stats.expanded_nodes > options_.max_expanded_nodes) {
      throw ResourceExhaustionError("Search expanded " + std::to_string(stats.expanded_nodes) +
                                    " nodes (limit " + std::to_string(options_.max_expanded_nodes) +
                                    ") without reaching " + ep.name);
    }

    const std::vector<std::vector<IndexHit>> hits = QueryBatch(arena, batch);
    stats.index_queries += batch.size();

    for (std::size_t i = 0; i < batch.size(); ++i) {
      // copy: push() may reallocate the arena
      const SearchNode parent = arena[batch[i]];
      for (const IndexHit& h : hits[i]) {
        SearchNode succ;
        succ.point = h.point;
        succ.hops = parent.hops + 1;
        succ.hop_ly = h.distance_ly;
        succ.cumulative_ly = parent.cumulative_ly + h.distance_ly;
        succ.longest_hop_ly = std::max(parent.longest_hop_ly, h.distance_ly);
        succ.parent = static_cast<std::int64_t>(batch[i]);

        const std::uint32_t prev = best_node[h.point];
        if (prev != kNoNode && !Better(succ, arena[prev])) continue;
        push(succ);
      }
    }

    if (options_.progress && options_.progress_every > 0 && stats.expanded_nodes >= next_progress) {
      options_.progress(stats, arena[batch.front()].hops);
      next_progress = stats.expanded_nodes + options_.progress_every;
    }
  }

  stats.state = SearchState::kExhausted;
  throw NoRouteFoundError("No route from " + sp.name + " to " + ep.name + " (explored " +
                          std::to_string(stats.expanded_nodes) + " nodes)");
}

Route RouteSearchEngine::BuildRoute(const std::vector<SearchNode>& arena, std::uint32_t last,
                                    const SearchStats& stats) const {
  Route r;
  r.stats = stats;

  std::vector<std::uint32_t> chain;
  for (std::int64_t cur = last; cur >= 0; cur = arena[static_cast<std::size_t>(cur)].parent) {
    chain.push_back(static_cast<std::uint32_t>(cur));
  }
  std::reverse(chain.begin(), chain.end());

  r.points.reserve(chain.size());
  for (std::size_t i = 0; i < chain.size(); ++i) {
    const SearchNode& n = arena[chain[i]];
    r.points.push_back(n.point);
    if (i == 0) continue;

    const PointId from = arena[chain[i - 1]].point;
    r.hops.push_back({from, n.point, n.hop_ly});
    r.total_distance_ly += n.hop_ly;
    r.longest_hop_ly = std::max(r.longest_hop_ly, n.hop_ly);

    const double mult = options_.range.Multiplier(catalog_.Point(from).category);
    r.required_base_jump_ly = std::max(r.required_base_jump_ly, n.hop_ly / mult);
  }

  CheckRoute(r);
  return r;
}

void RouteSearchEngine::CheckRoute(const Route& route) const {
  for (const Hop& h : route.hops) {
    const StarPoint& a = catalog_.Point(h.from);
    const StarPoint& b = catalog_.Point(h.to);
    if (a.category == b.category || b.category != Opposite(a.category)) {
      throw std::logic_error("Route breaks category alternation at " + a.name + " -> " + b.name);
    }
    if (Distance(a.position, b.position) > options_.range.RangeLimit(a) + kRangeEps) {
      throw std::logic_error("Route hop " + a.name + " -> " + b.name + " exceeds range limit");
    }
  }
}

} // namespace plotter
