#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace plotter {

class StarCatalog;
class SpatialIndex;
class AliasResolver;

// ========================
// 1) Basic geometry
// ========================

// Galactic coordinates in light years (snapshot stores f32, widened on load).
struct Vec3 {
  double x{0.0};
  double y{0.0};
  double z{0.0};
};

inline double DistanceSq(const Vec3& a, const Vec3& b) {
  const double dx = a.x - b.x;
  const double dy = a.y - b.y;
  const double dz = a.z - b.z;
  return dx * dx + dy * dy + dz * dz;
}

double Distance(const Vec3& a, const Vec3& b);

// ========================
// 2) Dataset points
// ========================

// Snapshot kind byte: 1 = general (fuel) star, 2 = neutron star.
// Any other value loads as kUnknown and never takes part in routing.
enum class StarCategory : std::uint8_t {
  kUnknown = 0,
  kFuel = 1,
  kNeutron = 2,
};

const char* CategoryName(StarCategory c);

// kNeutron <-> kFuel, kUnknown stays kUnknown.
StarCategory Opposite(StarCategory c);

using PointId = std::uint32_t;
inline constexpr PointId kInvalidPoint = std::numeric_limits<PointId>::max();

struct StarPoint {
  PointId id{kInvalidPoint};   // index in the catalog
  std::string name;
  Vec3 position;
  StarCategory category{StarCategory::kUnknown};
  std::optional<double> max_jump_ly; // per-point range override
};

// ========================
// 3) Range rules
// ========================

// RangeLimit(p):
//   p.max_jump_ly                 if the point carries the attribute
//   base_jump_ly * neutron_boost  for neutron stars (supercharged jump)
//   base_jump_ly                  for fuel stars
struct RangeRule {
  double base_jump_ly{30.0};
  double neutron_boost{6.0};

  double Multiplier(StarCategory c) const {
    return c == StarCategory::kNeutron ? neutron_boost : 1.0;
  }

  double RangeLimit(const StarPoint& p) const {
    if (p.max_jump_ly) return *p.max_jump_ly;
    return base_jump_ly * Multiplier(p.category);
  }
};

// Secondary ordering inside one hop-count layer.
enum class TieBreak {
  kTotalDistance, ///< minimise cumulative distance
  kLongestHop     ///< minimise the longest single hop (required jump range)
};

const char* TieBreakName(TieBreak t);

// ========================
// 4) Search results
// ========================

struct Hop {
  PointId from{kInvalidPoint};
  PointId to{kInvalidPoint};
  double distance_ly{0.0};
};

enum class SearchState {
  kInitialized,
  kExpanding,
  kFound,
  kExhausted
};

const char* SearchStateName(SearchState s);

struct SearchStats {
  SearchState state{SearchState::kInitialized};
  std::size_t expanded_nodes{0};
  std::size_t pushed_nodes{0};
  std::size_t index_queries{0};
};

struct Route {
  std::vector<PointId> points;   // start .. end, alternating category
  std::vector<Hop> hops;         // points.size() - 1 entries

  double total_distance_ly{0.0};
  double longest_hop_ly{0.0};
  // max over hops of distance / Multiplier(from.category): the smallest
  // unboosted jump range that covers every hop (per-point overrides ignored).
  double required_base_jump_ly{0.0};

  SearchStats stats;

  std::size_t HopCount() const { return hops.size(); }
  bool Empty() const { return hops.empty(); }
};

// One emitted stop of the formatted route.
struct HopRecord {
  int stop_index{0};         // 1-based
  PointId point{kInvalidPoint};
  std::string name;
  Vec3 position;
  StarCategory category{StarCategory::kUnknown};
  double distance_ly{0.0};   // travelled since the previous emitted stop (or start)
};

// ========================
// 5) Run configuration
// ========================

struct PlotterConfig {
  std::string snapshot_path{"data/stars.bin"};
  std::string alias_path{"jumppoints.json"};
  std::string output_dir{"."};

  RangeRule range;
  TieBreak tie_break{TieBreak::kTotalDistance};

  std::size_t max_expanded_nodes{2000000};
  unsigned worker_threads{1};
};

// ========================
// 6) Per-run context passed between stages
// ========================

struct RouteContext {
  // === Inputs (not owned; must outlive the pipeline run) ===
  const StarCatalog* catalog{nullptr};
  const SpatialIndex* index{nullptr};
  const AliasResolver* aliases{nullptr};

  std::string start_label;
  std::string end_label;
  PlotterConfig config;

  // === ResolveStage ===
  PointId start{kInvalidPoint};
  PointId end{kInvalidPoint};

  // === SearchStage ===
  Route route;

  // === FormatStage ===
  std::vector<HopRecord> stops;
};

} // namespace plotter
