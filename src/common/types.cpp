#include "common/types.hpp"

#include <cmath>

namespace plotter {

double Distance(const Vec3& a, const Vec3& b) {
  return std::sqrt(DistanceSq(a, b));
}

const char* CategoryName(StarCategory c) {
  switch (c) {
    case StarCategory::kNeutron: return "neutron";
    case StarCategory::kFuel:    return "fuel";
    case StarCategory::kUnknown: break;
  }
  return "unknown";
}

StarCategory Opposite(StarCategory c) {
  switch (c) {
    case StarCategory::kNeutron: return StarCategory::kFuel;
    case StarCategory::kFuel:    return StarCategory::kNeutron;
    case StarCategory::kUnknown: break;
  }
  return StarCategory::kUnknown;
}

const char* TieBreakName(TieBreak t) {
  return t == TieBreak::kLongestHop ? "longest_hop" : "total_distance";
}

const char* SearchStateName(SearchState s) {
  switch (s) {
    case SearchState::kInitialized: return "INITIALIZED";
    case SearchState::kExpanding:   return "EXPANDING";
    case SearchState::kFound:       return "FOUND";
    case SearchState::kExhausted:   return "EXHAUSTED";
  }
  return "?";
}

} // namespace plotter
