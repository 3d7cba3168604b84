#pragma once
#include <vector>

#include "common/types.hpp"

namespace plotter {

// Turns a route into the stop list handed to the in-game plotter.
//
// Only fuel stars are emitted: the neutron legs between them are re-plotted
// by the game itself. The start is never emitted, the end always is (as the
// last record, whatever its category). A zero-hop route gives no records.
class RouteFormatter {
public:
  static std::vector<HopRecord> Format(const Route& route, const StarCatalog& catalog);
};

} // namespace plotter
