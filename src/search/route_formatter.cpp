#include "search/route_formatter.hpp"

#include <utility>

#include "catalog/star_catalog.hpp"

namespace plotter {

std::vector<HopRecord> RouteFormatter::Format(const Route& route, const StarCatalog& catalog) {
  std::vector<HopRecord> out;
  if (route.points.size() < 2) return out;

  double since_last = 0.0;
  for (std::size_t i = 1; i < route.points.size(); ++i) {
    since_last += route.hops[i - 1].distance_ly;

    const StarPoint& p = catalog.Point(route.points[i]);
    const bool is_end = (i + 1 == route.points.size());
    if (p.category != StarCategory::kFuel && !is_end) continue;

    HopRecord rec;
    rec.stop_index = static_cast<int>(out.size()) + 1;
    rec.point = p.id;
    rec.name = p.name;
    rec.position = p.position;
    rec.category = p.category;
    rec.distance_ly = since_last;
    out.push_back(std::move(rec));
    since_last = 0.0;
  }
  return out;
}

} // namespace plotter
