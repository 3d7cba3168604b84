#include "stages/format_stage.hpp"

#include <stdexcept>

#include "search/route_formatter.hpp"

namespace plotter {

void FormatStage::Run(RouteContext& ctx) {
  if (!ctx.catalog) throw std::invalid_argument("FormatStage: ctx.catalog is null");
  ctx.stops = RouteFormatter::Format(ctx.route, *ctx.catalog);
}

} // namespace plotter
