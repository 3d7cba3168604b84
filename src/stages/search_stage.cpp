#include "stages/search_stage.hpp"

#include <stdexcept>

#include "search/route_search_engine.hpp"

namespace plotter {

void SearchStage::Run(RouteContext& ctx) {
  if (!ctx.catalog || !ctx.index) {
    throw std::invalid_argument("SearchStage: ctx.catalog / ctx.index is null");
  }

  ctx.route = Route{};

  SearchOptions opts = SearchOptions::FromConfig(ctx.config);
  opts.progress = progress_;

  RouteSearchEngine engine(*ctx.catalog, *ctx.index, opts);
  ctx.route = engine.Search(ctx.start, ctx.end);
}

} // namespace plotter
