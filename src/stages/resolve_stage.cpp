#include "stages/resolve_stage.hpp"

#include <stdexcept>

#include "catalog/alias_resolver.hpp"
#include "catalog/star_catalog.hpp"

namespace plotter {

void ResolveStage::Run(RouteContext& ctx) {
  if (!ctx.catalog) throw std::invalid_argument("ResolveStage: ctx.catalog is null");

  ctx.start = kInvalidPoint;
  ctx.end = kInvalidPoint;

  const AliasResolver no_aliases;
  const AliasResolver& resolver = ctx.aliases ? *ctx.aliases : no_aliases;

  ctx.start = resolver.Resolve(ctx.start_label, *ctx.catalog);
  ctx.end = resolver.Resolve(ctx.end_label, *ctx.catalog);
}

} // namespace plotter
