#pragma once
#include "stages/stage_base.hpp"

namespace plotter {

// ======================
// Stage: resolve start / destination labels
//
// Input:
//   ctx.start_label / ctx.end_label ("Name" or "JP:alias")
//   ctx.aliases (optional; without it only canonical names resolve)
//   ctx.catalog
//
// Output:
//   ctx.start / ctx.end
//
// Throws UnknownAliasError / UnknownPointError.
// ======================
class ResolveStage final : public IStage {
public:
  void Run(RouteContext& ctx) override;
};

} // namespace plotter
