#pragma once
#include "stages/stage_base.hpp"

namespace plotter {

// ======================
// Stage: format
//
// Input:  ctx.route, ctx.catalog
// Output: ctx.stops (fuel stops after the start, then the destination)
// ======================
class FormatStage final : public IStage {
public:
  void Run(RouteContext& ctx) override;
};

} // namespace plotter
