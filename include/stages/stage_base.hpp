#pragma once
#include "common/types.hpp"

namespace plotter {

// Each step of a run is a Stage; inputs and outputs travel through
// RouteContext. Run() overwrites its own outputs so a stage can be re-run.
class IStage {
public:
  virtual ~IStage() = default;
  virtual void Run(RouteContext& ctx) = 0;
};

} // namespace plotter
