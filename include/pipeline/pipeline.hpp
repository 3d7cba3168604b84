#pragma once
#include <memory>
#include <vector>

#include "common/types.hpp"
#include "stages/search_stage.hpp"
#include "stages/stage_base.hpp"

namespace plotter {

// Pipeline runs the stages of one plotting run in order:
//   resolve labels -> search -> format
// Any stage exception aborts the run; ctx keeps whatever earlier stages wrote.
class Pipeline {
public:
  Pipeline();
  explicit Pipeline(SearchStage::ProgressFn progress);

  void Run(RouteContext& ctx);

private:
  std::vector<std::unique_ptr<IStage>> stages_;
};

} // namespace plotter
