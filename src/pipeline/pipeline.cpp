#include "pipeline/pipeline.hpp"

#include <utility>

#include "stages/format_stage.hpp"
#include "stages/resolve_stage.hpp"
#include "stages/search_stage.hpp"

namespace plotter {

Pipeline::Pipeline() : Pipeline(SearchStage::ProgressFn{}) {}

Pipeline::Pipeline(SearchStage::ProgressFn progress) {
  stages_.emplace_back(std::make_unique<ResolveStage>());
  stages_.emplace_back(std::make_unique<SearchStage>(std::move(progress)));
  stages_.emplace_back(std::make_unique<FormatStage>());
}

void Pipeline::Run(RouteContext& ctx) {
  for (auto& stage : stages_) {
    stage->Run(ctx);
  }
}

} // namespace plotter
