#pragma once
#include <cstddef>
#include <functional>
#include <utility>

#include "stages/stage_base.hpp"

namespace plotter {

// ======================
// Stage: route search
//
// Input:
//   ctx.start / ctx.end, ctx.catalog, ctx.index
//   ctx.config (range rule, tie break, node budget, worker threads)
//
// Output:
//   ctx.route
//
// Throws NoRouteFoundError / ResourceExhaustionError.
// ======================
class SearchStage final : public IStage {
public:
  using ProgressFn = std::function<void(const SearchStats&, std::size_t)>;

  SearchStage() = default;
  explicit SearchStage(ProgressFn progress) : progress_(std::move(progress)) {}

  void Run(RouteContext& ctx) override;

private:
  ProgressFn progress_;
};

} // namespace plotter
