#pragma once
#include <iosfwd>

#include "common/types.hpp"

namespace plotter {

// One complete plotting run, from files on disk to files on disk:
//   1) aliases (ctx.config.alias_path; created with defaults when missing,
//      a broken file only disables aliases)
//   2) catalog + spatial index (ctx.config.snapshot_path)
//   3) resolve -> search -> format
//   4) route.txt / route.csv in ctx.config.output_dir
//
// ctx.start_label / ctx.end_label and ctx.config must be filled in; the
// catalog / index / alias pointers in ctx are only valid during the call.
//
// `out` gets the summary lines, `log` gets progress and diagnostics.
// Returns 0 on success and when no route exists (empty route written).
// Any other failure is thrown (DataLoadError, UnknownAliasError, ...).
int RunOnce(RouteContext& ctx, std::ostream& out, std::ostream& log);

} // namespace plotter
