#include "pipeline/plotter_run.hpp"

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <ostream>

#include "catalog/alias_resolver.hpp"
#include "catalog/spatial_index.hpp"
#include "catalog/star_catalog.hpp"
#include "common/errors.hpp"
#include "io/alias_io.hpp"
#include "io/output_writer.hpp"
#include "pipeline/pipeline.hpp"

namespace plotter {

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

// Clears the borrowed handles on every exit path.
struct ContextHandles {
  RouteContext& ctx;
  ~ContextHandles() {
    ctx.catalog = nullptr;
    ctx.index = nullptr;
    ctx.aliases = nullptr;
  }
};

} // namespace

int RunOnce(RouteContext& ctx, std::ostream& out, std::ostream& log) {
  out << std::fixed << std::setprecision(2);
  log << std::fixed << std::setprecision(2);

  // 1) aliases
  AliasResolver aliases;
  try {
    aliases = AliasResolver(io::AliasIO::LoadOrCreateDefault(ctx.config.alias_path));
  } catch (const ConfigError& e) {
    log << "WARN: " << e.what() << " (continuing without aliases)\n";
  }

  // 2) dataset + index
  auto t0 = std::chrono::steady_clock::now();
  const StarCatalog catalog = StarCatalog::LoadFile(ctx.config.snapshot_path);
  out << "Loaded " << catalog.PointCount() << " systems (" << catalog.CountOf(StarCategory::kNeutron)
      << " neutron, " << catalog.CountOf(StarCategory::kFuel) << " fuel) from "
      << ctx.config.snapshot_path << " in " << std::setprecision(1) << ElapsedMs(t0) << " ms\n";

  t0 = std::chrono::steady_clock::now();
  const SpatialIndex index = SpatialIndex::Build(catalog);
  out << "Built spatial index in " << ElapsedMs(t0) << " ms\n" << std::setprecision(2);

  ContextHandles handles{ctx};
  ctx.catalog = &catalog;
  ctx.index = &index;
  ctx.aliases = &aliases;

  log << "Routing " << ctx.start_label << " -> " << ctx.end_label << " with base "
      << ctx.config.range.base_jump_ly << " ly (boosted "
      << ctx.config.range.base_jump_ly * ctx.config.range.neutron_boost << " ly), tie break "
      << TieBreakName(ctx.config.tie_break) << "...\n";

  // 3) resolve -> search -> format
  Pipeline pipe([&log](const SearchStats& s, std::size_t hop) {
    log << "  ... expanded " << s.expanded_nodes << " nodes, " << s.pushed_nodes << " pushed, at hop "
        << hop << "\n";
  });

  t0 = std::chrono::steady_clock::now();
  try {
    pipe.Run(ctx);
  } catch (const NoRouteFoundError& e) {
    log << "No route found: " << e.what() << "\n";
    ctx.route = Route{};
    ctx.stops.clear();
    io::OutputWriter::WriteAll(ctx, ctx.config.output_dir);
    out << "Done. Empty route written to: " << ctx.config.output_dir << "\n";
    return 0;
  }

  const Route& r = ctx.route;
  log << "Route found in " << std::setprecision(1) << ElapsedMs(t0) << " ms: " << r.HopCount()
      << " hops, " << ctx.stops.size() << " stops, " << std::setprecision(2) << r.total_distance_ly
      << " ly total, longest hop " << r.longest_hop_ly << " ly, expanded " << r.stats.expanded_nodes
      << " nodes\n";
  out << "Minimum jump range required: " << r.required_base_jump_ly << "\n";
  out << "Total stops: " << ctx.stops.size() << "\n";

  // 4) output
  io::OutputWriter::WriteAll(ctx, ctx.config.output_dir);
  out << "Done. Output written to: " << ctx.config.output_dir << "\n";
  return 0;
}

} // namespace plotter
