#include "tests/test_framework.hpp"
#include "tests/test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "catalog/alias_resolver.hpp"
#include "catalog/spatial_index.hpp"
#include "catalog/star_catalog.hpp"
#include "common/errors.hpp"
#include "io/alias_io.hpp"
#include "io/config_io.hpp"
#include "io/output_writer.hpp"
#include "io/snapshot_io.hpp"
#include "pipeline/pipeline.hpp"
#include "pipeline/plotter_run.hpp"
#include "stages/format_stage.hpp"
#include "stages/resolve_stage.hpp"
#include "stages/search_stage.hpp"

// =========================
// Pipeline tests
// =========================
//
// Each stage writes its own ctx fields and overwrites them on a re-run.
// The end-to-end case goes through the same files the executable uses:
// snapshot -> catalog -> index -> aliases -> pipeline -> route.txt / route.csv.

namespace fs = std::filesystem;

namespace {

using plotter::AliasResolver;
using plotter::Pipeline;
using plotter::RouteContext;
using plotter::SpatialIndex;
using plotter::StarCatalog;
using plotter::StarCategory;
using plotter::test::MakeStar;

// Stars on the z axis. With base 30 / boost 6 the only route is
// Sol(F) -> Hop(N) -> Depot(F) -> Beagle(N); "Far Away" is unreachable.
StarCatalog CorridorCatalog() {
  return StarCatalog::FromPoints({
      MakeStar("Sol", StarCategory::kFuel, 0, 0, 0),
      MakeStar("Hop", StarCategory::kNeutron, 0, 0, 25),
      MakeStar("Depot", StarCategory::kFuel, 0, 0, 170),
      MakeStar("Beagle", StarCategory::kNeutron, 0, 0, 195),
      MakeStar("Far Away", StarCategory::kFuel, 5000, 0, 0),
  });
}

void Wire(RouteContext& ctx, const StarCatalog& cat, const SpatialIndex& idx, const AliasResolver* aliases) {
  ctx.catalog = &cat;
  ctx.index = &idx;
  ctx.aliases = aliases;
}

std::vector<std::string> StopNames(const RouteContext& ctx) {
  std::vector<std::string> out;
  for (const auto& s : ctx.stops) out.push_back(s.name);
  return out;
}

bool Test_Pipeline_CorridorWithAlias() {
  const StarCatalog cat = CorridorCatalog();
  const SpatialIndex idx = SpatialIndex::Build(cat);
  const AliasResolver aliases(std::map<std::string, std::string>{{"Home", "Sol"}});

  RouteContext ctx;
  Wire(ctx, cat, idx, &aliases);
  ctx.start_label = "JP:Home";
  ctx.end_label = "Beagle";

  Pipeline pipe;
  pipe.Run(ctx);

  PLOTTER_EXPECT_EQ(ctx.start, *cat.FindByName("Sol"));
  PLOTTER_EXPECT_EQ(ctx.end, *cat.FindByName("Beagle"));
  // Sol -> Hop (25) -> Depot (145 <= 180) -> Beagle (25)
  PLOTTER_EXPECT_EQ(ctx.route.HopCount(), static_cast<std::size_t>(3));
  PLOTTER_EXPECT_LY(ctx.route.total_distance_ly, 195.0);
  PLOTTER_EXPECT_LY(ctx.route.longest_hop_ly, 145.0);
  // 145 / 6 on the boosted hop, 25 on the fuel hops
  PLOTTER_EXPECT_LY(ctx.route.required_base_jump_ly, 25.0);
  PLOTTER_EXPECT_TRUE((StopNames(ctx) == std::vector<std::string>{"Depot", "Beagle"}));
  PLOTTER_EXPECT_LY(ctx.stops[0].distance_ly, 170.0);
  PLOTTER_EXPECT_LY(ctx.stops[1].distance_ly, 25.0);
  return true;
}

bool Test_Pipeline_RerunOverwritesOutputs() {
  const StarCatalog cat = CorridorCatalog();
  const SpatialIndex idx = SpatialIndex::Build(cat);

  RouteContext ctx;
  Wire(ctx, cat, idx, nullptr);
  ctx.start_label = "Sol";
  ctx.end_label = "Beagle";

  Pipeline pipe;
  pipe.Run(ctx);
  PLOTTER_EXPECT_EQ(ctx.stops.size(), static_cast<std::size_t>(2));

  ctx.end_label = "Sol";
  pipe.Run(ctx);
  PLOTTER_EXPECT_EQ(ctx.route.HopCount(), static_cast<std::size_t>(0));
  PLOTTER_EXPECT_TRUE(ctx.stops.empty());
  return true;
}

bool Test_Pipeline_NoRoutePropagates() {
  const StarCatalog cat = CorridorCatalog();
  const SpatialIndex idx = SpatialIndex::Build(cat);

  RouteContext ctx;
  Wire(ctx, cat, idx, nullptr);
  ctx.start_label = "Sol";
  ctx.end_label = "Far Away";

  Pipeline pipe;
  PLOTTER_EXPECT_THROW(pipe.Run(ctx), plotter::NoRouteFoundError);
  PLOTTER_EXPECT_TRUE(ctx.stops.empty());
  return true;
}

bool Test_Pipeline_NodeBudgetFromConfig() {
  const StarCatalog cat = CorridorCatalog();
  const SpatialIndex idx = SpatialIndex::Build(cat);

  RouteContext ctx;
  Wire(ctx, cat, idx, nullptr);
  ctx.start_label = "Sol";
  ctx.end_label = "Beagle";
  ctx.config.max_expanded_nodes = 1;

  Pipeline pipe;
  PLOTTER_EXPECT_THROW(pipe.Run(ctx), plotter::ResourceExhaustionError);
  return true;
}

bool Test_ResolveStage_Labels() {
  const StarCatalog cat = CorridorCatalog();
  const AliasResolver aliases(std::map<std::string, std::string>{{"Home", "Sol"}});

  RouteContext ctx;
  ctx.catalog = &cat;
  ctx.aliases = &aliases;

  plotter::ResolveStage stage;

  ctx.start_label = "Sol";
  ctx.end_label = "JP:Nowhere";
  PLOTTER_EXPECT_THROW(stage.Run(ctx), plotter::UnknownAliasError);

  ctx.end_label = "Atlantis";
  PLOTTER_EXPECT_THROW_MSG(stage.Run(ctx), plotter::UnknownPointError, "Atlantis");

  // without an alias table a prefixed label never resolves
  ctx.aliases = nullptr;
  ctx.end_label = "JP:Home";
  PLOTTER_EXPECT_THROW(stage.Run(ctx), plotter::UnknownAliasError);

  ctx.end_label = "Depot";
  stage.Run(ctx);
  PLOTTER_EXPECT_EQ(ctx.end, *cat.FindByName("Depot"));
  return true;
}

bool Test_Stages_RequireInputs() {
  RouteContext ctx;
  plotter::ResolveStage resolve;
  plotter::SearchStage search;
  plotter::FormatStage format;
  PLOTTER_EXPECT_THROW(resolve.Run(ctx), std::invalid_argument);
  PLOTTER_EXPECT_THROW(search.Run(ctx), std::invalid_argument);
  PLOTTER_EXPECT_THROW(format.Run(ctx), std::invalid_argument);
  return true;
}

bool Test_EndToEnd_FilesOnDisk() {
  const fs::path dir = fs::temp_directory_path() / "plotter_pipeline_e2e";
  fs::remove_all(dir);
  fs::create_directories(dir);

  // run configuration + snapshot + alias file, as the executable sees them
  const std::string snapshot = (dir / "stars.bin").string();
  const std::string alias_file = (dir / "jumppoints.json").string();
  const std::string config_file = (dir / "plotter_config.json").string();
  const std::string out_dir = (dir / "out").string();

  plotter::io::SnapshotIO::WriteFile(snapshot,
                                     plotter::io::SnapshotIO::Encode(CorridorCatalog().Points()));
  {
    std::ofstream ofs(config_file);
    ofs << "{\"snapshot_path\": \"" << snapshot << "\", \"alias_path\": \"" << alias_file
        << "\", \"output_dir\": \"" << out_dir << "\", \"tie_break\": \"longest_hop\"}";
  }

  RouteContext ctx;
  ctx.config = plotter::io::ConfigIO::Load(config_file);
  PLOTTER_EXPECT_TRUE(ctx.config.tie_break == plotter::TieBreak::kLongestHop);

  // first run creates the default alias file; add our own entry on top
  auto table = plotter::io::AliasIO::LoadOrCreateDefault(ctx.config.alias_path);
  PLOTTER_EXPECT_EQ(table.count("Colonia"), static_cast<std::size_t>(1));
  table["Home"] = "Sol";
  const AliasResolver aliases(table);

  const StarCatalog cat = StarCatalog::LoadFile(ctx.config.snapshot_path);
  const SpatialIndex idx = SpatialIndex::Build(cat);
  Wire(ctx, cat, idx, &aliases);
  ctx.start_label = "jp:Home";
  ctx.end_label = "Beagle";

  std::size_t progress_calls = 0;
  Pipeline pipe([&progress_calls](const plotter::SearchStats&, std::size_t) { ++progress_calls; });
  pipe.Run(ctx);
  plotter::io::OutputWriter::WriteAll(ctx, ctx.config.output_dir);

  std::ifstream txt(fs::path(out_dir) / "route.txt");
  std::vector<std::string> lines;
  for (std::string line; std::getline(txt, line);) lines.push_back(line);
  PLOTTER_EXPECT_TRUE((lines == std::vector<std::string>{"Depot", "Beagle"}));
  PLOTTER_EXPECT_TRUE(fs::exists(fs::path(out_dir) / "route.csv"));
  return true;
}

// Snapshot + config on disk for RunOnce; returns the filled-in context.
RouteContext PrepareRun(const std::string& name, const std::string& start, const std::string& end) {
  const fs::path dir = fs::temp_directory_path() / ("plotter_run_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);

  RouteContext ctx;
  ctx.config.snapshot_path = (dir / "stars.bin").string();
  ctx.config.alias_path = (dir / "jumppoints.json").string();
  ctx.config.output_dir = (dir / "out").string();
  plotter::io::SnapshotIO::WriteFile(ctx.config.snapshot_path,
                                     plotter::io::SnapshotIO::Encode(CorridorCatalog().Points()));
  ctx.start_label = start;
  ctx.end_label = end;
  return ctx;
}

std::vector<std::string> FileLines(const fs::path& p) {
  std::ifstream ifs(p);
  std::vector<std::string> lines;
  for (std::string line; std::getline(ifs, line);) lines.push_back(line);
  return lines;
}

bool Test_RunOnce_UnreachableWritesEmptyRoute() {
  RouteContext ctx = PrepareRun("unreachable", "Sol", "Far Away");
  std::ostringstream out;
  std::ostringstream log;

  PLOTTER_EXPECT_EQ(plotter::RunOnce(ctx, out, log), 0);

  const fs::path dir(ctx.config.output_dir);
  PLOTTER_EXPECT_TRUE(fs::exists(dir / "route.txt"));
  PLOTTER_EXPECT_TRUE(FileLines(dir / "route.txt").empty());
  const auto csv = FileLines(dir / "route.csv");
  PLOTTER_EXPECT_EQ(csv.size(), static_cast<std::size_t>(1));
  PLOTTER_EXPECT_EQ(csv[0], std::string("stop,name,x,y,z,distance_ly"));

  PLOTTER_EXPECT_TRUE(log.str().find("No route found") != std::string::npos);
  PLOTTER_EXPECT_TRUE(out.str().find("Empty route written") != std::string::npos);
  PLOTTER_EXPECT_TRUE(ctx.catalog == nullptr && ctx.index == nullptr && ctx.aliases == nullptr);
  return true;
}

bool Test_RunOnce_FixedPointLog() {
  RouteContext ctx = PrepareRun("found", "Sol", "Beagle");
  std::ostringstream out;
  std::ostringstream log;

  PLOTTER_EXPECT_EQ(plotter::RunOnce(ctx, out, log), 0);

  // distances print with two decimals, never in scientific notation
  PLOTTER_EXPECT_TRUE(log.str().find("with base 30.00 ly (boosted 180.00 ly)") != std::string::npos);
  PLOTTER_EXPECT_TRUE(log.str().find("195.00 ly total, longest hop 145.00 ly") != std::string::npos);
  PLOTTER_EXPECT_TRUE(log.str().find("e+") == std::string::npos);
  PLOTTER_EXPECT_TRUE(out.str().find("Minimum jump range required: 25.00") != std::string::npos);
  PLOTTER_EXPECT_TRUE((FileLines(fs::path(ctx.config.output_dir) / "route.txt") ==
                       std::vector<std::string>{"Depot", "Beagle"}));
  return true;
}

bool Test_RunOnce_FatalErrorsThrow() {
  RouteContext ctx = PrepareRun("fatal", "Sol", "Atlantis");
  std::ostringstream out;
  std::ostringstream log;
  PLOTTER_EXPECT_THROW(plotter::RunOnce(ctx, out, log), plotter::UnknownPointError);
  PLOTTER_EXPECT_TRUE(!fs::exists(fs::path(ctx.config.output_dir) / "route.txt"));

  ctx.config.snapshot_path += ".missing";
  PLOTTER_EXPECT_THROW(plotter::RunOnce(ctx, out, log), plotter::DataLoadError);
  return true;
}

} // namespace

int main() {
  using plotter::test::TestCase;

  std::vector<TestCase> cases = {
      {"Pipeline: corridor route via alias", Test_Pipeline_CorridorWithAlias},
      {"Pipeline: re-run overwrites route and stops", Test_Pipeline_RerunOverwritesOutputs},
      {"Pipeline: NoRouteFoundError propagates", Test_Pipeline_NoRoutePropagates},
      {"Pipeline: node budget from config", Test_Pipeline_NodeBudgetFromConfig},
      {"ResolveStage: label errors", Test_ResolveStage_Labels},
      {"Stages: null inputs rejected", Test_Stages_RequireInputs},
      {"End to end: snapshot + config + aliases -> files", Test_EndToEnd_FilesOnDisk},
      {"RunOnce: unreachable destination -> empty route, exit 0", Test_RunOnce_UnreachableWritesEmptyRoute},
      {"RunOnce: fixed-point progress log", Test_RunOnce_FixedPointLog},
      {"RunOnce: fatal errors propagate", Test_RunOnce_FatalErrorsThrow},
  };

  return plotter::test::RunAll(cases);
}
