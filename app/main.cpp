#include <exception>
#include <iostream>
#include <string>

#include "catalog/alias_resolver.hpp"
#include "io/config_io.hpp"
#include "pipeline/plotter_run.hpp"

namespace {

std::string Prompt(const std::string& question) {
  std::cout << question << std::flush;
  std::string line;
  std::getline(std::cin, line);
  return line;
}

} // namespace

int main(int argc, char** argv) {
  // Usage:
  //   ./neutron_plotter
  //   ./neutron_plotter plotter_config.json
  //   ./neutron_plotter plotter_config.json "Start" "JP:Colonia" [base_jump_ly]
  // Missing start / destination are asked for on stdin.
  std::string config_path = "plotter_config.json";
  if (argc >= 2) config_path = argv[1];

  plotter::RouteContext ctx;

  try {
    ctx.config = plotter::io::ConfigIO::Load(config_path);

    std::cout << "Reminder: invoke custom system names with the prefix "
              << plotter::AliasResolver::kAliasPrefix << "\n";

    ctx.start_label = (argc >= 3) ? argv[2] : Prompt("Start system: ");
    ctx.end_label = (argc >= 4) ? argv[3] : Prompt("Destination system: ");

    std::string range_text = (argc >= 5) ? argv[4]
                                         : Prompt("Max jump distance (ly) [default " +
                                                  std::to_string(ctx.config.range.base_jump_ly) + "]: ");
    if (!range_text.empty()) {
      try {
        ctx.config.range.base_jump_ly = std::stod(range_text);
      } catch (const std::exception&) {
        std::cerr << "WARN: ignoring jump distance '" << range_text << "', keeping "
                  << ctx.config.range.base_jump_ly << " ly\n";
      }
    }
    plotter::io::ConfigIO::Validate(ctx.config);

    return plotter::RunOnce(ctx, std::cout, std::cerr);
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
