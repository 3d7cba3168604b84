#pragma once
#include <string>
#include <vector>

#include "common/types.hpp"

namespace plotter::io {

// OutputWriter writes the formatted stops (ctx.stops) to output_dir:
// 1) route.txt: one stop name per line, first line = first stop after start
// 2) route.csv: stop,name,x,y,z,distance_ly
class OutputWriter {
public:
  static void WriteAll(const RouteContext& ctx, const std::string& output_dir);

  static void WriteRouteText(const std::vector<HopRecord>& stops, const std::string& output_path);
  static void WriteRouteCsv(const std::vector<HopRecord>& stops, const std::string& output_path);
};

} // namespace plotter::io
