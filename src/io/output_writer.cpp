#include "io/output_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

#include "io/file_util.hpp"

namespace fs = std::filesystem;

namespace plotter::io {

void OutputWriter::WriteAll(const RouteContext& ctx, const std::string& output_dir) {
  EnsureDir(output_dir);
  WriteRouteText(ctx.stops, (fs::path(output_dir) / "route.txt").string());
  WriteRouteCsv(ctx.stops, (fs::path(output_dir) / "route.csv").string());
}

void OutputWriter::WriteRouteText(const std::vector<HopRecord>& stops, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  for (const auto& s : stops) {
    ofs << s.name << "\n";
  }
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
}

static std::string CsvField(const std::string& s) {
  // quote names that contain separators or quotes
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

void OutputWriter::WriteRouteCsv(const std::vector<HopRecord>& stops, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  ofs << "stop,name,x,y,z,distance_ly\n";
  ofs << std::fixed << std::setprecision(2);
  for (const auto& s : stops) {
    ofs << s.stop_index << "," << CsvField(s.name) << ","
        << s.position.x << "," << s.position.y << "," << s.position.z << ","
        << s.distance_ly << "\n";
  }
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
}

} // namespace plotter::io
