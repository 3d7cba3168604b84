#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "common/types.hpp"

namespace plotter::io {

// SnapshotIO reads/writes the precomputed binary star table.
//
// Layout (little endian):
//   u32 version
//   u32 count
//   count x record
//
// version 1 record: f32 x, f32 y, f32 z, u8 kind,                   u32 name_len, name bytes
// version 2 record: f32 x, f32 y, f32 z, u8 kind, f32 max_jump_ly,  u32 name_len, name bytes
//
// kind: 1 = fuel (general) star, 2 = neutron star, other = unknown.
// max_jump_ly <= 0 means "no per-point override".
// Names must be valid UTF-8.
class SnapshotIO {
public:
  static constexpr std::uint32_t kVersionBasic = 1;
  static constexpr std::uint32_t kVersionWithRange = 2;

  struct Decoded {
    std::uint32_t version{0};
    std::vector<StarPoint> points;
  };

  // Throws DataLoadError on malformed / truncated / trailing data, a name that
  // is not UTF-8, or an unsupported version.
  static Decoded Decode(const std::vector<std::uint8_t>& bytes);

  // version 1 drops max_jump_ly. Throws std::invalid_argument on an
  // unsupported version.
  static std::vector<std::uint8_t> Encode(const std::vector<StarPoint>& points,
                                          std::uint32_t version = kVersionWithRange);

  // Throws DataLoadError when the file cannot be read.
  static std::vector<std::uint8_t> ReadFile(const std::string& path);
  static void WriteFile(const std::string& path, const std::vector<std::uint8_t>& bytes);
};

} // namespace plotter::io
