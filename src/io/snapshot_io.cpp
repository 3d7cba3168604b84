#include "io/snapshot_io.hpp"

#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "common/errors.hpp"

namespace plotter::io {

namespace {

// Smallest possible record: xyz + kind + name_len (empty name).
constexpr std::size_t kMinRecordBytesV1 = 3 * 4 + 1 + 4;
constexpr std::size_t kMinRecordBytesV2 = kMinRecordBytesV1 + 4;

class ByteReader {
public:
  explicit ByteReader(const std::vector<std::uint8_t>& bytes) : bytes_(bytes) {}

  std::size_t Remaining() const { return bytes_.size() - pos_; }
  std::size_t Offset() const { return pos_; }

  std::uint32_t U32(const char* what) {
    Need(4, what);
    const std::uint32_t v = static_cast<std::uint32_t>(bytes_[pos_]) |
                            (static_cast<std::uint32_t>(bytes_[pos_ + 1]) << 8) |
                            (static_cast<std::uint32_t>(bytes_[pos_ + 2]) << 16) |
                            (static_cast<std::uint32_t>(bytes_[pos_ + 3]) << 24);
    pos_ += 4;
    return v;
  }

  float F32(const char* what) {
    const std::uint32_t bits = U32(what);
    float f = 0.0f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
  }

  std::uint8_t U8(const char* what) {
    Need(1, what);
    return bytes_[pos_++];
  }

  std::string Str(std::size_t len, const char* what) {
    Need(len, what);
    std::string s(reinterpret_cast<const char*>(bytes_.data() + pos_), len);
    pos_ += len;
    return s;
  }

private:
  void Need(std::size_t n, const char* what) const {
    if (Remaining() < n) {
      throw DataLoadError("Snapshot truncated while reading " + std::string(what) +
                          " at byte " + std::to_string(pos_));
    }
  }

  const std::vector<std::uint8_t>& bytes_;
  std::size_t pos_{0};
};

void PutU32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

void PutF32(std::vector<std::uint8_t>& out, float f) {
  std::uint32_t bits = 0;
  std::memcpy(&bits, &f, sizeof(bits));
  PutU32(out, bits);
}

StarCategory KindToCategory(std::uint8_t kind) {
  switch (kind) {
    case 1: return StarCategory::kFuel;
    case 2: return StarCategory::kNeutron;
    default: return StarCategory::kUnknown;
  }
}

// Well-formed UTF-8: no overlongs, no surrogates, nothing above U+10FFFF.
bool IsValidUtf8(const std::string& s) {
  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    const auto c = static_cast<unsigned char>(s[i]);
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > n) return false;
    for (std::size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += len;
  }
  return true;
}

std::uint8_t CategoryToKind(StarCategory c) {
  return static_cast<std::uint8_t>(c);
}

} // namespace

SnapshotIO::Decoded SnapshotIO::Decode(const std::vector<std::uint8_t>& bytes) {
  ByteReader rd(bytes);
  Decoded out;

  out.version = rd.U32("version");
  if (out.version != kVersionBasic && out.version != kVersionWithRange) {
    throw DataLoadError("Unsupported snapshot schema version " + std::to_string(out.version));
  }
  const bool with_range = (out.version == kVersionWithRange);

  const std::uint32_t count = rd.U32("count");
  // Reject absurd counts before reserving memory for them.
  const std::size_t min_record = with_range ? kMinRecordBytesV2 : kMinRecordBytesV1;
  if (static_cast<std::size_t>(count) > rd.Remaining() / min_record) {
    throw DataLoadError("Snapshot declares " + std::to_string(count) +
                        " records but only " + std::to_string(rd.Remaining()) + " bytes follow");
  }

  out.points.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    StarPoint p;
    p.id = i;
    p.position.x = rd.F32("x");
    p.position.y = rd.F32("y");
    p.position.z = rd.F32("z");
    if (!std::isfinite(p.position.x) || !std::isfinite(p.position.y) || !std::isfinite(p.position.z)) {
      throw DataLoadError("Snapshot record " + std::to_string(i) + " has a non-finite coordinate");
    }
    p.category = KindToCategory(rd.U8("kind"));
    if (with_range) {
      const float r = rd.F32("max_jump_ly");
      if (r > 0.0f) p.max_jump_ly = static_cast<double>(r);
    }
    const std::uint32_t len = rd.U32("name_len");
    p.name = rd.Str(len, "name");
    if (!IsValidUtf8(p.name)) {
      throw DataLoadError("Snapshot record " + std::to_string(i) + " has a name that is not valid UTF-8");
    }
    out.points.push_back(std::move(p));
  }

  if (rd.Remaining() != 0) {
    throw DataLoadError("Snapshot has " + std::to_string(rd.Remaining()) +
                        " trailing bytes after " + std::to_string(count) + " records");
  }
  return out;
}

std::vector<std::uint8_t> SnapshotIO::Encode(const std::vector<StarPoint>& points,
                                             std::uint32_t version) {
  if (version != kVersionBasic && version != kVersionWithRange) {
    throw std::invalid_argument("Unsupported snapshot schema version " + std::to_string(version));
  }

  std::vector<std::uint8_t> out;
  PutU32(out, version);
  PutU32(out, static_cast<std::uint32_t>(points.size()));
  for (const auto& p : points) {
    PutF32(out, static_cast<float>(p.position.x));
    PutF32(out, static_cast<float>(p.position.y));
    PutF32(out, static_cast<float>(p.position.z));
    out.push_back(CategoryToKind(p.category));
    if (version == kVersionWithRange) {
      PutF32(out, p.max_jump_ly ? static_cast<float>(*p.max_jump_ly) : 0.0f);
    }
    PutU32(out, static_cast<std::uint32_t>(p.name.size()));
    out.insert(out.end(), p.name.begin(), p.name.end());
  }
  return out;
}

std::vector<std::uint8_t> SnapshotIO::ReadFile(const std::string& path) {
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw DataLoadError("Failed to open snapshot: " + path);
  }
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(ifs)),
                                  std::istreambuf_iterator<char>());
  if (ifs.bad()) {
    throw DataLoadError("Failed to read snapshot: " + path);
  }
  return bytes;
}

void SnapshotIO::WriteFile(const std::string& path, const std::vector<std::uint8_t>& bytes) {
  std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!ofs) throw std::runtime_error("Failed to write: " + path);
  ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!ofs) throw std::runtime_error("Failed to write: " + path);
}

} // namespace plotter::io
