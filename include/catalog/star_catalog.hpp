#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/types.hpp"

namespace plotter {

// ======================
// Dataset store: the immutable in-memory star table.
//
// Loaded once per run from a snapshot (see io/snapshot_io.hpp) and then only
// read. Passed around by const reference; nothing in the core mutates a point
// after load.
// ======================
class StarCatalog {
public:
  // Lazy, restartable view over the points of one category.
  class CategoryView {
  public:
    class Iterator {
    public:
      using iterator_category = std::forward_iterator_tag;
      using value_type = StarPoint;
      using difference_type = std::ptrdiff_t;
      using pointer = const StarPoint*;
      using reference = const StarPoint&;

      Iterator() = default;
      Iterator(const std::vector<StarPoint>* pts, std::size_t pos, StarCategory cat)
          : pts_(pts), pos_(pos), cat_(cat) {
        SkipOthers();
      }

      reference operator*() const { return (*pts_)[pos_]; }
      pointer operator->() const { return &(*pts_)[pos_]; }

      Iterator& operator++() {
        ++pos_;
        SkipOthers();
        return *this;
      }
      Iterator operator++(int) {
        Iterator tmp = *this;
        ++(*this);
        return tmp;
      }

      bool operator==(const Iterator& o) const { return pos_ == o.pos_ && pts_ == o.pts_; }
      bool operator!=(const Iterator& o) const { return !(*this == o); }

    private:
      void SkipOthers() {
        while (pts_ && pos_ < pts_->size() && (*pts_)[pos_].category != cat_) ++pos_;
      }

      const std::vector<StarPoint>* pts_{nullptr};
      std::size_t pos_{0};
      StarCategory cat_{StarCategory::kUnknown};
    };

    CategoryView(const std::vector<StarPoint>& pts, StarCategory cat) : pts_(&pts), cat_(cat) {}

    Iterator begin() const { return Iterator(pts_, 0, cat_); }
    Iterator end() const { return Iterator(pts_, pts_->size(), cat_); }

  private:
    const std::vector<StarPoint>* pts_;
    StarCategory cat_;
  };

  StarCatalog() = default;

  // Decode a snapshot held in memory. Throws DataLoadError.
  static StarCatalog Load(const std::vector<std::uint8_t>& snapshot);
  // Read and decode a snapshot file. Throws DataLoadError.
  static StarCatalog LoadFile(const std::string& path);
  // Points are renumbered so that point.id == position in the vector.
  static StarCatalog FromPoints(std::vector<StarPoint> points);

  std::size_t PointCount() const { return points_.size(); }
  std::size_t CountOf(StarCategory c) const;

  // Throws std::out_of_range for an id outside [0, PointCount()).
  const StarPoint& Point(PointId id) const { return points_.at(id); }

  // Exact, case-sensitive match. Duplicate names resolve to the last record.
  std::optional<PointId> FindByName(const std::string& name) const;

  CategoryView AllPointsOfCategory(StarCategory c) const { return CategoryView(points_, c); }

  const std::vector<StarPoint>& Points() const { return points_; }

  // Schema version the catalog was decoded from (0 when built from points).
  std::uint32_t SchemaVersion() const { return schema_version_; }

private:
  std::vector<StarPoint> points_;
  std::unordered_map<std::string, PointId> name_to_id_;
  std::uint32_t schema_version_{0};
};

} // namespace plotter
