#include "catalog/spatial_index.hpp"

#include <algorithm>
#include <cmath>
#include <queue>
#include <utility>

#include "catalog/star_catalog.hpp"

namespace plotter {

namespace {

inline double Coord(const Vec3& v, int axis) {
  return axis == 0 ? v.x : (axis == 1 ? v.y : v.z);
}

// (distance^2, id) ordering shared by every query so ties are stable.
inline bool HitLess(double d2a, PointId a, double d2b, PointId b) {
  if (d2a != d2b) return d2a < d2b;
  return a < b;
}

} // namespace

SpatialIndex SpatialIndex::Build(const StarCatalog& catalog) {
  SpatialIndex idx;

  auto build_one = [&](StarCategory cat, Tree& tree) {
    std::vector<Node> items;
    items.reserve(catalog.CountOf(cat));
    for (const auto& p : catalog.AllPointsOfCategory(cat)) {
      Node n;
      n.pos = p.position;
      n.point = p.id;
      items.push_back(n);
    }
    tree.nodes.clear();
    tree.nodes.reserve(items.size());
    tree.root = BuildRec(tree, items, 0, items.size(), 0);
  };

  build_one(StarCategory::kNeutron, idx.neutron_);
  build_one(StarCategory::kFuel, idx.fuel_);
  return idx;
}

std::int32_t SpatialIndex::BuildRec(Tree& tree, std::vector<Node>& items, std::size_t l,
                                    std::size_t r, int depth) {
  if (l >= r) return -1;

  const int axis = depth % 3;
  const std::size_t mid = l + (r - l) / 2;
  std::nth_element(items.begin() + static_cast<std::ptrdiff_t>(l),
                   items.begin() + static_cast<std::ptrdiff_t>(mid),
                   items.begin() + static_cast<std::ptrdiff_t>(r),
                   [axis](const Node& a, const Node& b) {
                     const double ca = Coord(a.pos, axis);
                     const double cb = Coord(b.pos, axis);
                     if (ca != cb) return ca < cb;
                     return a.point < b.point;
                   });

  const std::int32_t self = static_cast<std::int32_t>(tree.nodes.size());
  Node node = items[mid];
  node.axis = static_cast<std::uint8_t>(axis);
  tree.nodes.push_back(node);

  const std::int32_t left = BuildRec(tree, items, l, mid, depth + 1);
  const std::int32_t right = BuildRec(tree, items, mid + 1, r, depth + 1);
  tree.nodes[static_cast<std::size_t>(self)].left = left;
  tree.nodes[static_cast<std::size_t>(self)].right = right;
  return self;
}

const SpatialIndex::Tree* SpatialIndex::TreeFor(StarCategory category) const {
  switch (category) {
    case StarCategory::kNeutron: return &neutron_;
    case StarCategory::kFuel:    return &fuel_;
    case StarCategory::kUnknown: break;
  }
  return nullptr;
}

std::size_t SpatialIndex::Size(StarCategory category) const {
  const Tree* t = TreeFor(category);
  return t ? t->nodes.size() : 0;
}

std::vector<IndexHit> SpatialIndex::Query(const Vec3& position, StarCategory category,
                                          double radius_ly, std::size_t max_results) const {
  std::vector<IndexHit> out;
  const Tree* tree = TreeFor(category);
  if (!tree || tree->root < 0 || !(radius_ly >= 0.0)) return out;

  const double r2 = radius_ly * radius_ly;

  // (d2, id) collected first, sqrt only for survivors
  std::vector<std::pair<double, PointId>> found;

  std::vector<std::int32_t> stack;
  stack.push_back(tree->root);
  while (!stack.empty()) {
    const std::int32_t ni = stack.back();
    stack.pop_back();
    const Node& n = tree->nodes[static_cast<std::size_t>(ni)];

    const double d2 = DistanceSq(position, n.pos);
    if (d2 <= r2) found.emplace_back(d2, n.point);

    const double diff = Coord(position, n.axis) - Coord(n.pos, n.axis);
    const std::int32_t near_side = diff <= 0.0 ? n.left : n.right;
    const std::int32_t far_side = diff <= 0.0 ? n.right : n.left;
    if (far_side >= 0 && diff * diff <= r2) stack.push_back(far_side);
    if (near_side >= 0) stack.push_back(near_side);
  }

  std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
    return HitLess(a.first, a.second, b.first, b.second);
  });
  if (max_results > 0 && found.size() > max_results) found.resize(max_results);

  out.reserve(found.size());
  for (const auto& f : found) out.push_back({f.second, std::sqrt(f.first)});
  return out;
}

std::vector<IndexHit> SpatialIndex::Nearest(const Vec3& position, StarCategory category,
                                            std::size_t k) const {
  std::vector<IndexHit> out;
  const Tree* tree = TreeFor(category);
  if (!tree || tree->root < 0 || k == 0) return out;

  // max-heap on (d2, id): top() is the current worst of the k kept
  using Item = std::pair<double, PointId>;
  auto worse = [](const Item& a, const Item& b) { return HitLess(a.first, a.second, b.first, b.second); };
  std::priority_queue<Item, std::vector<Item>, decltype(worse)> heap(worse);

  std::vector<std::int32_t> stack;
  stack.push_back(tree->root);
  while (!stack.empty()) {
    const std::int32_t ni = stack.back();
    stack.pop_back();
    const Node& n = tree->nodes[static_cast<std::size_t>(ni)];

    const double d2 = DistanceSq(position, n.pos);
    if (heap.size() < k) {
      heap.emplace(d2, n.point);
    } else if (HitLess(d2, n.point, heap.top().first, heap.top().second)) {
      heap.pop();
      heap.emplace(d2, n.point);
    }

    const double diff = Coord(position, n.axis) - Coord(n.pos, n.axis);
    const std::int32_t near_side = diff <= 0.0 ? n.left : n.right;
    const std::int32_t far_side = diff <= 0.0 ? n.right : n.left;
    // far side can still hold a closer point while the heap is not full or the
    // splitting plane is within the current worst distance
    if (far_side >= 0 && (heap.size() < k || diff * diff <= heap.top().first)) {
      stack.push_back(far_side);
    }
    if (near_side >= 0) stack.push_back(near_side);
  }

  std::vector<Item> items;
  items.reserve(heap.size());
  while (!heap.empty()) {
    items.push_back(heap.top());
    heap.pop();
  }
  std::reverse(items.begin(), items.end());
  out.reserve(items.size());
  for (const auto& it : items) out.push_back({it.second, std::sqrt(it.first)});
  return out;
}

} // namespace plotter
