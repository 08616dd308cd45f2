#include "spatial/spatial_index.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <queue>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace kn {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

// Coordinates closer than this share a cache entry
constexpr double kCacheQuantum = 1e-6;

bool is_indexable(const PositionedNode& node) {
    if (!std::isfinite(node.x) || !std::isfinite(node.y)) {
        return false;
    }
    return !node.has_z() || std::isfinite(*node.z);
}

// Slab test against a volume, for t >= 0
bool ray_reaches_volume(const Position& origin, const Position& direction, const BoundingVolume& volume) {
    const double o[3] = {origin.x, origin.y, origin.z};
    const double d[3] = {direction.x, direction.y, direction.z};
    const double lo[3] = {volume.min_x, volume.min_y, volume.min_z};
    const double hi[3] = {volume.max_x, volume.max_y, volume.max_z};

    double t_min = 0.0;
    double t_max = kInfinity;

    for (int axis = 0; axis < 3; ++axis) {
        if (d[axis] == 0.0) {
            if (o[axis] < lo[axis] || o[axis] > hi[axis]) {
                return false;
            }
            continue;
        }

        double t1 = (lo[axis] - o[axis]) / d[axis];
        double t2 = (hi[axis] - o[axis]) / d[axis];
        if (t1 > t2) std::swap(t1, t2);

        t_min = std::max(t_min, t1);
        t_max = std::min(t_max, t2);
        if (t_min > t_max) {
            return false;
        }
    }

    return true;
}

BoundingVolume expanded(const BoundingVolume& volume, double margin) {
    BoundingVolume v = volume;
    v.min_x -= margin;
    v.min_y -= margin;
    v.min_z -= margin;
    v.max_x += margin;
    v.max_y += margin;
    v.max_z += margin;
    return v;
}

} // namespace

// ============================================================================
// SpatialIndexStats
// ============================================================================

json SpatialIndexStats::to_json() const {
    json j;
    j["node_count"] = node_count;
    j["max_depth"] = max_depth;
    j["average_depth"] = average_depth;
    j["leaf_count"] = leaf_count;
    j["tree_node_count"] = tree_node_count;
    j["memory_usage"] = memory_usage;
    j["build_time_ms"] = build_time_ms;
    j["is_3d"] = is_3d;
    j["cache_hits"] = cache_hits;
    j["cache_misses"] = cache_misses;
    return j;
}

void SpatialIndexStats::print_summary() const {
    std::cout << "SpatialIndex Summary:\n";
    std::cout << "  Type: " << (is_3d ? "octree (3D)" : "quadtree (2D)") << "\n";
    std::cout << "  Nodes: " << node_count << "\n";
    std::cout << "  Tree nodes: " << tree_node_count << " (" << leaf_count << " leaves)\n";
    std::cout << "  Max depth: " << max_depth << "\n";
    std::cout << "  Average leaf depth: " << average_depth << "\n";
    std::cout << "  Memory: ~" << memory_usage / 1024 << " KB\n";
    std::cout << "  Build time: " << build_time_ms << " ms\n";
    std::cout << "  Cache: " << cache_hits << " hits, " << cache_misses << " misses\n";
}

// ============================================================================
// Construction
// ============================================================================

SpatialIndex::SpatialIndex(const SpatialIndexConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    config_ = config;
}

SpatialIndex SpatialIndex::create_fast() {
    return SpatialIndex(presets::fast());
}

SpatialIndex SpatialIndex::create_precise() {
    return SpatialIndex(presets::precise());
}

SpatialIndex SpatialIndex::create_balanced() {
    return SpatialIndex(presets::balanced());
}

SpatialIndex SpatialIndex::create_memory_efficient() {
    return SpatialIndex(presets::memory_efficient());
}

void SpatialIndex::build(const std::vector<PositionedNode>& nodes) {
    auto start = std::chrono::steady_clock::now();

    std::vector<PositionedNode> accepted;
    accepted.reserve(nodes.size());
    for (const auto& node : nodes) {
        if (is_indexable(node)) {
            accepted.push_back(node);
        } else if (config_.verbose) {
            std::cerr << "Warning: skipping node '" << node.id << "' with non-finite coordinates\n";
        }
    }

    nodes_ = std::move(accepted);
    tree_.clear();
    positions_.clear();
    bounds_ = BoundingVolume();
    ++generation_;
    cache_clear();

    is_3d_ = std::any_of(nodes_.begin(), nodes_.end(),
                         [](const PositionedNode& n) { return n.has_z(); });

    if (nodes_.empty()) {
        build_time_ms_ = 0.0;
        return;
    }

    positions_.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        positions_.push_back(node_position(node));
    }

    // Node extent, padded so boundary nodes sit inside the root
    Position lo = positions_.front();
    Position hi = positions_.front();
    for (const auto& p : positions_) {
        lo.x = std::min(lo.x, p.x);
        lo.y = std::min(lo.y, p.y);
        lo.z = std::min(lo.z, p.z);
        hi.x = std::max(hi.x, p.x);
        hi.y = std::max(hi.y, p.y);
        hi.z = std::max(hi.z, p.z);
    }

    double max_extent = std::max(hi.x - lo.x, hi.y - lo.y);
    if (is_3d_) {
        max_extent = std::max(max_extent, hi.z - lo.z);
    }
    const double padding = 0.1 * max_extent + 10.0;

    bounds_.min_x = lo.x - padding;
    bounds_.min_y = lo.y - padding;
    bounds_.max_x = hi.x + padding;
    bounds_.max_y = hi.y + padding;
    if (is_3d_) {
        bounds_.min_z = lo.z - padding;
        bounds_.max_z = hi.z + padding;
    }

    TreeNode root;
    root.bounds = bounds_;
    root.items.resize(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i) {
        root.items[i] = i;
    }
    tree_.push_back(std::move(root));
    subdivide(0);

    auto end = std::chrono::steady_clock::now();
    build_time_ms_ = std::chrono::duration<double, std::milli>(end - start).count();

    if (config_.verbose) {
        std::cout << "Built " << (is_3d_ ? "octree" : "quadtree") << " over "
                  << nodes_.size() << " nodes: " << tree_.size() << " tree nodes in "
                  << build_time_ms_ << " ms\n";
    }
}

void SpatialIndex::subdivide(size_t tree_index) {
    if (tree_[tree_index].items.size() <= static_cast<size_t>(config_.max_nodes_per_leaf) ||
        tree_[tree_index].depth >= config_.max_depth) {
        return;
    }

    // tree_ grows below, so work from copies and indices only
    const BoundingVolume parent = tree_[tree_index].bounds;
    const Position mid = parent.center();
    const int depth = tree_[tree_index].depth + 1;
    std::vector<size_t> items = std::move(tree_[tree_index].items);
    tree_[tree_index].items.clear();

    const size_t first = tree_.size();
    const size_t count = child_count();
    tree_[tree_index].first_child = static_cast<int>(first);
    tree_.resize(first + count);

    for (size_t c = 0; c < count; ++c) {
        BoundingVolume& b = tree_[first + c].bounds;
        b.min_x = (c & 1) ? mid.x : parent.min_x;
        b.max_x = (c & 1) ? parent.max_x : mid.x;
        b.min_y = (c & 2) ? mid.y : parent.min_y;
        b.max_y = (c & 2) ? parent.max_y : mid.y;
        b.min_z = (c & 4) ? mid.z : parent.min_z;
        b.max_z = (c & 4) ? parent.max_z : mid.z;
        tree_[first + c].depth = depth;
    }

    for (size_t item : items) {
        const Position& p = positions_[item];
        size_t child = 0;
        if (p.x >= mid.x) child |= 1;
        if (p.y >= mid.y) child |= 2;
        if (is_3d_ && p.z >= mid.z) child |= 4;
        tree_[first + child].items.push_back(item);
    }

    for (size_t c = 0; c < count; ++c) {
        subdivide(first + c);
    }
}

void SpatialIndex::rebuild() {
    std::vector<PositionedNode> nodes = nodes_;
    build(nodes);
}

void SpatialIndex::rebuild(const std::vector<PositionedNode>& nodes) {
    // nodes may alias nodes_
    std::vector<PositionedNode> snapshot = nodes;
    clear();
    build(snapshot);
}

void SpatialIndex::rebuild(const std::vector<PositionedNode>& nodes, const SpatialIndexConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    std::vector<PositionedNode> snapshot = nodes;
    config_ = config;
    clear();
    build(snapshot);
}

void SpatialIndex::clear() {
    nodes_.clear();
    positions_.clear();
    tree_.clear();
    bounds_ = BoundingVolume();
    is_3d_ = false;
    build_time_ms_ = 0.0;
    ++generation_;
    cache_clear();
}

void SpatialIndex::set_config(const SpatialIndexConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    config_ = config;
    if (!nodes_.empty()) {
        rebuild();
    } else {
        cache_clear();
    }
}

Position SpatialIndex::node_position(const PositionedNode& node) const {
    return {node.x, node.y, (is_3d_ && node.has_z()) ? *node.z : 0.0};
}

Position SpatialIndex::query_position(const Point& point) const {
    return {point.x, point.y, is_3d_ ? point.z.value_or(0.0) : 0.0};
}

// ============================================================================
// Queries
// ============================================================================

std::vector<size_t> SpatialIndex::collect_within(const Position& center, double radius) const {
    std::vector<size_t> result;
    if (tree_.empty()) {
        return result;
    }

    const double radius_sq = radius * radius;
    std::vector<size_t> stack = {0};

    while (!stack.empty()) {
        const TreeNode& node = tree_[stack.back()];
        stack.pop_back();

        if (node.bounds.squared_distance_to(center) > radius_sq) continue;

        if (node.is_leaf()) {
            for (size_t item : node.items) {
                if (squared_distance(positions_[item], center) <= radius_sq) {
                    result.push_back(item);
                }
            }
        } else {
            for (size_t c = 0; c < child_count(); ++c) {
                stack.push_back(static_cast<size_t>(node.first_child) + c);
            }
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

std::vector<size_t> SpatialIndex::collect_in_volume(const BoundingVolume& volume) const {
    std::vector<size_t> result;
    if (tree_.empty()) {
        return result;
    }

    std::vector<size_t> stack = {0};

    while (!stack.empty()) {
        const TreeNode& node = tree_[stack.back()];
        stack.pop_back();

        if (!node.bounds.intersects(volume)) continue;

        if (node.is_leaf()) {
            for (size_t item : node.items) {
                if (volume.contains(positions_[item])) {
                    result.push_back(item);
                }
            }
        } else {
            for (size_t c = 0; c < child_count(); ++c) {
                stack.push_back(static_cast<size_t>(node.first_child) + c);
            }
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

std::vector<PositionedNode> SpatialIndex::query_point(const Point& point, double radius) const {
    const Position center = query_position(point);
    const double r = std::max(0.0, radius);

    if (!config_.enable_caching) {
        return materialize(collect_within(center, r));
    }

    const std::string key = cache_key('p', {center.x, center.y, center.z, r});
    if (auto cached = cache_get(key)) {
        return materialize(*cached);
    }

    auto result = collect_within(center, r);
    cache_put(key, result);
    return materialize(result);
}

std::vector<PositionedNode> SpatialIndex::query_region(const Rectangle& region) const {
    BoundingVolume volume;
    volume.min_x = region.x;
    volume.min_y = region.y;
    volume.max_x = region.x + region.width;
    volume.max_y = region.y + region.height;
    volume.min_z = -kInfinity;
    volume.max_z = kInfinity;
    return cached_volume_query(volume.normalized());
}

std::vector<PositionedNode> SpatialIndex::query_region(const Box& region) const {
    BoundingVolume volume;
    volume.min_x = region.x;
    volume.min_y = region.y;
    volume.max_x = region.x + region.width;
    volume.max_y = region.y + region.height;
    if (is_3d_) {
        volume.min_z = region.z;
        volume.max_z = region.z + region.depth;
    } else {
        volume.min_z = -kInfinity;
        volume.max_z = kInfinity;
    }
    return cached_volume_query(volume.normalized());
}

std::vector<PositionedNode> SpatialIndex::cached_volume_query(const BoundingVolume& volume) const {
    if (!config_.enable_caching) {
        return materialize(collect_in_volume(volume));
    }

    const std::string key = cache_key('r', {volume.min_x, volume.min_y, volume.min_z,
                                            volume.max_x, volume.max_y, volume.max_z});
    if (auto cached = cache_get(key)) {
        return materialize(*cached);
    }

    auto result = collect_in_volume(volume);
    cache_put(key, result);
    return materialize(result);
}

std::vector<Intersection> SpatialIndex::query_ray(const Ray& ray) const {
    std::vector<Intersection> result;
    if (tree_.empty()) {
        return result;
    }

    const Position origin = query_position(ray.origin);
    auto direction = normalize(query_position(ray.direction));
    if (!direction) {
        return result;
    }

    const double tolerance = config_.ray_intersection_tolerance;
    std::vector<std::pair<size_t, Intersection>> hits;
    std::vector<size_t> stack = {0};

    while (!stack.empty()) {
        const TreeNode& node = tree_[stack.back()];
        stack.pop_back();

        if (!ray_reaches_volume(origin, *direction, expanded(node.bounds, tolerance))) continue;

        if (!node.is_leaf()) {
            for (size_t c = 0; c < child_count(); ++c) {
                stack.push_back(static_cast<size_t>(node.first_child) + c);
            }
            continue;
        }

        for (size_t item : node.items) {
            const double t = dot(positions_[item] - origin, *direction);
            if (t < 0.0) continue;

            const Position closest = origin + *direction * t;
            const double offset = distance(positions_[item], closest);
            if (offset > tolerance) continue;

            Intersection hit;
            hit.node = nodes_[item];
            hit.point = closest;
            hit.distance = t;
            hit.offset = offset;
            hit.direct_hit = offset < config_.point_query_tolerance;
            hits.emplace_back(item, std::move(hit));
        }
    }

    std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
        if (a.second.distance != b.second.distance) {
            return a.second.distance < b.second.distance;
        }
        return a.first < b.first;
    });

    result.reserve(hits.size());
    for (auto& entry : hits) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

std::optional<NodeDistance> SpatialIndex::find_nearest(const Point& point,
                                                       std::optional<double> max_distance) const {
    if (tree_.empty()) {
        return std::nullopt;
    }

    const Position center = query_position(point);
    if (!std::isfinite(center.x) || !std::isfinite(center.y) || !std::isfinite(center.z)) {
        return std::nullopt;
    }

    double limit_sq = kInfinity;
    if (max_distance) {
        if (!(*max_distance >= 0.0)) {
            return std::nullopt;
        }
        limit_sq = *max_distance * *max_distance;
    }

    // Boxes before items at equal distance, so ties resolve to the lowest index
    struct Candidate {
        double distance_sq;
        bool is_item;
        size_t index;
    };
    auto farther = [](const Candidate& a, const Candidate& b) {
        if (a.distance_sq != b.distance_sq) return a.distance_sq > b.distance_sq;
        if (a.is_item != b.is_item) return a.is_item;
        return a.index > b.index;
    };
    std::priority_queue<Candidate, std::vector<Candidate>, decltype(farther)> queue(farther);

    queue.push({tree_[0].bounds.squared_distance_to(center), false, 0});

    while (!queue.empty()) {
        const Candidate current = queue.top();
        queue.pop();

        if (current.distance_sq > limit_sq) {
            return std::nullopt;
        }

        if (current.is_item) {
            return NodeDistance{nodes_[current.index], std::sqrt(current.distance_sq)};
        }

        const TreeNode& node = tree_[current.index];
        if (node.is_leaf()) {
            for (size_t item : node.items) {
                queue.push({squared_distance(positions_[item], center), true, item});
            }
        } else {
            for (size_t c = 0; c < child_count(); ++c) {
                const size_t child = static_cast<size_t>(node.first_child) + c;
                queue.push({tree_[child].bounds.squared_distance_to(center), false, child});
            }
        }
    }

    return std::nullopt;
}

std::vector<NodeDistance> SpatialIndex::get_nodes_within_distance(const Point& point,
                                                                  double max_distance) const {
    const Position center = query_position(point);
    auto indices = collect_within(center, std::max(0.0, max_distance));

    std::vector<NodeDistance> result;
    result.reserve(indices.size());
    for (size_t item : indices) {
        result.push_back({nodes_[item], distance(positions_[item], center)});
    }

    std::stable_sort(result.begin(), result.end(),
        [](const NodeDistance& a, const NodeDistance& b) { return a.distance < b.distance; });

    return result;
}

std::vector<PositionedNode> SpatialIndex::materialize(const std::vector<size_t>& indices) const {
    std::vector<PositionedNode> result;
    result.reserve(indices.size());
    for (size_t item : indices) {
        result.push_back(nodes_[item]);
    }
    return result;
}

// ============================================================================
// Query cache
// ============================================================================

std::string SpatialIndex::cache_key(char kind, std::initializer_list<double> values) const {
    std::ostringstream key;
    key << kind << generation_;

    for (double v : values) {
        key << ':';
        if (std::isfinite(v) && std::fabs(v) < 1e12) {
            key << std::llround(v / kCacheQuantum);
        } else {
            // Out of quantisation range, keep the exact value
            key << std::hexfloat << v << std::defaultfloat;
        }
    }

    return key.str();
}

std::optional<std::vector<size_t>> SpatialIndex::cache_get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    auto it = cache_lookup_.find(key);
    if (it == cache_lookup_.end()) {
        ++cache_misses_;
        return std::nullopt;
    }

    ++cache_hits_;
    cache_entries_.splice(cache_entries_.begin(), cache_entries_, it->second);
    return it->second->second;
}

void SpatialIndex::cache_put(const std::string& key, const std::vector<size_t>& result) const {
    if (config_.cache_size == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);

    auto it = cache_lookup_.find(key);
    if (it != cache_lookup_.end()) {
        it->second->second = result;
        cache_entries_.splice(cache_entries_.begin(), cache_entries_, it->second);
        return;
    }

    cache_entries_.emplace_front(key, result);
    cache_lookup_[key] = cache_entries_.begin();

    while (cache_entries_.size() > static_cast<size_t>(config_.cache_size)) {
        cache_lookup_.erase(cache_entries_.back().first);
        cache_entries_.pop_back();
    }
}

void SpatialIndex::cache_clear() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_entries_.clear();
    cache_lookup_.clear();
}

// ============================================================================
// Inspection
// ============================================================================

SpatialIndexStats SpatialIndex::get_statistics() const {
    SpatialIndexStats stats;
    stats.node_count = nodes_.size();
    stats.tree_node_count = tree_.size();
    stats.build_time_ms = build_time_ms_;
    stats.is_3d = is_3d_;

    size_t depth_sum = 0;
    size_t item_slots = 0;
    for (const auto& node : tree_) {
        item_slots += node.items.capacity();
        if (!node.is_leaf()) continue;

        ++stats.leaf_count;
        depth_sum += static_cast<size_t>(node.depth);
        stats.max_depth = std::max(stats.max_depth, node.depth);
    }

    if (stats.leaf_count > 0) {
        stats.average_depth = static_cast<double>(depth_sum) / stats.leaf_count;
    }

    stats.memory_usage = tree_.size() * sizeof(TreeNode) +
                         item_slots * sizeof(size_t) +
                         nodes_.size() * (sizeof(PositionedNode) + sizeof(Position));
    for (const auto& node : nodes_) {
        stats.memory_usage += node.id.capacity();
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    stats.cache_hits = cache_hits_;
    stats.cache_misses = cache_misses_;
    return stats;
}

void SpatialIndex::append_tree_json(size_t tree_index, json& out) const {
    const TreeNode& node = tree_[tree_index];
    out["bounds"] = node.bounds.to_json();
    out["depth"] = node.depth;

    if (node.is_leaf()) {
        json ids = json::array();
        for (size_t item : node.items) {
            ids.push_back(nodes_[item].id);
        }
        out["nodes"] = ids;
        return;
    }

    json children = json::array();
    for (size_t c = 0; c < child_count(); ++c) {
        json child;
        append_tree_json(static_cast<size_t>(node.first_child) + c, child);
        children.push_back(std::move(child));
    }
    out["children"] = children;
}

json SpatialIndex::to_json() const {
    json j;
    j["config"] = config_.to_json();
    j["is_3d"] = is_3d_;
    j["node_count"] = nodes_.size();
    j["bounds"] = bounds_.to_json();

    if (tree_.empty()) {
        j["tree"] = nullptr;
    } else {
        json root;
        append_tree_json(0, root);
        j["tree"] = root;
    }

    return j;
}

} // namespace kn
