#ifndef KN_SPATIAL_INDEX_HPP
#define KN_SPATIAL_INDEX_HPP

#include "spatial/geometry.hpp"
#include "spatial/index_config.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <initializer_list>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kn {

/**
 * @brief Shape and bookkeeping figures for a built index
 */
struct SpatialIndexStats {
    size_t node_count = 0;          // Nodes stored in the tree
    int max_depth = 0;              // Deepest leaf, root is depth 0
    double average_depth = 0.0;     // Mean leaf depth
    size_t leaf_count = 0;
    size_t tree_node_count = 0;     // Internal nodes plus leaves
    size_t memory_usage = 0;        // Approximate bytes
    double build_time_ms = 0.0;
    bool is_3d = false;
    size_t cache_hits = 0;
    size_t cache_misses = 0;

    nlohmann::json to_json() const;
    void print_summary() const;
};

/**
 * @brief Quadtree (2D) or octree (3D) over positioned nodes
 *
 * The tree lives in one vector; children of a split node occupy
 * [first_child, first_child + 2^d). Dimensionality is chosen at build time:
 * the index is 3D when any node carries a z coordinate.
 *
 * Queries are const and may run concurrently with each other. build(),
 * rebuild(), clear() and set_config() must not overlap with queries.
 */
class SpatialIndex {
public:
    explicit SpatialIndex(const SpatialIndexConfig& config = SpatialIndexConfig());

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    static SpatialIndex create_fast();
    static SpatialIndex create_precise();
    static SpatialIndex create_balanced();
    static SpatialIndex create_memory_efficient();

    // ==========================================
    // Construction
    // ==========================================

    /**
     * @brief Replace the indexed nodes and rebuild the tree
     *
     * Nodes with a non-finite coordinate are left out.
     */
    void build(const std::vector<PositionedNode>& nodes);
    // Re-index the current nodes
    void rebuild();

    // Drop everything and index a new node set
    void rebuild(const std::vector<PositionedNode>& nodes);

    // Validates and applies config before indexing; throws std::invalid_argument
    void rebuild(const std::vector<PositionedNode>& nodes, const SpatialIndexConfig& config);
    void clear();

    // Validates first, throws std::invalid_argument; rebuilds when populated
    void set_config(const SpatialIndexConfig& config);
    const SpatialIndexConfig& get_config() const { return config_; }

    // ==========================================
    // Queries
    // ==========================================

    /**
     * @brief Nodes within radius of point, inclusive, in insertion order
     *
     * Negative radii act as 0. A 2D point on a 3D index has z = 0;
     * z is ignored on a 2D index.
     */
    std::vector<PositionedNode> query_point(const Point& point, double radius = 0.0) const;

    // A rectangle on a 3D index spans every z
    std::vector<PositionedNode> query_region(const Rectangle& region) const;

    // z extent is ignored on a 2D index
    std::vector<PositionedNode> query_region(const Box& region) const;

    /**
     * @brief Nodes lying within ray_intersection_tolerance of the ray
     *
     * Nodes behind the origin are excluded. Sorted by distance along the
     * ray. A zero direction yields no intersections.
     */
    std::vector<Intersection> query_ray(const Ray& ray) const;

    /**
     * @brief Closest node, optionally limited to max_distance (inclusive)
     */
    std::optional<NodeDistance> find_nearest(const Point& point,
                                             std::optional<double> max_distance = std::nullopt) const;

    // Sorted by ascending distance
    std::vector<NodeDistance> get_nodes_within_distance(const Point& point, double max_distance) const;

    // ==========================================
    // Inspection
    // ==========================================

    SpatialIndexStats get_statistics() const;

    bool is_3d() const { return is_3d_; }
    bool empty() const { return nodes_.empty(); }
    const std::vector<PositionedNode>& nodes() const { return nodes_; }
    const BoundingVolume& bounds() const { return bounds_; }

    // Config, bounds and the full tree with node ids in the leaves
    nlohmann::json to_json() const;

private:
    struct TreeNode {
        BoundingVolume bounds;
        std::vector<size_t> items;   // Indices into nodes_, leaves only
        int depth = 0;
        int first_child = -1;

        bool is_leaf() const { return first_child < 0; }
    };

    SpatialIndexConfig config_;
    std::vector<PositionedNode> nodes_;
    std::vector<Position> positions_;   // Parallel to nodes_
    std::vector<TreeNode> tree_;
    BoundingVolume bounds_;
    bool is_3d_ = false;
    size_t generation_ = 0;
    double build_time_ms_ = 0.0;

    // LRU of point/region results, most recent at the front
    using CacheEntry = std::pair<std::string, std::vector<size_t>>;
    mutable std::mutex cache_mutex_;
    mutable std::list<CacheEntry> cache_entries_;
    mutable std::unordered_map<std::string, std::list<CacheEntry>::iterator> cache_lookup_;
    mutable size_t cache_hits_ = 0;
    mutable size_t cache_misses_ = 0;

    size_t child_count() const { return is_3d_ ? 8 : 4; }
    Position node_position(const PositionedNode& node) const;
    Position query_position(const Point& point) const;

    void subdivide(size_t tree_index);
    void append_tree_json(size_t tree_index, nlohmann::json& out) const;

    std::vector<size_t> collect_within(const Position& center, double radius) const;
    std::vector<size_t> collect_in_volume(const BoundingVolume& volume) const;
    std::vector<PositionedNode> cached_volume_query(const BoundingVolume& volume) const;

    std::string cache_key(char kind, std::initializer_list<double> values) const;
    std::optional<std::vector<size_t>> cache_get(const std::string& key) const;
    void cache_put(const std::string& key, const std::vector<size_t>& result) const;
    void cache_clear();

    std::vector<PositionedNode> materialize(const std::vector<size_t>& indices) const;
};

} // namespace kn

#endif // KN_SPATIAL_INDEX_HPP
