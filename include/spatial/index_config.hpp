#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace kn {

/**
 * @brief Tree shape, cache and query tolerances for a SpatialIndex
 */
struct SpatialIndexConfig {
    int max_depth = 6;                         // Levels below the root
    int max_nodes_per_leaf = 10;               // Split threshold
    bool enable_caching = true;                // Memoise point and region queries
    int cache_size = 100;                      // LRU capacity
    double ray_intersection_tolerance = 1.0;   // Max node offset from a ray
    double point_query_tolerance = 0.1;        // Offset that counts as a direct ray hit
    bool verbose = false;

    static SpatialIndexConfig from_json(const nlohmann::json& j);
    static SpatialIndexConfig from_json_file(const std::string& path);
    nlohmann::json to_json() const;
    void to_json_file(const std::string& path) const;

    /**
     * @brief Balanced preset (or KN_INDEX_PRESET) overridden by
     *        KN_INDEX_MAX_DEPTH and KN_INDEX_MAX_NODES_PER_LEAF
     */
    static SpatialIndexConfig from_environment();

    bool validate(std::string& error_message) const;
};

// Deepest tree a config may request
constexpr int kMaxTreeDepth = 32;

namespace presets {

SpatialIndexConfig fast();
SpatialIndexConfig precise();
SpatialIndexConfig balanced();
SpatialIndexConfig memory_efficient();

/**
 * @brief Look up a preset by name ("fast", "precise", "balanced",
 *        "memory_efficient"; hyphens accepted)
 * @throws std::invalid_argument on unknown names
 */
SpatialIndexConfig preset_by_name(const std::string& name);

std::vector<std::string> preset_names();

} // namespace presets

} // namespace kn
