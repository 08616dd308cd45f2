#include "spatial/index_config.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace kn {

SpatialIndexConfig SpatialIndexConfig::from_json(const json& j) {
    SpatialIndexConfig config;

    if (j.contains("preset")) {
        config = presets::preset_by_name(j["preset"].get<std::string>());
    }

    if (j.contains("max_depth")) config.max_depth = j["max_depth"];
    if (j.contains("max_nodes_per_leaf")) config.max_nodes_per_leaf = j["max_nodes_per_leaf"];
    if (j.contains("enable_caching")) config.enable_caching = j["enable_caching"];
    if (j.contains("cache_size")) config.cache_size = j["cache_size"];
    if (j.contains("ray_intersection_tolerance")) {
        config.ray_intersection_tolerance = j["ray_intersection_tolerance"];
    }
    if (j.contains("point_query_tolerance")) {
        config.point_query_tolerance = j["point_query_tolerance"];
    }
    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

SpatialIndexConfig SpatialIndexConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

json SpatialIndexConfig::to_json() const {
    json j;
    j["max_depth"] = max_depth;
    j["max_nodes_per_leaf"] = max_nodes_per_leaf;
    j["enable_caching"] = enable_caching;
    j["cache_size"] = cache_size;
    j["ray_intersection_tolerance"] = ray_intersection_tolerance;
    j["point_query_tolerance"] = point_query_tolerance;
    j["verbose"] = verbose;
    return j;
}

void SpatialIndexConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

SpatialIndexConfig SpatialIndexConfig::from_environment() {
    SpatialIndexConfig config = presets::balanced();

    const char* preset = std::getenv("KN_INDEX_PRESET");
    if (preset) config = presets::preset_by_name(preset);

    const char* max_depth = std::getenv("KN_INDEX_MAX_DEPTH");
    if (max_depth) config.max_depth = std::stoi(max_depth);

    const char* max_nodes = std::getenv("KN_INDEX_MAX_NODES_PER_LEAF");
    if (max_nodes) config.max_nodes_per_leaf = std::stoi(max_nodes);

    return config;
}

bool SpatialIndexConfig::validate(std::string& error_message) const {
    if (max_depth < 0 || max_depth > kMaxTreeDepth) {
        error_message = "max_depth must be between 0 and " + std::to_string(kMaxTreeDepth);
        return false;
    }

    if (max_nodes_per_leaf <= 0) {
        error_message = "max_nodes_per_leaf must be positive";
        return false;
    }

    if (cache_size < 0) {
        error_message = "cache_size must be non-negative";
        return false;
    }

    if (!(ray_intersection_tolerance >= 0.0)) {
        error_message = "ray_intersection_tolerance must be non-negative";
        return false;
    }

    if (!(point_query_tolerance >= 0.0)) {
        error_message = "point_query_tolerance must be non-negative";
        return false;
    }

    return true;
}

// ==========================================
// Presets
// ==========================================

namespace presets {

SpatialIndexConfig fast() {
    SpatialIndexConfig config;
    config.max_depth = 6;
    config.max_nodes_per_leaf = 20;
    config.enable_caching = true;
    config.cache_size = 50;
    return config;
}

SpatialIndexConfig precise() {
    SpatialIndexConfig config;
    config.max_depth = 12;
    config.max_nodes_per_leaf = 5;
    config.enable_caching = true;
    config.cache_size = 200;
    config.ray_intersection_tolerance = 0.5;
    config.point_query_tolerance = 0.05;
    return config;
}

SpatialIndexConfig balanced() {
    SpatialIndexConfig config;
    config.max_depth = 8;
    config.max_nodes_per_leaf = 10;
    config.enable_caching = true;
    config.cache_size = 100;
    config.ray_intersection_tolerance = 1.0;
    return config;
}

SpatialIndexConfig memory_efficient() {
    SpatialIndexConfig config;
    config.max_depth = 8;
    config.max_nodes_per_leaf = 15;
    config.enable_caching = false;
    config.cache_size = 0;
    return config;
}

SpatialIndexConfig preset_by_name(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), ::tolower);
    std::replace(key.begin(), key.end(), '-', '_');

    if (key == "fast") return fast();
    if (key == "precise") return precise();
    if (key == "balanced") return balanced();
    if (key == "memory_efficient") return memory_efficient();

    throw std::invalid_argument("Unknown index preset: " + name);
}

std::vector<std::string> preset_names() {
    return {"fast", "precise", "balanced", "memory_efficient"};
}

} // namespace presets

} // namespace kn
