#include <gtest/gtest.h>
#include "spatial/index_config.hpp"
#include "spatial/spatial_index.hpp"
#include <cstdlib>

using namespace kn;

// ==========================================
// Defaults and Presets
// ==========================================

TEST(IndexConfigTest, Defaults) {
    SpatialIndexConfig config;
    EXPECT_EQ(config.max_depth, 6);
    EXPECT_EQ(config.max_nodes_per_leaf, 10);
    EXPECT_TRUE(config.enable_caching);
    EXPECT_EQ(config.cache_size, 100);
    EXPECT_DOUBLE_EQ(config.ray_intersection_tolerance, 1.0);
    EXPECT_DOUBLE_EQ(config.point_query_tolerance, 0.1);

    std::string error;
    EXPECT_TRUE(config.validate(error));
}

TEST(IndexConfigTest, FastPreset) {
    auto config = presets::fast();
    EXPECT_EQ(config.max_depth, 6);
    EXPECT_EQ(config.max_nodes_per_leaf, 20);
    EXPECT_EQ(config.cache_size, 50);
}

TEST(IndexConfigTest, PrecisePreset) {
    auto config = presets::precise();
    EXPECT_EQ(config.max_depth, 12);
    EXPECT_EQ(config.max_nodes_per_leaf, 5);
    EXPECT_EQ(config.cache_size, 200);
    EXPECT_LT(config.ray_intersection_tolerance, presets::balanced().ray_intersection_tolerance);
    EXPECT_DOUBLE_EQ(config.point_query_tolerance, 0.05);
}

TEST(IndexConfigTest, BalancedPreset) {
    auto config = presets::balanced();
    EXPECT_EQ(config.max_depth, 8);
    EXPECT_EQ(config.max_nodes_per_leaf, 10);
    EXPECT_TRUE(config.enable_caching);
}

TEST(IndexConfigTest, MemoryEfficientPreset) {
    auto config = presets::memory_efficient();
    EXPECT_FALSE(config.enable_caching);
    EXPECT_EQ(config.cache_size, 0);
    EXPECT_EQ(config.max_nodes_per_leaf, 15);
}

TEST(IndexConfigTest, PresetByName) {
    EXPECT_EQ(presets::preset_by_name("fast").max_nodes_per_leaf, 20);
    EXPECT_EQ(presets::preset_by_name("PRECISE").max_depth, 12);
    EXPECT_FALSE(presets::preset_by_name("memory-efficient").enable_caching);
    EXPECT_THROW(presets::preset_by_name("turbo"), std::invalid_argument);

    for (const auto& name : presets::preset_names()) {
        std::string error;
        EXPECT_TRUE(presets::preset_by_name(name).validate(error)) << name;
    }
}

TEST(IndexConfigTest, FactoriesUsePresets) {
    EXPECT_EQ(SpatialIndex::create_fast().get_config().max_nodes_per_leaf, 20);
    EXPECT_EQ(SpatialIndex::create_precise().get_config().max_depth, 12);
    EXPECT_EQ(SpatialIndex::create_balanced().get_config().max_depth, 8);
    EXPECT_FALSE(SpatialIndex::create_memory_efficient().get_config().enable_caching);
}

// ==========================================
// Validation
// ==========================================

TEST(IndexConfigTest, RejectsNegativeDepth) {
    SpatialIndexConfig config;
    config.max_depth = -1;
    std::string error;
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("max_depth"), std::string::npos);
}

TEST(IndexConfigTest, RejectsExcessiveDepth) {
    SpatialIndexConfig config;
    config.max_depth = kMaxTreeDepth + 1;
    std::string error;
    EXPECT_FALSE(config.validate(error));

    config.max_depth = 0;
    EXPECT_TRUE(config.validate(error));
}

TEST(IndexConfigTest, RejectsEmptyLeaves) {
    SpatialIndexConfig config;
    config.max_nodes_per_leaf = 0;
    std::string error;
    EXPECT_FALSE(config.validate(error));
}

TEST(IndexConfigTest, RejectsNegativeTolerances) {
    SpatialIndexConfig config;
    config.ray_intersection_tolerance = -0.5;
    std::string error;
    EXPECT_FALSE(config.validate(error));

    config = SpatialIndexConfig();
    config.point_query_tolerance = -1.0;
    EXPECT_FALSE(config.validate(error));
}

TEST(IndexConfigTest, RejectsNegativeCacheSize) {
    SpatialIndexConfig config;
    config.cache_size = -1;
    std::string error;
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("cache_size"), std::string::npos);

    auto from_json = SpatialIndexConfig::from_json({{"cache_size", -1}});
    EXPECT_EQ(from_json.cache_size, -1);
    EXPECT_FALSE(from_json.validate(error));
    EXPECT_THROW(SpatialIndex index(from_json), std::invalid_argument);
}

TEST(IndexConfigTest, IndexConstructorValidates) {
    SpatialIndexConfig config;
    config.max_nodes_per_leaf = 0;
    EXPECT_THROW(SpatialIndex index(config), std::invalid_argument);
}

// ==========================================
// Serialization and Environment
// ==========================================

TEST(IndexConfigTest, JsonRoundTrip) {
    auto original = presets::precise();
    auto restored = SpatialIndexConfig::from_json(original.to_json());
    EXPECT_EQ(restored.max_depth, original.max_depth);
    EXPECT_EQ(restored.max_nodes_per_leaf, original.max_nodes_per_leaf);
    EXPECT_EQ(restored.cache_size, original.cache_size);
    EXPECT_DOUBLE_EQ(restored.ray_intersection_tolerance, original.ray_intersection_tolerance);
}

TEST(IndexConfigTest, JsonPresetWithOverrides) {
    auto config = SpatialIndexConfig::from_json({{"preset", "fast"}, {"max_depth", 3}});
    EXPECT_EQ(config.max_depth, 3);
    EXPECT_EQ(config.max_nodes_per_leaf, 20);
}

TEST(IndexConfigTest, MissingConfigFileThrows) {
    EXPECT_THROW(SpatialIndexConfig::from_json_file("/nonexistent/index.json"), std::runtime_error);
}

TEST(IndexConfigTest, FromEnvironment) {
    setenv("KN_INDEX_PRESET", "precise", 1);
    setenv("KN_INDEX_MAX_NODES_PER_LEAF", "7", 1);

    auto config = SpatialIndexConfig::from_environment();
    EXPECT_EQ(config.max_depth, 12);
    EXPECT_EQ(config.max_nodes_per_leaf, 7);

    unsetenv("KN_INDEX_PRESET");
    unsetenv("KN_INDEX_MAX_NODES_PER_LEAF");

    auto fallback = SpatialIndexConfig::from_environment();
    EXPECT_EQ(fallback.max_depth, presets::balanced().max_depth);
}
