#include <gtest/gtest.h>
#include "layout/similarity_mapping.hpp"
#include <cmath>
#include <limits>

using namespace kn;

// ==========================================
// Formula Tests
// ==========================================

TEST(SimilarityMappingTest, Exponential) {
    auto config = MappingConfig::exponential();
    EXPECT_DOUBLE_EQ(map_similarity(1.0, config), 0.0);
    EXPECT_DOUBLE_EQ(map_similarity(0.0, config), 100.0);
    EXPECT_DOUBLE_EQ(map_similarity(0.5, config), 75.0);  // 100 * (1 - 0.25)
}

TEST(SimilarityMappingTest, Linear) {
    auto config = MappingConfig::linear();
    EXPECT_DOUBLE_EQ(map_similarity(1.0, config), 0.0);
    EXPECT_DOUBLE_EQ(map_similarity(0.0, config), 100.0);
    EXPECT_DOUBLE_EQ(map_similarity(0.5, config), 50.0);
}

TEST(SimilarityMappingTest, LinearCustomMaxDistance) {
    auto config = MappingConfig::linear(50.0);
    EXPECT_EQ(config.kind, MappingKind::Linear);
    EXPECT_DOUBLE_EQ(config.max_distance, 50.0);
    EXPECT_DOUBLE_EQ(map_similarity(0.0, config), 50.0);
}

TEST(SimilarityMappingTest, Logarithmic) {
    auto config = MappingConfig::logarithmic();
    EXPECT_DOUBLE_EQ(map_similarity(0.0, config), 100.0);

    double expected = 100.0 * (-std::log(1.01) / -std::log(0.01));
    EXPECT_NEAR(map_similarity(1.0, config), expected, 1e-12);
    EXPECT_LT(map_similarity(1.0, config), 1.0);
}

TEST(SimilarityMappingTest, Spring) {
    auto config = MappingConfig::spring();
    EXPECT_DOUBLE_EQ(map_similarity(0.0, config), 80.0);
    EXPECT_NEAR(map_similarity(1.0, config), 16.0, 1e-12);  // 80 * (1 - 0.8)
}

TEST(SimilarityMappingTest, SpringCanGoNegative) {
    auto config = MappingConfig::spring(80.0, 1.5);
    EXPECT_DOUBLE_EQ(map_similarity(1.0, config), -40.0);
}

TEST(SimilarityMappingTest, ThresholdIsAStep) {
    auto config = MappingConfig::threshold_step(0.5, 20.0, 100.0);
    EXPECT_DOUBLE_EQ(map_similarity(1.0, config), 20.0);
    EXPECT_DOUBLE_EQ(map_similarity(0.5, config), 20.0);   // inclusive
    EXPECT_DOUBLE_EQ(map_similarity(0.49, config), 100.0);
    EXPECT_DOUBLE_EQ(map_similarity(0.0, config), 100.0);

    // Flat on each side of the step
    EXPECT_DOUBLE_EQ(map_similarity(0.6, config), map_similarity(0.9, config));
    EXPECT_DOUBLE_EQ(map_similarity(0.1, config), map_similarity(0.4, config));
}

TEST(SimilarityMappingTest, PowerLaw) {
    auto config = MappingConfig::power_law();
    EXPECT_NEAR(map_similarity(1.0, config), 100.0 * std::pow(0.01, 1.5), 1e-12);
    EXPECT_NEAR(map_similarity(0.0, config), 100.0 * std::pow(1.01, 1.5), 1e-12);
    EXPECT_GT(map_similarity(1.0, config), 0.0);
}

// ==========================================
// Contract Tests
// ==========================================

TEST(SimilarityMappingTest, MonotonicNonIncreasing) {
    for (const auto& candidate : default_mapping_candidates()) {
        double at_one = map_similarity(1.0, candidate.mapping);
        double at_half = map_similarity(0.5, candidate.mapping);
        double at_zero = map_similarity(0.0, candidate.mapping);

        EXPECT_LE(at_one, at_half) << candidate.name;
        EXPECT_LE(at_half, at_zero) << candidate.name;
    }
}

TEST(SimilarityMappingTest, OutOfRangeInputIsClamped) {
    for (const auto& candidate : default_mapping_candidates()) {
        EXPECT_DOUBLE_EQ(map_similarity(1.0000001, candidate.mapping),
                         map_similarity(1.0, candidate.mapping)) << candidate.name;
        EXPECT_DOUBLE_EQ(map_similarity(-0.2, candidate.mapping),
                         map_similarity(0.0, candidate.mapping)) << candidate.name;
    }
}

TEST(SimilarityMappingTest, NaNCountsAsZero) {
    auto config = MappingConfig::linear();
    EXPECT_DOUBLE_EQ(map_similarity(std::numeric_limits<double>::quiet_NaN(), config), 100.0);
}

TEST(SimilarityMappingTest, Deterministic) {
    auto config = MappingConfig::logarithmic(70.0, 0.05);
    EXPECT_EQ(map_similarity(0.37, config), map_similarity(0.37, config));
}

TEST(SimilarityMappingTest, DefaultCandidatesCoverAllKinds) {
    auto candidates = default_mapping_candidates();
    ASSERT_EQ(candidates.size(), 6u);
    EXPECT_EQ(candidates[0].name, "exponential");
    EXPECT_EQ(candidates[5].name, "power_law");
    EXPECT_EQ(candidates[5].mapping.kind, MappingKind::PowerLaw);
}

// ==========================================
// Naming and Serialization Tests
// ==========================================

TEST(SimilarityMappingTest, KindFromString) {
    EXPECT_EQ(mapping_kind_from_string("exponential"), MappingKind::Exponential);
    EXPECT_EQ(mapping_kind_from_string("Linear"), MappingKind::Linear);
    EXPECT_EQ(mapping_kind_from_string("power_law"), MappingKind::PowerLaw);
    EXPECT_EQ(mapping_kind_from_string("powerLaw"), MappingKind::PowerLaw);
    EXPECT_THROW(mapping_kind_from_string("cubic"), std::invalid_argument);
}

TEST(SimilarityMappingTest, KindToStringRoundTrip) {
    for (const auto& candidate : default_mapping_candidates()) {
        EXPECT_EQ(mapping_kind_from_string(mapping_kind_to_string(candidate.mapping.kind)),
                  candidate.mapping.kind);
    }
}

TEST(SimilarityMappingTest, FromJsonUsesKindDefaults) {
    auto config = MappingConfig::from_json({{"kind", "power_law"}});
    EXPECT_EQ(config.kind, MappingKind::PowerLaw);
    EXPECT_DOUBLE_EQ(config.exponent, 1.5);

    auto linear = MappingConfig::from_json({{"kind", "linear"}, {"max_distance", 40.0}});
    EXPECT_DOUBLE_EQ(map_similarity(0.0, linear), 40.0);
}

TEST(SimilarityMappingTest, ToJsonWritesActiveParameters) {
    auto j = MappingConfig::threshold_step(0.7, 10.0, 90.0).to_json();
    EXPECT_EQ(j["kind"], "threshold");
    EXPECT_DOUBLE_EQ(j["threshold"].get<double>(), 0.7);
    EXPECT_FALSE(j.contains("max_distance"));

    auto restored = MappingConfig::from_json(j);
    EXPECT_DOUBLE_EQ(map_similarity(0.8, restored), 10.0);
}

// ==========================================
// Validation Tests
// ==========================================

TEST(SimilarityMappingTest, DefaultsValidate) {
    std::string error;
    for (const auto& candidate : default_mapping_candidates()) {
        EXPECT_TRUE(candidate.mapping.validate(error)) << candidate.name << ": " << error;
    }
    EXPECT_TRUE(MappingConfig::spring(80.0, 1.5).validate(error));
}

TEST(SimilarityMappingTest, RejectsEpsilonOutsideUnitInterval) {
    std::string error;
    EXPECT_FALSE(MappingConfig::logarithmic(100.0, 0.0).validate(error));
    EXPECT_NE(error.find("epsilon"), std::string::npos);
    EXPECT_FALSE(MappingConfig::logarithmic(100.0, -0.5).validate(error));
    EXPECT_FALSE(MappingConfig::logarithmic(100.0, 2.0).validate(error));
    EXPECT_FALSE(MappingConfig::logarithmic(100.0, 1.0).validate(error));
}

TEST(SimilarityMappingTest, RejectsNegativeDistances) {
    std::string error;
    EXPECT_FALSE(MappingConfig::linear(-10.0).validate(error));
    EXPECT_FALSE(MappingConfig::spring(-80.0).validate(error));
    EXPECT_FALSE(MappingConfig::power_law(-1.0).validate(error));
    EXPECT_FALSE(MappingConfig::threshold_step(0.5, -1.0, 100.0).validate(error));
    EXPECT_FALSE(MappingConfig::threshold_step(0.5, 20.0, -100.0).validate(error));
    EXPECT_FALSE(MappingConfig::exponential(100.0, -2.0).validate(error));
}

TEST(SimilarityMappingTest, RejectsNonFiniteParameters) {
    std::string error;
    EXPECT_FALSE(MappingConfig::linear(std::numeric_limits<double>::infinity()).validate(error));
    EXPECT_FALSE(MappingConfig::power_law(100.0, std::nan("")).validate(error));
}

TEST(SimilarityMappingTest, FromJsonRejectsInvalidParameters) {
    EXPECT_THROW(MappingConfig::from_json({{"kind", "logarithmic"}, {"epsilon", 0.0}}),
                 std::invalid_argument);
    EXPECT_THROW(MappingConfig::from_json({{"kind", "linear"}, {"max_distance", -5.0}}),
                 std::invalid_argument);
}

TEST(SimilarityMappingTest, ValidLogarithmicStaysFiniteAndDecreasing) {
    auto config = MappingConfig::logarithmic(100.0, 0.5);
    std::string error;
    ASSERT_TRUE(config.validate(error));

    double previous = map_similarity(0.0, config);
    EXPECT_TRUE(std::isfinite(previous));
    for (int i = 1; i <= 10; ++i) {
        double d = map_similarity(i / 10.0, config);
        EXPECT_TRUE(std::isfinite(d));
        EXPECT_LE(d, previous);
        previous = d;
    }
}
