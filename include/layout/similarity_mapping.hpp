#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace kn {

enum class MappingKind {
    Exponential,
    Linear,
    Logarithmic,
    Spring,
    Threshold,
    PowerLaw
};

std::string mapping_kind_to_string(MappingKind kind);

/**
 * @brief Parse "exponential", "linear", "logarithmic", "spring",
 *        "threshold" or "power_law" ("powerLaw" is accepted too)
 * @throws std::invalid_argument on unknown names
 */
MappingKind mapping_kind_from_string(const std::string& name);

/**
 * @brief Similarity-to-distance strategy plus its parameters
 *
 * Only the fields used by the selected kind are read:
 *   exponential  max_distance, exponent
 *   linear       max_distance
 *   logarithmic  max_distance, epsilon
 *   spring       rest_length, spring_constant
 *   threshold    threshold, close_distance, far_distance
 *   power_law    scale, exponent
 */
struct MappingConfig {
    MappingKind kind = MappingKind::Exponential;

    double max_distance = 100.0;
    double exponent = 2.0;
    double epsilon = 0.01;
    double rest_length = 80.0;
    double spring_constant = 0.8;
    double threshold = 0.5;
    double close_distance = 20.0;
    double far_distance = 100.0;
    double scale = 100.0;

    static MappingConfig exponential(double max_distance = 100.0, double exponent = 2.0);
    static MappingConfig linear(double max_distance = 100.0);
    static MappingConfig logarithmic(double max_distance = 100.0, double epsilon = 0.01);
    static MappingConfig spring(double rest_length = 80.0, double spring_constant = 0.8);
    static MappingConfig threshold_step(double threshold = 0.5,
                                        double close_distance = 20.0,
                                        double far_distance = 100.0);
    static MappingConfig power_law(double scale = 100.0, double exponent = 1.5);

    // Kind-specific defaults, used when a config names only its kind
    static MappingConfig defaults_for(MappingKind kind);

    /**
     * @brief Reject parameters that give NaN, negative or reversed distances
     *
     * epsilon must lie in (0, 1); distances, scale and exponent must be
     * finite and non-negative (exponent strictly positive).
     */
    bool validate(std::string& error_message) const;

    nlohmann::json to_json() const;

    // @throws std::invalid_argument when the parameters do not validate
    static MappingConfig from_json(const nlohmann::json& j);
};

/**
 * @brief Map a similarity score to a target distance
 *
 * Pure and deterministic. The score is clamped into [0, 1] first (NaN
 * counts as 0). The spring mapping returns negative distances when
 * similarity * spring_constant > 1; callers that need a distance clamp it.
 */
double map_similarity(double similarity, const MappingConfig& config);

struct MappingCandidate {
    std::string name;
    MappingConfig mapping;
};

// All six strategies with their default parameters
std::vector<MappingCandidate> default_mapping_candidates();

} // namespace kn
