#pragma once

#include "layout/similarity_mapping.hpp"
#include "layout/similarity_matrix.hpp"
#include "spatial/geometry.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace kn {

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Raised when two position arrays that must be parallel differ in size
 */
class MismatchedLengthError : public std::invalid_argument {
public:
    MismatchedLengthError(size_t expected, size_t actual);

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Tuning for the stress-majorization loop
 */
struct OptimizerConfig {
    int max_iterations = 50;                ///< Iterations per optimize call
    double learning_rate = 0.1;             ///< Scale of each pairwise correction
    double stability_threshold = 0.01;      ///< Movement below which a node counts as stable
    std::optional<std::uint32_t> seed;      ///< Fixed RNG seed, random device when unset
    bool verbose = false;                   ///< Progress logging

    static OptimizerConfig from_json(const nlohmann::json& j);
    static OptimizerConfig from_json_file(const std::string& path);
    nlohmann::json to_json() const;
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by KN_OPTIMIZER_* environment variables
     */
    static OptimizerConfig from_environment();

    bool validate(std::string& error_message) const;

    /**
     * @brief Parse a decimal seed in [0, 2^32)
     * @throws std::invalid_argument on signs, junk or overflow
     */
    static std::uint32_t parse_seed(const std::string& text);
};

/**
 * @brief Layout space for one optimize call
 *
 * Without a bounding volume the layout uses 800 x 600 (x 400 in 3D).
 */
struct LayoutConstraints {
    std::optional<BoundingVolume> bounding_volume;
    int dimensions = 2;
};

// ============================================================================
// Results
// ============================================================================

struct ConvergenceMetrics {
    bool is_converged = false;
    double stability_ratio = 0.0;
    double average_movement = 0.0;
    double max_movement = 0.0;
    int iteration_count = 0;
    double time_elapsed = 0.0;  ///< Milliseconds, one assumed frame per monitor call

    nlohmann::json to_json() const;
    void print_summary() const;
};

struct PositionDelta {
    double dx = 0.0;
    double dy = 0.0;
    double dz = 0.0;
    double magnitude = 0.0;
};

struct MappingBenchmarkResult {
    std::string name;
    double stress_score = 0.0;
    int convergence_iterations = 0;
    double quality_metric = 0.0;
    double time_ms = 0.0;

    nlohmann::json to_json() const;
};

// ============================================================================
// SpatialOptimizer
// ============================================================================

/**
 * @brief Turns a similarity matrix into coordinates by stress minimization
 *
 * Each iteration computes, for every node pair, a correction proportional to
 * the gap between the current distance and the target distance produced by
 * the similarity mapping, accumulates the corrections per node, applies them
 * all at once and clamps the result into the layout bounds.
 *
 * Not thread-safe; use one instance per thread.
 */
class SpatialOptimizer {
public:
    static constexpr double kFrameTimeMs = 16.67;
    static constexpr double kConvergedStabilityRatio = 0.95;
    static constexpr double kForceInfluence = 0.1;
    static constexpr double kMeaningfulSimilarity = 0.1;

    explicit SpatialOptimizer(const MappingConfig& mapping = MappingConfig::exponential(),
                              const OptimizerConfig& config = OptimizerConfig());

    /**
     * @brief Lay out every node named by the matrix keys
     * @return Positions parallel to similarities.node_ids()
     */
    std::vector<Position> optimize_positions(const SimilarityMatrix& similarities,
                                             const LayoutConstraints& constraints);

    /**
     * @brief Lay out nodes in a caller-supplied order
     * @return Positions parallel to node_ids
     */
    std::vector<Position> optimize_positions(const SimilarityMatrix& similarities,
                                             const std::vector<std::string>& node_ids,
                                             const LayoutConstraints& constraints);

    /**
     * @brief Compare two snapshots and update the convergence state
     * @throws MismatchedLengthError if the arrays differ in size
     */
    ConvergenceMetrics monitor_convergence(const std::vector<Position>& positions,
                                           const std::vector<Position>& previous_positions);

    /**
     * @brief Root mean square gap between target and actual distances
     *
     * Only pairs present in the matrix contribute; 0 when none do.
     */
    double calculate_stress(const SimilarityMatrix& similarities,
                            const std::vector<Position>& positions,
                            const std::vector<std::string>& node_ids) const;

    /**
     * @brief Run a 2D layout per candidate mapping and rank them
     *
     * Quality is 1 / (1 + stress + time_ms / 1000), sorted descending.
     * The active mapping is unchanged afterwards.
     */
    std::vector<MappingBenchmarkResult> benchmark_mapping_algorithms(
        const SimilarityMatrix& similarities,
        const std::vector<MappingCandidate>& candidates);

    /**
     * @brief Blend similarity centroids with external (physics) forces
     *
     * external_forces[i] applies to node_ids()[i]; missing entries count as 0.
     */
    std::vector<Position> apply_force_integration(const SimilarityMatrix& similarities,
                                                  const std::vector<Position>& external_forces);

    static PositionDelta calculate_position_delta(const Position& current, const Position& previous);

    // Validates first, throws std::invalid_argument
    void set_similarity_mapper(const MappingConfig& mapping);
    const MappingConfig& mapping_config() const { return mapping_; }

    // Validates first, throws std::invalid_argument
    void set_config(const OptimizerConfig& config);
    const OptimizerConfig& config() const { return config_; }

    ConvergenceMetrics get_convergence_state() const { return metrics_; }
    void reset_convergence();

    // Mapped distance floored at 0
    double target_distance(double similarity) const;

private:
    MappingConfig mapping_;
    OptimizerConfig config_;
    ConvergenceMetrics metrics_;
    std::mt19937 rng_;

    static BoundingVolume default_bounds(int dimensions);
    void reseed();
    double random_unit();
};

} // namespace kn
