#include "layout/spatial_optimizer.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>

using json = nlohmann::json;

namespace kn {

// ============================================================================
// MismatchedLengthError
// ============================================================================

MismatchedLengthError::MismatchedLengthError(size_t expected, size_t actual)
    : std::invalid_argument("Position arrays must have same length for convergence monitoring (" +
                            std::to_string(expected) + " vs " + std::to_string(actual) + ")"),
      expected_(expected),
      actual_(actual) {}

// ============================================================================
// OptimizerConfig
// ============================================================================

OptimizerConfig OptimizerConfig::from_json(const json& j) {
    OptimizerConfig config;

    if (j.contains("max_iterations")) config.max_iterations = j["max_iterations"];
    if (j.contains("learning_rate")) config.learning_rate = j["learning_rate"];
    if (j.contains("stability_threshold")) config.stability_threshold = j["stability_threshold"];
    if (j.contains("seed") && !j["seed"].is_null()) {
        const json& seed = j["seed"];
        const bool in_range = seed.is_number_unsigned()
            ? seed.get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max()
            : seed.is_number_integer() && seed.get<std::int64_t>() >= 0 &&
              seed.get<std::int64_t>() <= std::numeric_limits<std::uint32_t>::max();
        if (!in_range) {
            throw std::invalid_argument("seed must be an integer between 0 and " +
                                        std::to_string(std::numeric_limits<std::uint32_t>::max()));
        }
        config.seed = seed.get<std::uint32_t>();
    }
    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

OptimizerConfig OptimizerConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

json OptimizerConfig::to_json() const {
    json j;
    j["max_iterations"] = max_iterations;
    j["learning_rate"] = learning_rate;
    j["stability_threshold"] = stability_threshold;
    if (seed) {
        j["seed"] = *seed;
    }
    j["verbose"] = verbose;
    return j;
}

void OptimizerConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

OptimizerConfig OptimizerConfig::from_environment() {
    OptimizerConfig config;

    const char* iterations = std::getenv("KN_OPTIMIZER_ITERATIONS");
    if (iterations) config.max_iterations = std::stoi(iterations);

    const char* learning_rate = std::getenv("KN_OPTIMIZER_LEARNING_RATE");
    if (learning_rate) config.learning_rate = std::stod(learning_rate);

    const char* seed = std::getenv("KN_OPTIMIZER_SEED");
    if (seed) config.seed = parse_seed(seed);

    return config;
}

std::uint32_t OptimizerConfig::parse_seed(const std::string& text) {
    const std::string message = "seed must be an integer between 0 and " +
                                std::to_string(std::numeric_limits<std::uint32_t>::max()) +
                                ", got '" + text + "'";

    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument(message);
    }

    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(message);
    }
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument(message);
    }
    return static_cast<std::uint32_t>(value);
}

bool OptimizerConfig::validate(std::string& error_message) const {
    if (max_iterations <= 0) {
        error_message = "max_iterations must be positive";
        return false;
    }

    if (!std::isfinite(learning_rate) || learning_rate < 0.0) {
        error_message = "learning_rate must be a finite non-negative number";
        return false;
    }

    if (!std::isfinite(stability_threshold) || stability_threshold <= 0.0) {
        error_message = "stability_threshold must be a finite positive number";
        return false;
    }

    return true;
}

// ============================================================================
// Result types
// ============================================================================

json ConvergenceMetrics::to_json() const {
    json j;
    j["is_converged"] = is_converged;
    j["stability_ratio"] = stability_ratio;
    j["average_movement"] = average_movement;
    j["max_movement"] = max_movement;
    j["iteration_count"] = iteration_count;
    j["time_elapsed"] = time_elapsed;
    return j;
}

void ConvergenceMetrics::print_summary() const {
    std::cout << "Convergence:\n";
    std::cout << "  Converged: " << (is_converged ? "yes" : "no") << "\n";
    std::cout << "  Stability ratio: " << stability_ratio << "\n";
    std::cout << "  Average movement: " << average_movement << "\n";
    std::cout << "  Max movement: " << max_movement << "\n";
    std::cout << "  Iterations: " << iteration_count << "\n";
    std::cout << "  Time elapsed: " << time_elapsed << " ms\n";
}

json MappingBenchmarkResult::to_json() const {
    json j;
    j["name"] = name;
    j["stress_score"] = stress_score;
    j["convergence_iterations"] = convergence_iterations;
    j["quality_metric"] = quality_metric;
    j["time_ms"] = time_ms;
    return j;
}

// ============================================================================
// SpatialOptimizer
// ============================================================================

SpatialOptimizer::SpatialOptimizer(const MappingConfig& mapping, const OptimizerConfig& config) {
    set_similarity_mapper(mapping);
    set_config(config);
}

void SpatialOptimizer::set_similarity_mapper(const MappingConfig& mapping) {
    std::string error;
    if (!mapping.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    mapping_ = mapping;
}

void SpatialOptimizer::set_config(const OptimizerConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    config_ = config;
    reseed();
}

void SpatialOptimizer::reseed() {
    if (config_.seed) {
        rng_.seed(*config_.seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

double SpatialOptimizer::random_unit() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

BoundingVolume SpatialOptimizer::default_bounds(int dimensions) {
    BoundingVolume bounds;
    bounds.max_x = 800.0;
    bounds.max_y = 600.0;
    bounds.max_z = dimensions == 3 ? 400.0 : 0.0;
    return bounds;
}

double SpatialOptimizer::target_distance(double similarity) const {
    return std::max(0.0, map_similarity(similarity, mapping_));
}

std::vector<Position> SpatialOptimizer::optimize_positions(const SimilarityMatrix& similarities,
                                                           const LayoutConstraints& constraints) {
    return optimize_positions(similarities, similarities.node_ids(), constraints);
}

std::vector<Position> SpatialOptimizer::optimize_positions(const SimilarityMatrix& similarities,
                                                           const std::vector<std::string>& node_ids,
                                                           const LayoutConstraints& constraints) {
    if (constraints.dimensions != 2 && constraints.dimensions != 3) {
        throw std::invalid_argument("Layout dimensions must be 2 or 3, got " +
                                    std::to_string(constraints.dimensions));
    }

    const bool is_3d = constraints.dimensions == 3;
    BoundingVolume bounds = constraints.bounding_volume
        ? constraints.bounding_volume->normalized()
        : default_bounds(constraints.dimensions);
    if (!is_3d) {
        bounds.min_z = 0.0;
        bounds.max_z = 0.0;
    }

    const size_t n = node_ids.size();
    std::vector<Position> positions;
    positions.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        Position p;
        p.x = bounds.min_x + random_unit() * (bounds.max_x - bounds.min_x);
        p.y = bounds.min_y + random_unit() * (bounds.max_y - bounds.min_y);
        p.z = is_3d ? bounds.min_z + random_unit() * (bounds.max_z - bounds.min_z) : 0.0;
        positions.push_back(p);
    }

    if (n < 2) {
        return positions;
    }

    if (config_.verbose) {
        std::cout << "Optimizing layout: " << n << " nodes, "
                  << similarities.size() << " similarity entries, "
                  << config_.max_iterations << " iterations ("
                  << mapping_kind_to_string(mapping_.kind) << " mapping)\n";
    }

    // Target distances are fixed for the whole run; missing pairs map from 0
    std::vector<double> targets;
    targets.reserve(n * (n - 1) / 2);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            targets.push_back(target_distance(similarities.similarity(node_ids[i], node_ids[j])));
        }
    }

    std::vector<Position> forces(n);

    for (int iteration = 0; iteration < config_.max_iterations; ++iteration) {
        std::fill(forces.begin(), forces.end(), Position{});

        size_t pair = 0;
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j, ++pair) {
                const Position delta = positions[j] - positions[i];
                const double current = length(delta);
                const double force = (current - targets[pair]) * config_.learning_rate /
                                     std::max(current, 1.0);

                forces[i] = forces[i] + delta * force;
                forces[j] = forces[j] - delta * force;
            }
        }

        for (size_t i = 0; i < n; ++i) {
            Position next = positions[i] + forces[i];
            if (!is_3d) {
                next.z = 0.0;
            }
            positions[i] = bounds.clamp(next);
        }
    }

    if (config_.verbose) {
        std::cout << "Layout stress: " << calculate_stress(similarities, positions, node_ids) << "\n";
    }

    return positions;
}

ConvergenceMetrics SpatialOptimizer::monitor_convergence(const std::vector<Position>& positions,
                                                         const std::vector<Position>& previous_positions) {
    if (positions.size() != previous_positions.size()) {
        throw MismatchedLengthError(previous_positions.size(), positions.size());
    }

    double total_movement = 0.0;
    double max_movement = 0.0;
    size_t stable_nodes = 0;

    for (size_t i = 0; i < positions.size(); ++i) {
        const double magnitude = calculate_position_delta(positions[i], previous_positions[i]).magnitude;
        total_movement += magnitude;
        max_movement = std::max(max_movement, magnitude);
        if (magnitude < config_.stability_threshold) {
            ++stable_nodes;
        }
    }

    const double count = static_cast<double>(positions.size());
    const double stability_ratio = positions.empty() ? 1.0 : stable_nodes / count;

    ConvergenceMetrics next;
    next.average_movement = positions.empty() ? 0.0 : total_movement / count;
    next.max_movement = max_movement;
    next.stability_ratio = stability_ratio;
    next.is_converged = stability_ratio > kConvergedStabilityRatio &&
                        max_movement < config_.stability_threshold;
    next.iteration_count = metrics_.iteration_count + 1;
    next.time_elapsed = metrics_.time_elapsed + kFrameTimeMs;

    metrics_ = next;
    return metrics_;
}

double SpatialOptimizer::calculate_stress(const SimilarityMatrix& similarities,
                                          const std::vector<Position>& positions,
                                          const std::vector<std::string>& node_ids) const {
    double total_stress = 0.0;
    size_t comparisons = 0;

    const size_t n = std::min(node_ids.size(), positions.size());
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            auto similarity = similarities.get(node_ids[i], node_ids[j]);
            if (!similarity) continue;

            const double gap = target_distance(*similarity) - distance(positions[i], positions[j]);
            total_stress += gap * gap;
            ++comparisons;
        }
    }

    return comparisons > 0 ? std::sqrt(total_stress / comparisons) : 0.0;
}

std::vector<MappingBenchmarkResult> SpatialOptimizer::benchmark_mapping_algorithms(
    const SimilarityMatrix& similarities,
    const std::vector<MappingCandidate>& candidates) {

    for (const auto& candidate : candidates) {
        std::string error;
        if (!candidate.mapping.validate(error)) {
            throw std::invalid_argument("Invalid configuration for " + candidate.name + ": " + error);
        }
    }

    std::vector<MappingBenchmarkResult> results;
    results.reserve(candidates.size());

    const MappingConfig original = mapping_;
    const std::vector<std::string> node_ids = similarities.node_ids();

    LayoutConstraints constraints;
    constraints.dimensions = 2;

    for (const auto& candidate : candidates) {
        mapping_ = candidate.mapping;

        auto start = std::chrono::steady_clock::now();
        auto positions = optimize_positions(similarities, node_ids, constraints);
        auto end = std::chrono::steady_clock::now();

        MappingBenchmarkResult result;
        result.name = candidate.name;
        result.time_ms = std::chrono::duration<double, std::milli>(end - start).count();
        result.stress_score = calculate_stress(similarities, positions, node_ids);
        result.quality_metric = 1.0 / (1.0 + result.stress_score + result.time_ms / 1000.0);
        result.convergence_iterations = static_cast<int>(std::ceil(result.time_ms / kFrameTimeMs));
        results.push_back(result);

        if (config_.verbose) {
            std::cout << "  " << candidate.name << ": stress " << result.stress_score
                      << ", " << result.time_ms << "ms\n";
        }
    }

    mapping_ = original;

    std::stable_sort(results.begin(), results.end(),
        [](const MappingBenchmarkResult& a, const MappingBenchmarkResult& b) {
            return a.quality_metric > b.quality_metric;
        });

    return results;
}

std::vector<Position> SpatialOptimizer::apply_force_integration(const SimilarityMatrix& similarities,
                                                                const std::vector<Position>& external_forces) {
    const std::vector<std::string> node_ids = similarities.node_ids();
    std::vector<Position> positions;
    positions.reserve(node_ids.size());

    for (size_t i = 0; i < node_ids.size(); ++i) {
        Position weighted;
        double weight_sum = 0.0;

        for (const auto& other_id : node_ids) {
            if (other_id == node_ids[i]) continue;

            const double similarity = similarities.similarity(node_ids[i], other_id);
            if (similarity > kMeaningfulSimilarity) {
                weighted.x += similarity * random_unit() * 400.0;
                weighted.y += similarity * random_unit() * 300.0;
                weighted.z += similarity * random_unit() * 200.0;
                weight_sum += similarity;
            }
        }

        Position centroid;
        if (weight_sum > 0.0) {
            centroid = weighted * (1.0 / weight_sum);
        } else {
            centroid = {random_unit() * 400.0, random_unit() * 300.0, 0.0};
        }

        const Position force = i < external_forces.size() ? external_forces[i] : Position{};
        positions.push_back(centroid + force * kForceInfluence);
    }

    return positions;
}

PositionDelta SpatialOptimizer::calculate_position_delta(const Position& current, const Position& previous) {
    PositionDelta delta;
    delta.dx = current.x - previous.x;
    delta.dy = current.y - previous.y;
    delta.dz = current.z - previous.z;
    delta.magnitude = std::sqrt(delta.dx * delta.dx + delta.dy * delta.dy + delta.dz * delta.dz);
    return delta;
}

void SpatialOptimizer::reset_convergence() {
    metrics_ = ConvergenceMetrics();
}

} // namespace kn
