#include "layout/similarity_mapping.hpp"
#include "layout/similarity_matrix.hpp"
#include "layout/spatial_optimizer.hpp"
#include <iostream>
#include <iomanip>

using namespace kn;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

int main() {
    print_separator("Layout Example - Similarity Driven Positions");

    // Two tight clusters joined by one weak link
    SimilarityMatrix similarities;
    similarities.set("neuron", "synapse", 0.9);
    similarities.set("neuron", "axon", 0.85);
    similarities.set("synapse", "axon", 0.8);
    similarities.set("galaxy", "nebula", 0.9);
    similarities.set("galaxy", "quasar", 0.75);
    similarities.set("nebula", "quasar", 0.7);
    similarities.set("axon", "galaxy", 0.05);

    std::cout << "1. Target distances per mapping for similarity 0.8:\n";
    for (const auto& candidate : default_mapping_candidates()) {
        std::cout << "   " << std::left << std::setw(14) << candidate.name
                  << map_similarity(0.8, candidate.mapping) << "\n";
    }

    OptimizerConfig config;
    config.seed = 42;
    config.max_iterations = 200;

    SpatialOptimizer optimizer(MappingConfig::exponential(), config);
    auto node_ids = similarities.node_ids();

    LayoutConstraints constraints;
    constraints.dimensions = 2;
    auto positions = optimizer.optimize_positions(similarities, node_ids, constraints);

    std::cout << "\n2. Optimized 2D layout:\n";
    for (size_t i = 0; i < node_ids.size(); ++i) {
        std::cout << "   " << std::left << std::setw(10) << node_ids[i]
                  << std::fixed << std::setprecision(1)
                  << "(" << positions[i].x << ", " << positions[i].y << ")\n";
    }
    std::cout.unsetf(std::ios::fixed);
    std::cout << "   Stress: " << optimizer.calculate_stress(similarities, positions, node_ids) << "\n";

    std::cout << "\n3. Convergence over successive runs:\n";
    auto previous = positions;
    for (int round = 0; round < 3; ++round) {
        auto next = optimizer.optimize_positions(similarities, node_ids, constraints);
        optimizer.monitor_convergence(next, previous);
        previous = next;
    }
    optimizer.get_convergence_state().print_summary();

    std::cout << "\n4. Mapping benchmark:\n";
    for (const auto& result : optimizer.benchmark_mapping_algorithms(similarities, default_mapping_candidates())) {
        std::cout << "   " << std::left << std::setw(14) << result.name
                  << "stress " << result.stress_score
                  << ", quality " << result.quality_metric << "\n";
    }

    return 0;
}
