#include "cli/cli.hpp"
#include "layout/similarity_mapping.hpp"
#include "layout/similarity_matrix.hpp"
#include "layout/spatial_optimizer.hpp"
#include "spatial/geometry.hpp"
#include "spatial/index_config.hpp"
#include "spatial/spatial_index.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

using namespace kn;
using json = nlohmann::json;

// ============== Helper Functions ==============

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

Point parse_point(const ArgValue& arg) {
    auto values = arg.as_double_list();
    if (values.size() != 2 && values.size() != 3) {
        throw std::runtime_error("--" + arg.name + " expects x,y or x,y,z");
    }

    Point point;
    point.x = values[0];
    point.y = values[1];
    if (values.size() == 3) {
        point.z = values[2];
    }
    return point;
}

SpatialIndexConfig index_config_from_args(const Args& args) {
    SpatialIndexConfig config = SpatialIndexConfig::from_environment();
    if (args.has("preset")) {
        config = presets::preset_by_name(args.get("preset").value);
    }
    if (args.has("config")) {
        config = SpatialIndexConfig::from_json_file(args.get("config").value);
    }
    if (args.has("verbose")) {
        config.verbose = true;
    }
    return config;
}

// ============== kn layout ==============
int cmd_layout(const Args& args) {
    std::string input_path = args.require("input");
    std::string output_path = args.require("output");
    int dimensions = args.get("dimensions", "2").as_int();

    OptimizerConfig config = OptimizerConfig::from_environment();
    if (args.has("config")) {
        config = OptimizerConfig::from_json_file(args.get("config").value);
    }
    if (args.has("seed")) {
        config.seed = OptimizerConfig::parse_seed(args.get("seed").value);
    }
    if (args.has("iterations")) {
        config.max_iterations = args.get("iterations").as_int();
    }
    config.verbose = config.verbose || args.has("verbose");

    MappingConfig mapping = MappingConfig::defaults_for(
        mapping_kind_from_string(args.get("mapping", "exponential").value));

    std::cout << "Loading similarities from: " << input_path << "\n";
    SimilarityMatrix similarities = SimilarityMatrix::load_from_json(input_path);
    auto node_ids = similarities.node_ids();
    std::cout << "Loaded " << similarities.size() << " pairs over " << node_ids.size() << " nodes\n";

    LayoutConstraints constraints;
    constraints.dimensions = dimensions;

    SpatialOptimizer optimizer(mapping, config);

    auto start = std::chrono::steady_clock::now();
    auto positions = optimizer.optimize_positions(similarities, node_ids, constraints);
    auto elapsed = std::chrono::steady_clock::now() - start;

    std::vector<PositionedNode> nodes;
    nodes.reserve(positions.size());
    for (size_t i = 0; i < positions.size(); ++i) {
        PositionedNode node;
        node.id = node_ids[i];
        node.x = positions[i].x;
        node.y = positions[i].y;
        if (dimensions == 3) {
            node.z = positions[i].z;
        }
        nodes.push_back(std::move(node));
    }

    save_positioned_nodes(nodes, output_path);

    std::cout << "Layout (" << mapping_kind_to_string(mapping.kind) << ", " << dimensions << "D) in "
              << format_duration(elapsed) << "\n";
    std::cout << "  Stress: " << optimizer.calculate_stress(similarities, positions, node_ids) << "\n";
    std::cout << "Saved " << nodes.size() << " positioned nodes to: " << output_path << "\n";
    return 0;
}

// ============== kn benchmark ==============
int cmd_benchmark(const Args& args) {
    std::string input_path = args.require("input");

    OptimizerConfig config = OptimizerConfig::from_environment();
    if (args.has("seed")) {
        config.seed = OptimizerConfig::parse_seed(args.get("seed").value);
    }

    std::cout << "Loading similarities from: " << input_path << "\n";
    SimilarityMatrix similarities = SimilarityMatrix::load_from_json(input_path);

    SpatialOptimizer optimizer(MappingConfig::exponential(), config);
    auto results = optimizer.benchmark_mapping_algorithms(similarities, default_mapping_candidates());

    std::cout << "\n" << std::left << std::setw(14) << "Mapping"
              << std::right << std::setw(12) << "Stress"
              << std::setw(12) << "Time (ms)"
              << std::setw(12) << "Quality" << "\n";
    std::cout << std::string(50, '-') << "\n";
    for (const auto& result : results) {
        std::cout << std::left << std::setw(14) << result.name
                  << std::right << std::fixed << std::setprecision(3)
                  << std::setw(12) << result.stress_score
                  << std::setw(12) << result.time_ms
                  << std::setw(12) << result.quality_metric << "\n";
    }
    std::cout.unsetf(std::ios::fixed);

    if (args.has("output")) {
        json out = json::array();
        for (const auto& result : results) {
            out.push_back(result.to_json());
        }
        std::ofstream file(args.get("output").value);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + args.get("output").value);
        }
        file << out.dump(2);
    }

    return 0;
}

// ============== kn index ==============
int cmd_index(const Args& args) {
    std::string input_path = args.require("input");

    std::cout << "Loading positioned nodes from: " << input_path << "\n";
    auto nodes = load_positioned_nodes(input_path);

    SpatialIndex index(index_config_from_args(args));
    index.build(nodes);

    auto stats = index.get_statistics();
    stats.print_summary();

    if (nodes.size() != stats.node_count) {
        std::cerr << "Warning: " << (nodes.size() - stats.node_count)
                  << " nodes with non-finite coordinates were skipped\n";
    }

    if (args.has("output")) {
        std::string output_path = args.get("output").value;
        std::ofstream file(output_path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + output_path);
        }
        file << index.to_json().dump(2);
        std::cout << "Saved tree to: " << output_path << "\n";
    }

    return 0;
}

// ============== kn query ==============
int cmd_query(const Args& args) {
    std::string input_path = args.require("input");
    std::string type = args.require("type");

    auto nodes = load_positioned_nodes(input_path);
    SpatialIndex index(index_config_from_args(args));
    index.build(nodes);

    json out;
    out["type"] = type;

    if (type == "point") {
        Point at = parse_point(args.get("at"));
        json results = json::array();
        for (const auto& node : index.query_point(at, args.get("radius", "0").as_double())) {
            results.push_back(node.to_json());
        }
        out["results"] = results;
    } else if (type == "region") {
        auto values = args.get("region").as_double_list();
        std::vector<PositionedNode> found;
        if (values.size() == 4) {
            found = index.query_region(Rectangle{values[0], values[1], values[2], values[3]});
        } else if (values.size() == 6) {
            found = index.query_region(Box{values[0], values[1], values[4], values[2], values[3], values[5]});
        } else {
            throw std::runtime_error("--region expects x,y,w,h or x,y,w,h,z,d");
        }
        json results = json::array();
        for (const auto& node : found) {
            results.push_back(node.to_json());
        }
        out["results"] = results;
    } else if (type == "ray") {
        Ray ray;
        ray.origin = parse_point(args.get("at"));
        ray.direction = parse_point(args.get("direction"));
        json results = json::array();
        for (const auto& hit : index.query_ray(ray)) {
            results.push_back(hit.to_json());
        }
        out["results"] = results;
    } else if (type == "nearest") {
        Point at = parse_point(args.get("at"));
        std::optional<double> max_distance;
        if (args.has("max-distance")) {
            max_distance = args.get("max-distance").as_double();
        }
        auto nearest = index.find_nearest(at, max_distance);
        out["result"] = nearest ? nearest->to_json() : json(nullptr);
    } else if (type == "within") {
        Point at = parse_point(args.get("at"));
        double max_distance = args.get("max-distance", "0").as_double();
        json results = json::array();
        for (const auto& entry : index.get_nodes_within_distance(at, max_distance)) {
            results.push_back(entry.to_json());
        }
        out["results"] = results;
    } else {
        throw std::runtime_error("Unknown query type: " + type +
                                 " (expected point, region, ray, nearest or within)");
    }

    std::cout << out.dump(2) << "\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("kn", "1.0.0");

    // kn layout
    cli.register_command({
        "layout",
        "Compute node positions from a similarity matrix",
        {
            {"input", "i", "Similarity matrix JSON file", "", true, false},
            {"output", "o", "Output JSON file for positioned nodes", "", true, false},
            {"mapping", "m", "Mapping: exponential, linear, logarithmic, spring, threshold, power_law", "exponential", false, false},
            {"dimensions", "d", "Layout dimensions (2 or 3)", "2", false, false},
            {"config", "c", "Optimizer config JSON file", "", false, false},
            {"iterations", "n", "Override max iterations", "", false, false},
            {"seed", "s", "Random seed for reproducible layouts", "", false, false},
            {"verbose", "V", "Print progress", "", false, true}
        },
        cmd_layout
    });

    // kn benchmark
    cli.register_command({
        "benchmark",
        "Compare every similarity mapping on a matrix",
        {
            {"input", "i", "Similarity matrix JSON file", "", true, false},
            {"output", "o", "Optional JSON file for the ranking", "", false, false},
            {"seed", "s", "Random seed", "", false, false}
        },
        cmd_benchmark
    });

    // kn index
    cli.register_command({
        "index",
        "Build a spatial index and print its statistics",
        {
            {"input", "i", "Positioned nodes JSON file", "", true, false},
            {"preset", "p", "Preset: fast, precise, balanced, memory_efficient", "", false, false},
            {"config", "c", "Index config JSON file", "", false, false},
            {"output", "o", "Optional JSON file for the tree dump", "", false, false},
            {"verbose", "V", "Print progress", "", false, true}
        },
        cmd_index
    });

    // kn query
    cli.register_command({
        "query",
        "Run a spatial query against positioned nodes",
        {
            {"input", "i", "Positioned nodes JSON file", "", true, false},
            {"type", "t", "Query type: point, region, ray, nearest, within", "", true, false},
            {"at", "a", "Query point or ray origin: x,y[,z]", "", false, false},
            {"radius", "r", "Point query radius", "0", false, false},
            {"region", "g", "Region: x,y,w,h or x,y,w,h,z,d", "", false, false},
            {"direction", "d", "Ray direction: dx,dy[,dz]", "", false, false},
            {"max-distance", "x", "Distance limit for nearest and within", "", false, false},
            {"preset", "p", "Index preset", "", false, false},
            {"config", "c", "Index config JSON file", "", false, false},
            {"verbose", "V", "Print progress", "", false, true}
        },
        cmd_query
    });

    return cli.run(argc, argv);
}
