#include "spatial/spatial_index.hpp"
#include <iostream>

using namespace kn;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void print_nodes(const std::vector<PositionedNode>& nodes) {
    if (nodes.empty()) {
        std::cout << "   (none)\n";
    }
    for (const auto& node : nodes) {
        std::cout << "   " << node.id << " at (" << node.x << ", " << node.y;
        if (node.z) std::cout << ", " << *node.z;
        std::cout << ")\n";
    }
}

int main() {
    print_separator("Spatial Query Example - Quadtree Lookups");

    std::vector<PositionedNode> nodes = {
        {"n1", 10, 10, std::nullopt},
        {"n2", 50, 50, std::nullopt},
        {"n3", 90, 10, std::nullopt},
        {"n4", 30, 70, std::nullopt},
        {"n5", 70, 80, std::nullopt},
        {"n6", 52, 46, std::nullopt}
    };

    SpatialIndex index = SpatialIndex::create_balanced();
    index.build(nodes);
    index.get_statistics().print_summary();

    std::cout << "\n1. Point query at (52, 48), radius 10:\n";
    print_nodes(index.query_point({52, 48, std::nullopt}, 10));

    std::cout << "\n2. Region query x 0..60, y 0..60:\n";
    print_nodes(index.query_region(Rectangle{0, 0, 60, 60}));

    std::cout << "\n3. Ray from (0, 0) along (1, 1):\n";
    for (const auto& hit : index.query_ray({{0, 0, std::nullopt}, {1, 1, std::nullopt}})) {
        std::cout << "   " << hit.node.id << " at distance " << hit.distance
                  << (hit.direct_hit ? " (direct hit)" : "") << "\n";
    }

    std::cout << "\n4. Nearest to (85, 15):\n";
    if (auto nearest = index.find_nearest({85, 15, std::nullopt})) {
        std::cout << "   " << nearest->node.id << " at " << nearest->distance << "\n";
    }

    std::cout << "\n5. Within 30 of (50, 50):\n";
    for (const auto& entry : index.get_nodes_within_distance({50, 50, std::nullopt}, 30)) {
        std::cout << "   " << entry.node.id << " at " << entry.distance << "\n";
    }

    print_separator("Octree Lookups");

    std::vector<PositionedNode> nodes_3d = {
        {"a", 0, 0, 0.0},
        {"b", 10, 10, 10.0},
        {"c", 20, 20, 20.0},
        {"d", 10, 10, 90.0}
    };

    SpatialIndex octree = SpatialIndex::create_precise();
    octree.build(nodes_3d);

    std::cout << "1. Box x,y 5..15, z 0..50:\n";
    print_nodes(octree.query_region(Box{5, 5, 0, 10, 10, 50}));

    std::cout << "\n2. Same footprint as a rectangle (all z):\n";
    print_nodes(octree.query_region(Rectangle{5, 5, 10, 10}));

    return 0;
}
