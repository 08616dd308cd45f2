#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kn {

/**
 * @brief A resolved point in layout space
 *
 * Layouts always produce three components; 2D layouts keep z at 0.
 */
struct Position {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    nlohmann::json to_json() const;
    static Position from_json(const nlohmann::json& j);
};

inline Position operator+(const Position& a, const Position& b) {
    return {a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Position operator-(const Position& a, const Position& b) {
    return {a.x - b.x, a.y - b.y, a.z - b.z};
}

inline Position operator*(const Position& a, double s) {
    return {a.x * s, a.y * s, a.z * s};
}

/**
 * @brief Query input point; z is absent for 2D queries
 */
struct Point {
    double x = 0.0;
    double y = 0.0;
    std::optional<double> z;

    Position lifted() const { return {x, y, z.value_or(0.0)}; }
};

/**
 * @brief A node with resolved coordinates, as produced by a layout stage
 */
struct PositionedNode {
    std::string id;
    double x = 0.0;
    double y = 0.0;
    std::optional<double> z;

    Position position() const { return {x, y, z.value_or(0.0)}; }
    bool has_z() const;

    nlohmann::json to_json() const;
    static PositionedNode from_json(const nlohmann::json& j);
};

/**
 * @brief Axis-aligned rectangle (2D) or box (3D)
 *
 * 2D volumes keep min_z == max_z == 0.
 */
struct BoundingVolume {
    double min_x = 0.0;
    double min_y = 0.0;
    double min_z = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;
    double max_z = 0.0;

    // Copy with swapped min/max on any inverted axis
    BoundingVolume normalized() const;

    bool contains(const Position& p) const;
    bool intersects(const BoundingVolume& other) const;
    Position clamp(const Position& p) const;
    Position center() const;

    // Squared distance from p to the closest point of the volume (0 inside)
    double squared_distance_to(const Position& p) const;

    nlohmann::json to_json() const;
    static BoundingVolume from_json(const nlohmann::json& j);
};

// Region query shapes, origin corner plus extent
struct Rectangle {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

struct Box {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double width = 0.0;
    double height = 0.0;
    double depth = 0.0;
};

/**
 * @brief Ray with a direction of any non-zero length
 */
struct Ray {
    Point origin;
    Point direction;
};

struct Intersection {
    PositionedNode node;
    Position point;           // Closest point on the ray to the node
    double distance = 0.0;    // Parametric distance from origin, >= 0
    double offset = 0.0;      // Perpendicular distance from node to ray
    bool direct_hit = false;  // offset below point_query_tolerance

    nlohmann::json to_json() const;
};

struct NodeDistance {
    PositionedNode node;
    double distance = 0.0;

    nlohmann::json to_json() const;
};

double distance(const Position& a, const Position& b);
double squared_distance(const Position& a, const Position& b);
double length(const Position& v);
double dot(const Position& a, const Position& b);

// Unit vector, or std::nullopt for a zero or non-finite vector
std::optional<Position> normalize(const Position& v);

// Load nodes from an array or a {"nodes": [...]} object
std::vector<PositionedNode> load_positioned_nodes(const std::string& path);
std::vector<PositionedNode> positioned_nodes_from_json(const nlohmann::json& j);
void save_positioned_nodes(const std::vector<PositionedNode>& nodes, const std::string& path);

} // namespace kn
