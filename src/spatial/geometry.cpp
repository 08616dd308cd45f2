#include "spatial/geometry.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace kn {

// ==========================================
// Position
// ==========================================

nlohmann::json Position::to_json() const {
    return nlohmann::json{{"x", x}, {"y", y}, {"z", z}};
}

Position Position::from_json(const nlohmann::json& j) {
    Position p;
    p.x = j.at("x").get<double>();
    p.y = j.at("y").get<double>();
    p.z = j.value("z", 0.0);
    return p;
}

// ==========================================
// PositionedNode
// ==========================================

bool PositionedNode::has_z() const {
    return z.has_value() && !std::isnan(*z);
}

nlohmann::json PositionedNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["x"] = x;
    j["y"] = y;
    if (z) {
        j["z"] = *z;
    }
    return j;
}

PositionedNode PositionedNode::from_json(const nlohmann::json& j) {
    PositionedNode node;
    node.id = j.at("id").get<std::string>();
    node.x = j.at("x").get<double>();
    node.y = j.at("y").get<double>();
    if (j.contains("z") && !j["z"].is_null()) {
        node.z = j["z"].get<double>();
    }
    return node;
}

// ==========================================
// BoundingVolume
// ==========================================

BoundingVolume BoundingVolume::normalized() const {
    BoundingVolume v;
    v.min_x = std::min(min_x, max_x);
    v.max_x = std::max(min_x, max_x);
    v.min_y = std::min(min_y, max_y);
    v.max_y = std::max(min_y, max_y);
    v.min_z = std::min(min_z, max_z);
    v.max_z = std::max(min_z, max_z);
    return v;
}

bool BoundingVolume::contains(const Position& p) const {
    return p.x >= min_x && p.x <= max_x &&
           p.y >= min_y && p.y <= max_y &&
           p.z >= min_z && p.z <= max_z;
}

bool BoundingVolume::intersects(const BoundingVolume& other) const {
    return !(other.min_x > max_x || other.max_x < min_x ||
             other.min_y > max_y || other.max_y < min_y ||
             other.min_z > max_z || other.max_z < min_z);
}

Position BoundingVolume::clamp(const Position& p) const {
    return {
        std::max(min_x, std::min(max_x, p.x)),
        std::max(min_y, std::min(max_y, p.y)),
        std::max(min_z, std::min(max_z, p.z))
    };
}

Position BoundingVolume::center() const {
    return {(min_x + max_x) / 2.0, (min_y + max_y) / 2.0, (min_z + max_z) / 2.0};
}

double BoundingVolume::squared_distance_to(const Position& p) const {
    Position closest = clamp(p);
    return squared_distance(p, closest);
}

nlohmann::json BoundingVolume::to_json() const {
    return nlohmann::json{
        {"min_x", min_x}, {"min_y", min_y}, {"min_z", min_z},
        {"max_x", max_x}, {"max_y", max_y}, {"max_z", max_z}
    };
}

BoundingVolume BoundingVolume::from_json(const nlohmann::json& j) {
    BoundingVolume v;
    v.min_x = j.at("min_x").get<double>();
    v.min_y = j.at("min_y").get<double>();
    v.max_x = j.at("max_x").get<double>();
    v.max_y = j.at("max_y").get<double>();
    v.min_z = j.value("min_z", 0.0);
    v.max_z = j.value("max_z", 0.0);
    return v;
}

// ==========================================
// Query results
// ==========================================

nlohmann::json Intersection::to_json() const {
    nlohmann::json j;
    j["node"] = node.to_json();
    j["point"] = point.to_json();
    j["distance"] = distance;
    j["offset"] = offset;
    j["direct_hit"] = direct_hit;
    return j;
}

nlohmann::json NodeDistance::to_json() const {
    return nlohmann::json{{"node", node.to_json()}, {"distance", distance}};
}

// ==========================================
// Vector helpers
// ==========================================

double squared_distance(const Position& a, const Position& b) {
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    const double dz = a.z - b.z;
    return dx * dx + dy * dy + dz * dz;
}

double distance(const Position& a, const Position& b) {
    return std::sqrt(squared_distance(a, b));
}

double length(const Position& v) {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

double dot(const Position& a, const Position& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

std::optional<Position> normalize(const Position& v) {
    const double len = length(v);
    if (!std::isfinite(len) || len == 0.0) {
        return std::nullopt;
    }
    return Position{v.x / len, v.y / len, v.z / len};
}

// ==========================================
// File I/O
// ==========================================

std::vector<PositionedNode> positioned_nodes_from_json(const nlohmann::json& j) {
    const nlohmann::json& arr = j.is_object() ? j.at("nodes") : j;
    if (!arr.is_array()) {
        throw std::runtime_error("Positioned nodes must be a JSON array");
    }

    std::vector<PositionedNode> nodes;
    nodes.reserve(arr.size());
    for (const auto& item : arr) {
        nodes.push_back(PositionedNode::from_json(item));
    }
    return nodes;
}

std::vector<PositionedNode> load_positioned_nodes(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + path);
    }

    nlohmann::json j;
    file >> j;
    return positioned_nodes_from_json(j);
}

void save_positioned_nodes(const std::vector<PositionedNode>& nodes, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& node : nodes) {
        arr.push_back(node.to_json());
    }
    file << nlohmann::json{{"nodes", arr}}.dump(2);
}

} // namespace kn
