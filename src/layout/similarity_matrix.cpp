#include "layout/similarity_matrix.hpp"
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace kn {

std::string SimilarityMatrix::make_pair_key(const std::string& a, const std::string& b) {
    const std::string& min_id = a < b ? a : b;
    const std::string& max_id = a < b ? b : a;
    return min_id + kKeySeparator + max_id;
}

std::optional<std::pair<std::string, std::string>>
SimilarityMatrix::split_pair_key(const std::string& key) {
    auto pos = key.find(kKeySeparator);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    std::string first = key.substr(0, pos);
    std::string second = key.substr(pos + 1);
    if (first.empty() || second.empty() ||
        second.find(kKeySeparator) != std::string::npos) {
        return std::nullopt;
    }

    return std::make_pair(std::move(first), std::move(second));
}

void SimilarityMatrix::set(const std::string& a, const std::string& b, double similarity) {
    insert_key(make_pair_key(a, b), similarity);
}

void SimilarityMatrix::insert_key(const std::string& key, double similarity) {
    std::string canonical = key;
    if (auto ids = split_pair_key(key)) {
        canonical = make_pair_key(ids->first, ids->second);
    }

    auto it = scores_.find(canonical);
    if (it != scores_.end()) {
        it->second = similarity;
        return;
    }

    scores_.emplace(canonical, similarity);
    key_order_.push_back(std::move(canonical));
}

std::optional<double> SimilarityMatrix::get(const std::string& a, const std::string& b) const {
    auto it = scores_.find(make_pair_key(a, b));
    if (it == scores_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double SimilarityMatrix::similarity(const std::string& a, const std::string& b) const {
    return get(a, b).value_or(0.0);
}

bool SimilarityMatrix::contains(const std::string& a, const std::string& b) const {
    return scores_.count(make_pair_key(a, b)) > 0;
}

std::vector<std::string> SimilarityMatrix::node_ids() const {
    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;

    for (const auto& key : key_order_) {
        auto pair = split_pair_key(key);
        if (!pair) continue;

        if (seen.insert(pair->first).second) {
            ids.push_back(pair->first);
        }
        if (seen.insert(pair->second).second) {
            ids.push_back(pair->second);
        }
    }

    return ids;
}

void SimilarityMatrix::clear() {
    scores_.clear();
    key_order_.clear();
}

SimilarityMatrix SimilarityMatrix::from_json(const nlohmann::json& j) {
    SimilarityMatrix matrix;

    if (j.is_object()) {
        const nlohmann::json& entries = j.contains("similarities") ? j["similarities"] : j;
        if (entries.is_array()) {
            return from_json(entries);
        }
        for (auto& [key, value] : entries.items()) {
            matrix.insert_key(key, value.get<double>());
        }
    } else if (j.is_array()) {
        for (const auto& entry : j) {
            matrix.set(entry.at("source").get<std::string>(),
                       entry.at("target").get<std::string>(),
                       entry.at("similarity").get<double>());
        }
    } else {
        throw std::runtime_error("Similarity matrix must be a JSON object or array");
    }

    return matrix;
}

SimilarityMatrix SimilarityMatrix::load_from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + path);
    }

    nlohmann::json j;
    file >> j;
    return from_json(j);
}

nlohmann::json SimilarityMatrix::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& key : key_order_) {
        j[key] = scores_.at(key);
    }
    return j;
}

} // namespace kn
