#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kn {

/**
 * @brief Sparse symmetric similarity scores keyed by node pair
 *
 * Keys are canonical "min_id|max_id" strings, so (a, b) and (b, a) resolve
 * to the same entry. A pair without an entry has similarity 0.
 * Keys that cannot be split into two ids are kept as inserted but are
 * ignored by node extraction and pair lookups.
 */
class SimilarityMatrix {
public:
    static constexpr char kKeySeparator = '|';

    SimilarityMatrix() = default;

    /**
     * @brief Build the canonical key for an unordered pair
     */
    static std::string make_pair_key(const std::string& a, const std::string& b);

    /**
     * @brief Split a key into its two ids
     * @return std::nullopt for malformed keys (no separator or an empty side)
     */
    static std::optional<std::pair<std::string, std::string>> split_pair_key(const std::string& key);

    // Set or overwrite the score of an unordered pair
    void set(const std::string& a, const std::string& b, double similarity);

    // Insert an already-joined key; well-formed keys are canonicalised
    void insert_key(const std::string& key, double similarity);

    std::optional<double> get(const std::string& a, const std::string& b) const;

    // Score of a pair, 0 when absent
    double similarity(const std::string& a, const std::string& b) const;

    bool contains(const std::string& a, const std::string& b) const;

    /**
     * @brief Distinct node ids in order of first appearance among keys
     */
    std::vector<std::string> node_ids() const;

    size_t size() const { return scores_.size(); }
    bool empty() const { return scores_.empty(); }
    void clear();

    // Keys in insertion order
    const std::vector<std::string>& keys() const { return key_order_; }

    /**
     * @brief Accepts {"a|b": 0.8} objects or
     *        [{"source": "a", "target": "b", "similarity": 0.8}] arrays
     */
    static SimilarityMatrix from_json(const nlohmann::json& j);
    static SimilarityMatrix load_from_json(const std::string& path);

    nlohmann::json to_json() const;

private:
    std::unordered_map<std::string, double> scores_;
    std::vector<std::string> key_order_;
};

} // namespace kn
