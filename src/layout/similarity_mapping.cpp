#include "layout/similarity_mapping.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace kn {

std::string mapping_kind_to_string(MappingKind kind) {
    switch (kind) {
        case MappingKind::Exponential: return "exponential";
        case MappingKind::Linear:      return "linear";
        case MappingKind::Logarithmic: return "logarithmic";
        case MappingKind::Spring:      return "spring";
        case MappingKind::Threshold:   return "threshold";
        case MappingKind::PowerLaw:    return "power_law";
    }
    return "exponential";
}

MappingKind mapping_kind_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "exponential") return MappingKind::Exponential;
    if (lower == "linear") return MappingKind::Linear;
    if (lower == "logarithmic") return MappingKind::Logarithmic;
    if (lower == "spring") return MappingKind::Spring;
    if (lower == "threshold") return MappingKind::Threshold;
    if (lower == "power_law" || lower == "powerlaw") return MappingKind::PowerLaw;

    throw std::invalid_argument("Unknown similarity mapping: " + name);
}

// ==========================================
// MappingConfig factories
// ==========================================

MappingConfig MappingConfig::exponential(double max_distance, double exponent) {
    MappingConfig config;
    config.kind = MappingKind::Exponential;
    config.max_distance = max_distance;
    config.exponent = exponent;
    return config;
}

MappingConfig MappingConfig::linear(double max_distance) {
    MappingConfig config;
    config.kind = MappingKind::Linear;
    config.max_distance = max_distance;
    return config;
}

MappingConfig MappingConfig::logarithmic(double max_distance, double epsilon) {
    MappingConfig config;
    config.kind = MappingKind::Logarithmic;
    config.max_distance = max_distance;
    config.epsilon = epsilon;
    return config;
}

MappingConfig MappingConfig::spring(double rest_length, double spring_constant) {
    MappingConfig config;
    config.kind = MappingKind::Spring;
    config.rest_length = rest_length;
    config.spring_constant = spring_constant;
    return config;
}

MappingConfig MappingConfig::threshold_step(double threshold,
                                            double close_distance,
                                            double far_distance) {
    MappingConfig config;
    config.kind = MappingKind::Threshold;
    config.threshold = threshold;
    config.close_distance = close_distance;
    config.far_distance = far_distance;
    return config;
}

MappingConfig MappingConfig::power_law(double scale, double exponent) {
    MappingConfig config;
    config.kind = MappingKind::PowerLaw;
    config.scale = scale;
    config.exponent = exponent;
    return config;
}

MappingConfig MappingConfig::defaults_for(MappingKind kind) {
    switch (kind) {
        case MappingKind::Exponential: return exponential();
        case MappingKind::Linear:      return linear();
        case MappingKind::Logarithmic: return logarithmic();
        case MappingKind::Spring:      return spring();
        case MappingKind::Threshold:   return threshold_step();
        case MappingKind::PowerLaw:    return power_law();
    }
    return exponential();
}

bool MappingConfig::validate(std::string& error_message) const {
    const double values[] = {max_distance, exponent, epsilon, rest_length, spring_constant,
                             threshold, close_distance, far_distance, scale};
    for (double value : values) {
        if (!std::isfinite(value)) {
            error_message = "mapping parameters must be finite";
            return false;
        }
    }

    if (epsilon <= 0.0 || epsilon >= 1.0) {
        error_message = "epsilon must be between 0 and 1 (exclusive)";
        return false;
    }

    if (exponent <= 0.0) {
        error_message = "exponent must be positive";
        return false;
    }

    if (max_distance < 0.0 || rest_length < 0.0 || scale < 0.0) {
        error_message = "max_distance, rest_length and scale must be non-negative";
        return false;
    }

    if (spring_constant < 0.0) {
        error_message = "spring_constant must be non-negative";
        return false;
    }

    if (close_distance < 0.0 || far_distance < 0.0) {
        error_message = "close_distance and far_distance must be non-negative";
        return false;
    }

    return true;
}

nlohmann::json MappingConfig::to_json() const {
    nlohmann::json j;
    j["kind"] = mapping_kind_to_string(kind);

    switch (kind) {
        case MappingKind::Exponential:
            j["max_distance"] = max_distance;
            j["exponent"] = exponent;
            break;
        case MappingKind::Linear:
            j["max_distance"] = max_distance;
            break;
        case MappingKind::Logarithmic:
            j["max_distance"] = max_distance;
            j["epsilon"] = epsilon;
            break;
        case MappingKind::Spring:
            j["rest_length"] = rest_length;
            j["spring_constant"] = spring_constant;
            break;
        case MappingKind::Threshold:
            j["threshold"] = threshold;
            j["close_distance"] = close_distance;
            j["far_distance"] = far_distance;
            break;
        case MappingKind::PowerLaw:
            j["scale"] = scale;
            j["exponent"] = exponent;
            break;
    }

    return j;
}

MappingConfig MappingConfig::from_json(const nlohmann::json& j) {
    MappingConfig config = defaults_for(mapping_kind_from_string(j.value("kind", "exponential")));

    if (j.contains("max_distance")) config.max_distance = j["max_distance"];
    if (j.contains("exponent")) config.exponent = j["exponent"];
    if (j.contains("epsilon")) config.epsilon = j["epsilon"];
    if (j.contains("rest_length")) config.rest_length = j["rest_length"];
    if (j.contains("spring_constant")) config.spring_constant = j["spring_constant"];
    if (j.contains("threshold")) config.threshold = j["threshold"];
    if (j.contains("close_distance")) config.close_distance = j["close_distance"];
    if (j.contains("far_distance")) config.far_distance = j["far_distance"];
    if (j.contains("scale")) config.scale = j["scale"];

    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    return config;
}

// ==========================================
// Dispatch
// ==========================================

double map_similarity(double similarity, const MappingConfig& config) {
    const double s = std::isnan(similarity) ? 0.0 : std::clamp(similarity, 0.0, 1.0);

    switch (config.kind) {
        case MappingKind::Exponential:
            return config.max_distance * (1.0 - std::pow(s, config.exponent));

        case MappingKind::Linear:
            return config.max_distance * (1.0 - s);

        case MappingKind::Logarithmic: {
            const double max_log = -std::log(config.epsilon);
            if (max_log == 0.0) {
                return 0.0;
            }
            return config.max_distance * (-std::log(s + config.epsilon) / max_log);
        }

        case MappingKind::Spring:
            return config.rest_length * (1.0 - s * config.spring_constant);

        case MappingKind::Threshold:
            return s >= config.threshold ? config.close_distance : config.far_distance;

        case MappingKind::PowerLaw:
            return config.scale * std::pow(1.0 - s + 0.01, config.exponent);
    }

    return 0.0;
}

std::vector<MappingCandidate> default_mapping_candidates() {
    return {
        {"exponential", MappingConfig::exponential()},
        {"linear", MappingConfig::linear()},
        {"logarithmic", MappingConfig::logarithmic()},
        {"spring", MappingConfig::spring()},
        {"threshold", MappingConfig::threshold_step()},
        {"power_law", MappingConfig::power_law()}
    };
}

} // namespace kn
