// morphing_config.cpp - Settings conversion and strategy factories

#include "keymorph/morphing_config.hpp"
#include "keymorph/debug_log.hpp"
#include "keymorph/errors.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

namespace keymorph {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string v = to_lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw ConfigError(key, "expected a boolean, got '" + value + "'");
}

unsigned long long parse_unsigned(const std::string& key, const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ConfigError(key, "expected an unsigned integer, got '" + value + "'");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw ConfigError(key, "value out of range: '" + value + "'");
    }
}

ColorSpace parse_color_space(const std::string& key, const std::string& value) {
    std::string v = to_lower(value);
    if (v == "rgb") return ColorSpace::RGB;
    if (v == "hsv") return ColorSpace::HSV;
    if (v == "lab") return ColorSpace::LAB;
    if (v == "lch") return ColorSpace::LCH;
    throw ConfigError(key, "unknown color space '" + value + "'");
}

OpenPairAlignment parse_open_alignment(const std::string& key, const std::string& value) {
    std::string v = to_lower(value);
    if (v == "sequential") return OpenPairAlignment::SEQUENTIAL;
    if (v == "euclidean") return OpenPairAlignment::EUCLIDEAN;
    throw ConfigError(key, "unknown open-pair alignment '" + value + "'");
}

} // anonymous namespace

const char* hole_matching_strategy_name(HoleMatchingStrategy strategy) {
    switch (strategy) {
        case HoleMatchingStrategy::CLUSTERING: return "clustering";
        case HoleMatchingStrategy::GREEDY: return "greedy";
        case HoleMatchingStrategy::DISCRETE: return "discrete";
        case HoleMatchingStrategy::SIMPLE: return "simple";
        case HoleMatchingStrategy::OPTIMAL_ASSIGNMENT: return "optimal-assignment";
    }
    return "unknown";
}

std::optional<HoleMatchingStrategy> parse_hole_matching_strategy(const std::string& name) {
    std::string n = to_lower(name);
    for (auto strategy : {HoleMatchingStrategy::CLUSTERING, HoleMatchingStrategy::GREEDY,
                          HoleMatchingStrategy::DISCRETE, HoleMatchingStrategy::SIMPLE,
                          HoleMatchingStrategy::OPTIMAL_ASSIGNMENT}) {
        if (n == hole_matching_strategy_name(strategy)) return strategy;
    }
    return std::nullopt;
}

MorphingConfig MorphingConfig::from_settings(const std::map<std::string, std::string>& settings) {
    MorphingConfig config;

    for (const auto& [key, value] : settings) {
        if (key == "morphing.vertex_loop_mapper") {
            auto strategy = parse_hole_matching_strategy(value);
            if (!strategy) {
                throw ConfigError(key, "unknown hole matching strategy '" + value + "'");
            }
            config.hole_matching = *strategy;
        } else if (key == "morphing.clustering.balance_clusters") {
            config.clustering.balance_clusters = parse_bool(key, value);
        } else if (key == "morphing.clustering.max_iterations") {
            config.clustering.max_iterations = static_cast<std::size_t>(parse_unsigned(key, value));
        } else if (key == "morphing.clustering.random_seed") {
            config.clustering.random_seed = static_cast<std::uint64_t>(parse_unsigned(key, value));
        } else if (key == "morphing.vertex_alignment_norm") {
            auto norm = parse_alignment_norm(value);
            if (!norm) {
                throw ConfigError(key, "unknown alignment norm '" + value + "'");
            }
            config.alignment_norm = *norm;
        } else if (key == "morphing.open_alignment") {
            config.open_alignment = parse_open_alignment(key, value);
        } else if (key == "morphing.resolution") {
            config.resolution = static_cast<std::size_t>(parse_unsigned(key, value));
        } else if (key == "morphing.color_space") {
            config.color_space = parse_color_space(key, value);
        } else {
            KEYMORPH_DEBUG_LOG("Ignoring setting '%s'", key.c_str());
        }
    }

    KEYMORPH_DEBUG_LOG("Morphing config: holes=%s norm=%s resolution=%zu color=%s",
                       hole_matching_strategy_name(config.hole_matching),
                       alignment_norm_name(config.alignment_norm), config.resolution,
                       color_space_name(config.color_space));
    return config;
}

HoleMatcherPtr make_hole_matcher(const MorphingConfig& config) {
    switch (config.hole_matching) {
        case HoleMatchingStrategy::CLUSTERING:
            return std::make_shared<ClusteringHoleMatcher>(config.clustering);
        case HoleMatchingStrategy::GREEDY:
            return std::make_shared<GreedyHoleMatcher>();
        case HoleMatchingStrategy::DISCRETE:
            return std::make_shared<DiscreteHoleMatcher>();
        case HoleMatchingStrategy::SIMPLE:
            return std::make_shared<SimpleHoleMatcher>();
        case HoleMatchingStrategy::OPTIMAL_ASSIGNMENT:
            return std::make_shared<OptimalAssignmentHoleMatcher>();
    }
    return std::make_shared<ClusteringHoleMatcher>(config.clustering);
}

VertexAlignerPtr make_default_aligner(const MorphingConfig& config, bool closed1, bool closed2) {
    return select_default_aligner(closed1, closed2, config.alignment_norm, config.open_alignment);
}

} // namespace keymorph
