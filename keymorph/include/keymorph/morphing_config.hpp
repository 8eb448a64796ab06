#ifndef KEYMORPH_MORPHING_CONFIG_HPP
#define KEYMORPH_MORPHING_CONFIG_HPP

#include <keymorph/color.hpp>
#include <keymorph/hole_matching.hpp>
#include <keymorph/vertex_alignment.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace keymorph {

enum class HoleMatchingStrategy {
    CLUSTERING,
    GREEDY,
    DISCRETE,
    SIMPLE,
    OPTIMAL_ASSIGNMENT
};

const char* hole_matching_strategy_name(HoleMatchingStrategy strategy);

// Accepts the names returned by hole_matching_strategy_name()
std::optional<HoleMatchingStrategy> parse_hole_matching_strategy(const std::string& name);

/**
 * Morphing options consumed by the engine. Never read from global state;
 * callers build one directly or convert a settings map with from_settings().
 */
struct MorphingConfig {
    HoleMatchingStrategy hole_matching = HoleMatchingStrategy::CLUSTERING;
    ClusteringParams clustering;
    AlignmentNorm alignment_norm = AlignmentNorm::L1;
    OpenPairAlignment open_alignment = OpenPairAlignment::SEQUENTIAL;
    std::size_t resolution = 0;   // 0: resample to the larger point count
    ColorSpace color_space = ColorSpace::RGB;

    /**
     * Recognized keys:
     *   morphing.vertex_loop_mapper            clustering|greedy|discrete|simple|optimal-assignment
     *   morphing.clustering.balance_clusters   true|false
     *   morphing.clustering.max_iterations     unsigned integer
     *   morphing.clustering.random_seed        unsigned integer
     *   morphing.vertex_alignment_norm         l1|l2|linf
     *   morphing.open_alignment                sequential|euclidean
     *   morphing.resolution                    unsigned integer
     *   morphing.color_space                   rgb|hsv|lab|lch
     * Other keys are ignored. Malformed values throw ConfigError.
     */
    static MorphingConfig from_settings(const std::map<std::string, std::string>& settings);
};

HoleMatcherPtr make_hole_matcher(const MorphingConfig& config);

VertexAlignerPtr make_default_aligner(const MorphingConfig& config, bool closed1, bool closed2);

} // namespace keymorph

#endif // KEYMORPH_MORPHING_CONFIG_HPP
