#ifndef KEYMORPH_MORPH_CACHE_HPP
#define KEYMORPH_MORPH_CACHE_HPP

#include <keymorph/concurrent_hash_map.hpp>
#include <keymorph/contour_morph.hpp>
#include <atomic>
#include <cstddef>

namespace keymorph {

/**
 * Structural identity of one prepare_morph() call. Strategies enter through
 * their parameter hashes, so two equal-parameter matchers share entries.
 */
struct MorphKey {
    ContourSet start;
    ContourSet end;
    double rotation1 = 0.0;
    double rotation2 = 0.0;
    std::size_t resolution = 0;
    AlignmentNorm norm = AlignmentNorm::L1;
    OpenPairAlignment open_pair = OpenPairAlignment::SEQUENTIAL;
    std::size_t aligner_hash = 0;
    std::size_t hole_aligner_hash = 0;
    std::size_t matcher_hash = 0;

    bool operator==(const MorphKey& other) const {
        return rotation1 == other.rotation1 && rotation2 == other.rotation2 &&
               resolution == other.resolution && norm == other.norm && open_pair == other.open_pair &&
               aligner_hash == other.aligner_hash && hole_aligner_hash == other.hole_aligner_hash &&
               matcher_hash == other.matcher_hash && start == other.start && end == other.end;
    }

    std::size_t hash() const;
};

struct MorphKeyHash {
    std::size_t operator()(const MorphKey& key) const { return key.hash(); }
};

MorphKey make_morph_key(const ContourSet& start, const ContourSet& end, const MorphRequest& request);

/**
 * Shared memo of prepared morphs, safe for concurrent lookup and insertion
 * from frame workers. The first insert for a key wins; a racing worker
 * discards its own equal result.
 */
class MorphCache {
private:
    ConcurrentHashMap<MorphKey, PreparedMorphPtr, MorphKeyHash> entries_;
    std::atomic<std::size_t> hits_{0};
    std::atomic<std::size_t> misses_{0};

public:
    explicit MorphCache(std::size_t bucket_count = 1024) : entries_(bucket_count) {}

    /**
     * Cached result of prepare_morph(start, end, request), computed on a miss.
     */
    PreparedMorphPtr prepared(const ContourSet& start, const ContourSet& end, const MorphRequest& request);

    PreparedMorphPtr find(const MorphKey& key) const;

    std::size_t size() const { return entries_.size(); }
    std::size_t hits() const { return hits_.load(std::memory_order_relaxed); }
    std::size_t misses() const { return misses_.load(std::memory_order_relaxed); }

    // Not safe while other threads use the cache
    void clear();
};

} // namespace keymorph

#endif // KEYMORPH_MORPH_CACHE_HPP
