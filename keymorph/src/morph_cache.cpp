// morph_cache.cpp - Memoization of prepared contour morphs

#include "keymorph/morph_cache.hpp"
#include "keymorph/debug_log.hpp"

namespace keymorph {

std::size_t MorphKey::hash() const {
    std::size_t h = hash_contours(start);
    hash_mix(h, hash_contours(end));
    hash_mix(h, hash_double(rotation1));
    hash_mix(h, hash_double(rotation2));
    hash_mix(h, resolution);
    hash_mix(h, static_cast<std::size_t>(norm));
    hash_mix(h, static_cast<std::size_t>(open_pair));
    hash_mix(h, aligner_hash);
    hash_mix(h, hole_aligner_hash);
    hash_mix(h, matcher_hash);
    return h;
}

MorphKey make_morph_key(const ContourSet& start, const ContourSet& end, const MorphRequest& request) {
    MorphKey key;
    key.start = start;
    key.end = end;
    key.rotation1 = request.rotation1;
    key.rotation2 = request.rotation2;
    key.resolution = request.resolution;
    key.norm = request.norm;
    key.open_pair = request.open_pair;
    key.aligner_hash = request.aligner ? request.aligner->parameter_hash() : 0;
    key.hole_aligner_hash = request.hole_aligner ? request.hole_aligner->parameter_hash() : 0;
    key.matcher_hash = request.hole_matcher ? request.hole_matcher->parameter_hash() : 0;
    return key;
}

PreparedMorphPtr MorphCache::prepared(const ContourSet& start, const ContourSet& end,
                                      const MorphRequest& request) {
    MorphKey key = make_morph_key(start, end, request);

    if (auto cached = entries_.find(key)) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        KEYMORPH_DEBUG_LOG("Morph cache hit (hash=%zu)", key.hash());
        return *cached;
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    auto computed = std::make_shared<const PreparedMorph>(prepare_morph(start, end, request));
    auto [stored, inserted] = entries_.insert_or_get(key, computed);
    KEYMORPH_DEBUG_LOG("Morph cache miss (hash=%zu, %s)", key.hash(), inserted ? "stored" : "lost race");
    return stored;
}

PreparedMorphPtr MorphCache::find(const MorphKey& key) const {
    auto cached = entries_.find(key);
    return cached ? *cached : nullptr;
}

void MorphCache::clear() {
    entries_.clear();
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
}

} // namespace keymorph
