#ifndef KEYMORPH_ERRORS_HPP
#define KEYMORPH_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

namespace keymorph {

// Base class for all library errors
class KeymorphError : public std::runtime_error {
public:
    explicit KeymorphError(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed keystate input: non-monotonic times, fewer than two entries,
// ambiguous (time, number) tuples, times outside [0, 1].
class InvalidTimelineError : public KeymorphError {
public:
    explicit InvalidTimelineError(const std::string& message, std::size_t entry_index = NO_INDEX)
        : KeymorphError("Invalid timeline: " + message), entry_index_(entry_index) {}

    // Index of the offending raw entry, or NO_INDEX when the failure is global
    std::size_t entry_index() const noexcept { return entry_index_; }

    static constexpr std::size_t NO_INDEX = static_cast<std::size_t>(-1);

private:
    std::size_t entry_index_;
};

// Reserved for a strict attribute-compatibility mode. Mismatched attributes
// are skipped silently today.
class IncompatibleAttributeError : public KeymorphError {
public:
    explicit IncompatibleAttributeError(const std::string& message)
        : KeymorphError("Incompatible attribute: " + message) {}
};

// Never raised: degenerate shapes fall back to zero offsets and zero-size loops.
class DegenerateGeometryError : public KeymorphError {
public:
    explicit DegenerateGeometryError(const std::string& message)
        : KeymorphError("Degenerate geometry: " + message) {}
};

// Unknown strategy name or malformed setting handed to MorphingConfig
class ConfigError : public KeymorphError {
public:
    ConfigError(const std::string& key, const std::string& message)
        : KeymorphError("Config error [" + key + "]: " + message), key_(key) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

} // namespace keymorph

#endif // KEYMORPH_ERRORS_HPP
