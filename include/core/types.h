#pragma once

/**
 * @file types.h
 * @brief Core type definitions shared by every pipeline component
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <optional>
#include <stdexcept>

namespace parley {

// =============================================================================
// Audio Types
// =============================================================================

/// Raw audio sample (16-bit signed PCM)
using Sample = int16_t;

/// Variable-length PCM16 buffer (mono unless stated otherwise)
using PcmBuffer = std::vector<Sample>;

/// Raw little-endian byte buffer as carried by frames
using ByteBuffer = std::vector<uint8_t>;

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;
using Seconds = std::chrono::duration<double>;

/// Get milliseconds elapsed since a time point
inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

// =============================================================================
// Audio Format Constants
// =============================================================================

namespace audio {
    constexpr int SAMPLE_RATE = 16000;           // Hz
    constexpr int FRAME_DURATION_MS = 20;        // ms per capture frame
    constexpr int BYTES_PER_SAMPLE = sizeof(Sample);

    /// Convert milliseconds to samples at a given rate
    constexpr size_t ms_to_samples(int ms, int sample_rate = SAMPLE_RATE) {
        return (static_cast<size_t>(ms) * static_cast<size_t>(sample_rate)) / 1000;
    }

    /// Convert samples to milliseconds at a given rate
    constexpr int samples_to_ms(size_t samples, int sample_rate = SAMPLE_RATE) {
        return static_cast<int>((samples * 1000) / static_cast<size_t>(sample_rate));
    }
}

// =============================================================================
// Result Types (for operations that report failures instead of throwing)
// =============================================================================

/// Generic result type for operations that can fail
template<typename T>
struct Result {
    std::optional<T> value;
    std::string error;

    bool ok() const { return value.has_value(); }
    bool failed() const { return !ok(); }

    static Result success(T val) { return {std::move(val), ""}; }
    static Result failure(std::string err) { return {std::nullopt, std::move(err)}; }

    /// Get value or throw if failed
    T& unwrap() {
        if (!ok()) throw std::runtime_error(error);
        return *value;
    }

    /// Get value or return default
    T value_or(T default_val) const {
        return ok() ? *value : default_val;
    }
};

/// Void result for operations that don't return a value
struct VoidResult {
    bool success;
    std::string error;

    bool ok() const { return success; }
    bool failed() const { return !ok(); }

    static VoidResult ok_result() { return {true, ""}; }
    static VoidResult failure(std::string err) { return {false, std::move(err)}; }
};

// =============================================================================
// Conversation Types
// =============================================================================

/// Conversation message roles
enum class MessageRole {
    System,
    User,
    Assistant,
    Tool
};

const char* role_name(MessageRole role);
std::optional<MessageRole> parse_role(const std::string& name);

} // namespace parley
