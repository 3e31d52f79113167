#pragma once

/**
 * @file track_loader.h
 * @brief Fetch, decode and cache background tracks process-wide
 */

#include "audio/background_mixer.h"
#include "core/process_cache.h"
#include <functional>
#include <string>
#include <utility>

namespace parley {

/**
 * @brief Loads background tracks once per (source, sample rate)
 *
 * Sources are https URLs (capped at max_bytes) or local file paths.
 * Plain http is refused.
 */
class BackgroundTrackLoader {
public:
    /// Returns the raw container bytes for a source
    using Fetcher = std::function<ByteBuffer(const std::string& source)>;

    explicit BackgroundTrackLoader(size_t max_bytes);

    /// Replace the network/file fetcher (tests)
    BackgroundTrackLoader(size_t max_bytes, Fetcher fetcher);

    /**
     * @brief Decoded track for source at sample_rate, loading on first use
     * @throws MediaFormatError if the source cannot be fetched or decoded
     */
    BackgroundTrack load(const std::string& source, int sample_rate);

    /// Cache shared by every loader in the process
    static ProcessCache<std::pair<std::string, int>, BackgroundTrack>& cache();

private:
    ByteBuffer fetch(const std::string& source) const;

    size_t max_bytes_;
    Fetcher fetcher_;
};

} // namespace parley
