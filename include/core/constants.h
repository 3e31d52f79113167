#pragma once

/**
 * @file constants.h
 * @brief System-wide constants and tuning parameters
 *
 * Defaults for every tunable live here; config.h references them so the
 * JSON loader and the component constructors agree.
 */

#include <cstddef>

namespace parley {
namespace constants {

// =============================================================================
// Pipeline Constants
// =============================================================================

namespace pipeline {
    /// Data frames buffered between two stages before the producer blocks
    constexpr size_t DEFAULT_QUEUE_CAPACITY = 64;

    /// How long a source stage waits for input before checking control frames (ms)
    constexpr int SOURCE_POLL_MS = 20;

    /// Idle timeout for plain voice sessions (s)
    constexpr int IDLE_TIMEOUT_S = 300;

    /// Idle timeout for avatar sessions; "share a link and join" flows take longer (s)
    constexpr int AVATAR_IDLE_TIMEOUT_S = 1800;
}

// =============================================================================
// Reconnect Backoff Constants
// =============================================================================

namespace backoff {
    constexpr double INITIAL_S = 0.5;
    constexpr double MIN_INITIAL_S = 0.1;
    constexpr double MAX_S = 8.0;
    constexpr int MAX_ATTEMPTS = 6;

    /// Jitter is uniform in [0, delay * JITTER_FRACTION]
    constexpr double JITTER_FRACTION = 0.5;
}

// =============================================================================
// Background Mixing Constants
// =============================================================================

namespace mixer {
    constexpr float DEFAULT_GAIN = 0.06f;

    /// Largest background track accepted from the network (bytes)
    constexpr size_t MAX_TRACK_BYTES = 5 * 1024 * 1024;

    constexpr long FETCH_TIMEOUT_MS = 15000;
}

// =============================================================================
// Text Flush Constants
// =============================================================================

namespace flush {
    /// Force a flush when no sentence boundary shows up within this many chars
    constexpr size_t MAX_CHARS = 400;
}

// =============================================================================
// Vision Constants
// =============================================================================

namespace vision {
    constexpr int DEFAULT_FPS = 3;
    constexpr double DEFAULT_MAX_AGE_S = 5.0;
    constexpr double MAX_AGE_LIMIT_S = 60.0;
    constexpr int DEFAULT_MAX_DIM = 512;
    constexpr int MAX_DIM_LIMIT = 2048;
    constexpr int DEFAULT_JPEG_QUALITY = 65;
    constexpr int MIN_JPEG_QUALITY = 30;
    constexpr int MAX_JPEG_QUALITY = 95;
}

// =============================================================================
// Conversation Memory Constants
// =============================================================================

namespace memory {
    constexpr size_t MAX_SEED_MESSAGES = 50;
    constexpr size_t MAX_SEED_CHARS = 2000;
    constexpr size_t TRANSCRIPT_MAX_CHARS = 8000;
}

// =============================================================================
// LLM Constants
// =============================================================================

namespace llm {
    constexpr int DEFAULT_TIMEOUT_MS = 30000;
    constexpr int DEFAULT_MAX_TOKENS = 512;
    constexpr float DEFAULT_TEMPERATURE = 0.7f;
    constexpr int MAX_TOOL_ROUNDS = 4;
}

// =============================================================================
// VAD Constants
// =============================================================================

namespace vad {
    /// RMS threshold for speech detection (normalized 0-1)
    constexpr float DEFAULT_THRESHOLD = 0.02f;
    constexpr int MIN_SPEECH_MS = 200;
    constexpr int END_SILENCE_MS = 500;
    constexpr int PRE_SPEECH_MS = 300;
    constexpr int MAX_SPEECH_MS = 30000;

    /// Speech ends below threshold * ratio (hysteresis)
    constexpr float HYSTERESIS_RATIO = 0.7f;

    /// Consecutive loud frames needed to declare speech
    constexpr int DEBOUNCE_FRAMES = 2;

    /// Adaptive threshold = noise floor * multiplier, clamped to [min, max]
    constexpr float ADAPTIVE_THRESHOLD_MULTIPLIER = 3.0f;
    constexpr float MIN_ADAPTIVE_THRESHOLD = 0.01f;
    constexpr float MAX_ADAPTIVE_THRESHOLD = 0.1f;
}

} // namespace constants
} // namespace parley
