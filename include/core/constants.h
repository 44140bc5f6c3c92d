#pragma once

/**
 * @file constants.h
 * @brief Tuning constants for the interruption filter
 *
 * Defaults used when the configuration file leaves a value unset.
 */

#include <cstddef>

namespace interrupt_filter {
namespace constants {

// =============================================================================
// Classifier Constants
// =============================================================================

namespace classifier {
    /// Suppress a second speaking-context decision within this window (ms)
    constexpr int MICRO_DEBOUNCE_MS = 150;

    /// Longest phrase (in tokens) matched by the sliding window
    constexpr size_t MAX_PHRASE_WORDS = 3;
}

// =============================================================================
// Tokenizer Constants
// =============================================================================

namespace tokenizer {
    /// Stripped from the leading/trailing edge of each whitespace-separated piece
    constexpr const char* EDGE_PUNCTUATION = ".,!?;:()[]\"'";

    /// Whitespace characters that separate pieces
    constexpr const char* WHITESPACE = " \t\n\r\f\v";
}

// =============================================================================
// Recording Constants
// =============================================================================

namespace recording {
    constexpr const char* DEFAULT_SESSION_LOG_DIR = "sessions";
    constexpr const char* SESSION_LOG_FILENAME = "session_log.json";

    /// Events kept in memory per session; older ones are dropped (0 = no limit)
    constexpr size_t MAX_BUFFERED_EVENTS = 10000;
}

} // namespace constants
} // namespace interrupt_filter
