#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <utility>

namespace interrupt_filter {

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = Clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

/// Normalized transcript unit (lowercase, edge punctuation stripped, non-empty)
using Token = std::string;
using TokenList = std::vector<Token>;

/**
 * @brief What the agent runtime should do with a transcript
 */
enum class Action {
    Swallow,   ///< Discard transcript, agent keeps talking
    Respond,   ///< Agent is silent; forward transcript to normal response handling
    Interrupt  ///< Cancel current agent utterance and forward transcript
};

inline const char* action_to_string(Action action) {
    switch (action) {
        case Action::Swallow:   return "SWALLOW";
        case Action::Respond:   return "RESPOND";
        case Action::Interrupt: return "INTERRUPT";
    }
    return "UNKNOWN";
}

/**
 * @brief Outcome of classifying one transcript segment
 *
 * reason is diagnostic text only; callers branch on action.
 */
struct ClassificationResult {
    Action action = Action::Swallow;
    std::string reason;

    ClassificationResult() = default;
    ClassificationResult(Action a, std::string r) : action(a), reason(std::move(r)) {}
};

} // namespace interrupt_filter
