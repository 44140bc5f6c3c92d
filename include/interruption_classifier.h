#pragma once

#include "common.h"
#include "lexicon.h"
#include <optional>
#include <string>

namespace interrupt_filter {

/**
 * @brief Per-session memory of the last speaking-context decision
 *
 * Two states: idle (no decision in the current speaking epoch) and cooling
 * (a decision was recorded at last_decision()). Owned by one conversation
 * session; never shared between sessions.
 */
class DebounceState {
public:
    /**
     * @brief Whether now falls inside window of the last recorded decision
     */
    bool is_cooling(TimePoint now, Duration window) const {
        if (!last_decision_) return false;
        return now - *last_decision_ < window;
    }

    void record(TimePoint now) { last_decision_ = now; }

    /// Start a new speaking epoch
    void reset() { last_decision_.reset(); }

    bool is_idle() const { return !last_decision_.has_value(); }
    std::optional<TimePoint> last_decision() const { return last_decision_; }

private:
    std::optional<TimePoint> last_decision_;
};

/**
 * @brief Decides whether a transcript heard during agent speech is
 * backchannel (swallow), an interruption, or ordinary input
 *
 * Any call with the agent silent ends the debounce epoch, tokens or not.
 *
 * Rules, in order:
 * - no tokens after stop-word removal: Swallow (agent state irrelevant)
 * - agent silent: Respond
 * - any interrupt phrase: Interrupt
 * - every token covered by ignore/filler phrases: Swallow
 * - otherwise: Interrupt
 * Speaking-context outcomes are then debounced: a second decision within the
 * lexicon's debounce window becomes Swallow.
 *
 * Multi-word phrases are matched on windows of 1..max_phrase_words adjacent
 * tokens. Holds the lexicon by reference; the lexicon must outlive it.
 */
class InterruptionClassifier {
public:
    explicit InterruptionClassifier(const Lexicon& lexicon);

    /**
     * @brief Classify one finalized transcript segment
     * @param transcript Raw STT text (any casing/punctuation, may be empty)
     * @param agent_speaking True while the agent has an interruptible utterance in flight
     * @param now Time of the transcript event
     * @param debounce Session debounce state; updated in place
     * @return Action plus a diagnostic reason
     */
    ClassificationResult classify(const std::string& transcript, bool agent_speaking,
                                  TimePoint now, DebounceState& debounce) const;

    /**
     * @brief Content rules only, without debounce
     * @param tokens Output of tokenize()
     */
    ClassificationResult evaluate(const TokenList& tokens, bool agent_speaking) const;

    /// Interrupt phrases in tokens, scanning left to right, longest window first
    PhraseList find_interrupt_phrases(const TokenList& tokens) const;

    /// True when the tokens can be split entirely into ignore/filler phrases
    bool is_fully_acceptable(const TokenList& tokens) const;

    const Lexicon& lexicon() const { return lexicon_; }

private:
    const Lexicon& lexicon_;
};

} // namespace interrupt_filter
