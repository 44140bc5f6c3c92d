#pragma once

#include "common.h"
#include "lexicon.h"
#include "speech_state_machine.h"
#include <memory>
#include <string>

namespace interrupt_filter {

class DecisionRecorder; // Forward declaration

/**
 * @brief Decision counters for one session
 */
struct SessionStats {
    size_t swallowed = 0;
    size_t responded = 0;
    size_t interrupted = 0;

    size_t total() const { return swallowed + responded + interrupted; }
};

/**
 * @brief One conversation's interruption filter
 *
 * Owns the session's DebounceState and agent speech state. The agent runtime
 * reports speech start/finish and hands over each finalized transcript;
 * calls are serialized internally, so transcript callbacks may arrive on
 * any thread. Sessions share nothing but the (immutable) lexicon.
 */
class InterruptionSession {
public:
    /**
     * @param lexicon Word lists; must outlive the session
     * @param recorder Optional decision log; must outlive the session when set
     * @param session_id Label used in log lines (generated when empty)
     */
    explicit InterruptionSession(const Lexicon& lexicon,
                                 DecisionRecorder* recorder = nullptr,
                                 const std::string& session_id = "");
    ~InterruptionSession();

    // Non-copyable
    InterruptionSession(const InterruptionSession&) = delete;
    InterruptionSession& operator=(const InterruptionSession&) = delete;

    /**
     * @brief Agent began speaking; starts a new debounce epoch
     */
    void on_agent_speech_started();

    /**
     * @brief Agent stopped speaking (completed or cancelled); ends the epoch
     */
    void on_agent_speech_finished();

    bool is_agent_speaking() const;

    /**
     * @brief Classify a finalized transcript against the current agent state
     * @param transcript Raw STT text
     * @return Decision; the caller suppresses, interrupts or forwards accordingly
     */
    ClassificationResult on_transcript(const std::string& transcript);

    /**
     * @brief Same as on_transcript(transcript) with an explicit event time
     */
    ClassificationResult on_transcript(const std::string& transcript, TimePoint now);

    SessionStats stats() const;

    const std::string& id() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace interrupt_filter
