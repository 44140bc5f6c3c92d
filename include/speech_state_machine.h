#pragma once

#include "common.h"
#include <memory>

namespace interrupt_filter {

/**
 * @brief Whether the agent currently holds the conversational floor
 */
enum class SpeechState {
    Silent,   ///< No agent utterance in flight
    Speaking  ///< Agent utterance in flight and interruptible
};

/**
 * @brief Tracks agent speech-output state for one conversation session
 *
 * - Silent -> Speaking (on_speech_started)
 * - Speaking -> Silent (on_speech_finished: playback complete or cancelled)
 *
 * Every transition starts a new debounce epoch; the transition methods report
 * whether the state actually changed so the owner can reset its debounce state.
 */
class SpeechStateMachine {
public:
    SpeechStateMachine();
    ~SpeechStateMachine();

    SpeechState get_state() const;

    bool is_speaking() const;

    /**
     * @brief Agent began an utterance
     * @return True if the state changed
     */
    bool on_speech_started();

    /**
     * @brief Agent utterance ended (completed or interrupted)
     * @return True if the state changed
     */
    bool on_speech_finished();

    /// Number of Silent -> Speaking transitions since construction or reset()
    int utterance_count() const;

    /**
     * @brief Reset to Silent
     */
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace interrupt_filter
