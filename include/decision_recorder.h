#pragma once

#include "common.h"
#include "errors.h"
#include "core/constants.h"
#include <string>
#include <memory>

namespace interrupt_filter {

struct DecisionEvent {
    int64_t timestamp_ms = 0;
    std::string event_type;  // "decision", "agent_speech_started", "agent_speech_finished", ...
    std::string data;        // transcript for decisions, free text otherwise
    bool agent_speaking = false;
    std::string action;      // set for decisions only
    std::string reason;
};

/**
 * @brief Writes a per-session JSON log of classification decisions
 *
 * Layout: <session_dir>/<session_id>/session_log.json. The session id is the
 * local start time (YYYYmmdd_HHMMSS), suffixed with _2, _3... when that
 * directory already exists. Events are buffered in memory and written by
 * finalize_session() (or the destructor). At most max_events are kept; once
 * full, the oldest event is dropped and counted in "dropped_events".
 */
class DecisionRecorder {
public:
    explicit DecisionRecorder(const std::string& session_dir,
                              size_t max_events = constants::recording::MAX_BUFFERED_EVENTS);
    ~DecisionRecorder();

    DecisionRecorder(const DecisionRecorder&) = delete;
    DecisionRecorder& operator=(const DecisionRecorder&) = delete;

    // Start new session (creates the session directory)
    Result<void> start_session();

    // Set session metadata (config path, lexicon sizes, ...)
    void set_session_metadata(const std::string& key, const std::string& value);

    // Record one classification
    void record_decision(const std::string& transcript, bool agent_speaking,
                         const ClassificationResult& result);

    // Record a non-decision event
    void record_event(const std::string& event_type, const std::string& data);

    // Write session_log.json and close the session
    Result<void> finalize_session();

    bool is_active() const;
    size_t event_count() const;
    size_t dropped_event_count() const;
    std::string get_session_id() const;
    std::string get_session_path() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace interrupt_filter
