#include "interruption_session.h"
#include "interruption_classifier.h"
#include "decision_recorder.h"
#include "logger.h"
#include <atomic>
#include <mutex>

namespace interrupt_filter {

namespace {

std::string next_session_id() {
    static std::atomic<int> counter{0};
    return "session-" + std::to_string(++counter);
}

} // anonymous namespace

class InterruptionSession::Impl {
public:
    Impl(const Lexicon& lexicon, DecisionRecorder* recorder, const std::string& session_id)
        : classifier_(lexicon), recorder_(recorder),
          id_(session_id.empty() ? next_session_id() : session_id) {
        LOG_SESSION(id_ + " created");
    }

    void on_agent_speech_started() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (speech_.on_speech_started()) {
            debounce_.reset();
            LOG_SESSION(id_ + " agent speaking (utterance " + std::to_string(speech_.utterance_count()) + ")");
            if (recorder_) recorder_->record_event("agent_speech_started", "");
        }
    }

    void on_agent_speech_finished() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (speech_.on_speech_finished()) {
            debounce_.reset();
            LOG_SESSION(id_ + " agent silent");
            if (recorder_) recorder_->record_event("agent_speech_finished", "");
        }
    }

    bool is_agent_speaking() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return speech_.is_speaking();
    }

    ClassificationResult on_transcript(const std::string& transcript, TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool speaking = speech_.is_speaking();
        ClassificationResult result = classifier_.classify(transcript, speaking, now, debounce_);

        switch (result.action) {
            case Action::Swallow:   stats_.swallowed++; break;
            case Action::Respond:   stats_.responded++; break;
            case Action::Interrupt: stats_.interrupted++; break;
        }

        LOG_DECISION(id_, action_to_string(result.action),
                     "speaking=" + std::string(speaking ? "true" : "false") +
                     " transcript=\"" + transcript + "\" reason=\"" + result.reason + "\"");
        if (recorder_) {
            recorder_->record_decision(transcript, speaking, result);
        }
        return result;
    }

    SessionStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    const std::string& id() const {
        return id_;
    }

private:
    mutable std::mutex mutex_;
    InterruptionClassifier classifier_;
    DebounceState debounce_;
    SpeechStateMachine speech_;
    DecisionRecorder* recorder_;
    SessionStats stats_;
    std::string id_;
};

InterruptionSession::InterruptionSession(const Lexicon& lexicon, DecisionRecorder* recorder,
                                         const std::string& session_id)
    : pimpl_(std::make_unique<Impl>(lexicon, recorder, session_id)) {}

InterruptionSession::~InterruptionSession() = default;

void InterruptionSession::on_agent_speech_started() {
    pimpl_->on_agent_speech_started();
}

void InterruptionSession::on_agent_speech_finished() {
    pimpl_->on_agent_speech_finished();
}

bool InterruptionSession::is_agent_speaking() const {
    return pimpl_->is_agent_speaking();
}

ClassificationResult InterruptionSession::on_transcript(const std::string& transcript) {
    return pimpl_->on_transcript(transcript, Clock::now());
}

ClassificationResult InterruptionSession::on_transcript(const std::string& transcript, TimePoint now) {
    return pimpl_->on_transcript(transcript, now);
}

SessionStats InterruptionSession::stats() const {
    return pimpl_->stats();
}

const std::string& InterruptionSession::id() const {
    return pimpl_->id();
}

} // namespace interrupt_filter
