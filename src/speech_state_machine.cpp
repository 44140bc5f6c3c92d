#include "speech_state_machine.h"

namespace interrupt_filter {

class SpeechStateMachine::Impl {
public:
    Impl() : state_(SpeechState::Silent), utterance_count_(0) {}

    SpeechState get_state() const {
        return state_;
    }

    bool on_speech_started() {
        switch (state_) {
            case SpeechState::Silent:
                state_ = SpeechState::Speaking;
                utterance_count_++;
                return true;

            case SpeechState::Speaking:
                break;
        }
        return false;
    }

    bool on_speech_finished() {
        switch (state_) {
            case SpeechState::Speaking:
                state_ = SpeechState::Silent;
                return true;

            case SpeechState::Silent:
                break;
        }
        return false;
    }

    int utterance_count() const {
        return utterance_count_;
    }

    void reset() {
        state_ = SpeechState::Silent;
        utterance_count_ = 0;
    }

private:
    SpeechState state_;
    int utterance_count_;
};

SpeechStateMachine::SpeechStateMachine() : pimpl_(std::make_unique<Impl>()) {}
SpeechStateMachine::~SpeechStateMachine() = default;

SpeechState SpeechStateMachine::get_state() const {
    return pimpl_->get_state();
}

bool SpeechStateMachine::is_speaking() const {
    return pimpl_->get_state() == SpeechState::Speaking;
}

bool SpeechStateMachine::on_speech_started() {
    return pimpl_->on_speech_started();
}

bool SpeechStateMachine::on_speech_finished() {
    return pimpl_->on_speech_finished();
}

int SpeechStateMachine::utterance_count() const {
    return pimpl_->utterance_count();
}

void SpeechStateMachine::reset() {
    pimpl_->reset();
}

} // namespace interrupt_filter
