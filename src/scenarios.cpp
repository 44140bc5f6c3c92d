#include "scenarios.h"
#include "logger.h"

namespace interrupt_filter {

namespace {

void print_separator(std::ostream& out) {
    out << std::string(70, '=') << "\n";
}

} // anonymous namespace

const std::vector<Scenario>& builtin_scenarios() {
    static const std::vector<Scenario> scenarios = {
        {"Long explanation", "Yeah... okay... uh-huh", true, Action::Swallow,
         "Agent explaining, user gives backchannel feedback"},
        {"Passive affirmation", "Yeah", false, Action::Respond,
         "Agent asked a question and waits; user answers"},
        {"Direct command", "Stop", true, Action::Interrupt,
         "Agent counting, user says stop"},
        {"Mixed input", "Yeah but wait a second", true, Action::Interrupt,
         "Filler plus command words"},
        {"Multiple commands", "No wait hold on", true, Action::Interrupt,
         "Several interrupt words"},
        {"Repeated acknowledgement", "Right right, okay", true, Action::Swallow,
         "Repetitive backchannel"},
        {"Command while silent", "Cancel that", false, Action::Respond,
         "Agent silent, so commands are ordinary input"},
        {"Empty input", "", true, Action::Swallow,
         "VAD false positive"},
        {"Punctuation only", "... ... ...", true, Action::Swallow,
         "Transcription noise"},
        {"Complex mixed sentence", "Yeah I see, hmm, but wait what about that", true, Action::Interrupt,
         "Acknowledgement followed by a question"},
        {"Multi-word acknowledgement", "Got it, sounds good", true, Action::Swallow,
         "Two-word ignore phrases"},
        {"Unrecognized content", "Tell me about the weather", true, Action::Interrupt,
         "Content outside every list interrupts"},
    };
    return scenarios;
}

int run_scenarios(const InterruptionClassifier& classifier,
                  const std::vector<Scenario>& scenarios,
                  std::ostream& out) {
    int failed = 0;
    const TimePoint now = Clock::now();

    for (size_t i = 0; i < scenarios.size(); ++i) {
        const Scenario& s = scenarios[i];
        DebounceState debounce;
        ClassificationResult result = classifier.classify(s.transcript, s.agent_speaking, now, debounce);
        bool passed = result.action == s.expected;
        if (!passed) failed++;

        out << "Scenario " << (i + 1) << ": " << s.name << "\n";
        out << "  " << s.description << "\n";
        out << "  Transcript: \"" << s.transcript << "\"  (agent " << (s.agent_speaking ? "speaking" : "silent") << ")\n";
        out << "  Expected: " << action_to_string(s.expected) << "  Got: " << action_to_string(result.action) << "\n";
        out << "  Reason: " << result.reason << "\n";
        out << "  Result: " << (passed ? "PASS" : "FAIL") << "\n\n";

        if (!passed) {
            Logger::warn("Scenario failed: " + s.name);
        }
    }

    print_separator(out);
    out << "RESULTS: " << (scenarios.size() - failed) << "/" << scenarios.size() << " passed\n";
    print_separator(out);
    return failed;
}

} // namespace interrupt_filter
