/**
 * Deterministic tests for tokenization and the interruption decision rules.
 * Asserts:
 * - Transcripts with no content tokens are always swallowed.
 * - A silent agent always gets Respond.
 * - Interrupt phrases win over backchannel/filler; unknown words interrupt.
 * - Stop words never change a decision.
 * - Speaking-context decisions are debounced per session state.
 *
 * Run from build dir: ./test_classifier
 */

#include "common.h"
#include "interruption_classifier.h"
#include "lexicon.h"
#include "logger.h"
#include "scenarios.h"
#include "tokenizer.h"
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace interrupt_filter;
using std::chrono::milliseconds;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static ClassificationResult classify_once(const InterruptionClassifier& classifier,
                                          const std::string& transcript, bool speaking) {
    DebounceState debounce;
    return classifier.classify(transcript, speaking, Clock::now(), debounce);
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

int main() {
    Logger::initialize(LogLevel::WARN);

    const Lexicon& lexicon = Lexicon::defaults();
    InterruptionClassifier classifier(lexicon);

    // --- Tokenizer ---
    TokenList t = normalize_tokens("  Yeah... OKAY!  (uh-huh) \"don't\" ");
    ASSERT(t.size() == 4);
    if (t.size() == 4) {
        ASSERT(t[0] == "yeah");
        ASSERT(t[1] == "okay");
        ASSERT(t[2] == "uh-huh");
        ASSERT(t[3] == "don't");
    }
    ASSERT(normalize_tokens("").empty());
    ASSERT(normalize_tokens(" \t\n ").empty());
    ASSERT(normalize_tokens("... ,,, !! ()[]").empty());

    TokenList stripped = tokenize("Wait a second, the THE to", lexicon);
    ASSERT(stripped.size() == 2);
    if (stripped.size() == 2) {
        ASSERT(stripped[0] == "wait");
        ASSERT(stripped[1] == "second");
    }

    // --- Literal scenarios ---
    ASSERT(classify_once(classifier, "Yeah... okay... uh-huh", true).action == Action::Swallow);
    ASSERT(classify_once(classifier, "Yeah", false).action == Action::Respond);
    ASSERT(classify_once(classifier, "Stop", true).action == Action::Interrupt);
    ASSERT(classify_once(classifier, "Yeah but wait a second", true).action == Action::Interrupt);
    ASSERT(classify_once(classifier, "", true).action == Action::Swallow);
    ASSERT(classify_once(classifier, "... ... ...", true).action == Action::Swallow);

    std::ostringstream report;
    ASSERT(run_scenarios(classifier, builtin_scenarios(), report) == 0);

    // --- Empty rule holds whatever the agent is doing ---
    for (const char* noise : {"", "   ", "...", "the a an", "?!", "To the... at"}) {
        for (bool speaking : {true, false}) {
            ClassificationResult r = classify_once(classifier, noise, speaking);
            ASSERT(r.action == Action::Swallow);
            ASSERT(r.reason == "no tokens");
        }
    }

    // --- Silent agent: everything with content is ordinary input ---
    for (const char* text : {"stop", "yeah", "hello there", "uh-huh", "wait wait wait"}) {
        ClassificationResult r = classify_once(classifier, text, false);
        ASSERT(r.action == Action::Respond);
        ASSERT(r.reason == "agent silent, treat as normal input");
    }

    // --- Interrupt priority over backchannel and filler ---
    ClassificationResult priority = classify_once(classifier, "yeah okay stop", true);
    ASSERT(priority.action == Action::Interrupt);
    ASSERT(priority.reason == "contains interrupt words: stop");
    ASSERT(classify_once(classifier, "honestly, wait", true).action == Action::Interrupt);
    ASSERT(classify_once(classifier, "Sorry?", true).action == Action::Interrupt);

    // --- Only acceptable words ---
    ClassificationResult passive = classify_once(classifier, "Well, yeah, you know", true);
    ASSERT(passive.action == Action::Swallow);
    ASSERT(passive.reason == "only passive/filler words: well, yeah, you, know");
    ASSERT(classify_once(classifier, "I mean, sure", true).action == Action::Swallow);
    ASSERT(classify_once(classifier, "kind of", true).action == Action::Swallow);

    // --- Unrecognized content interrupts ---
    ClassificationResult mixed = classify_once(classifier, "yeah banana", true);
    ASSERT(mixed.action == Action::Interrupt);
    ASSERT(starts_with(mixed.reason, "mixed content detected: "));
    ASSERT(classify_once(classifier, "sort", true).action == Action::Interrupt);

    // --- Multi-word phrases ---
    PhraseList mind = classifier.find_interrupt_phrases(tokenize("Never mind", lexicon));
    ASSERT(mind.size() == 1 && mind[0] == "never mind");
    // "on" is a stop word, so "hold on" is stored and matched as "hold"
    PhraseList hold = classifier.find_interrupt_phrases(tokenize("Hold on", lexicon));
    ASSERT(hold.size() == 1 && hold[0] == "hold");
    PhraseList sec = classifier.find_interrupt_phrases(tokenize("just a sec", lexicon));
    ASSERT(sec.size() == 1 && sec[0] == "just sec");
    PhraseList several = classifier.find_interrupt_phrases(tokenize("No wait hold on", lexicon));
    ASSERT(several.size() == 3);
    if (several.size() == 3) {
        ASSERT(several[0] == "no");
        ASSERT(several[1] == "wait");
        ASSERT(several[2] == "hold");
    }
    ASSERT(classify_once(classifier, "One second please", true).action == Action::Interrupt);
    ASSERT(classify_once(classifier, "I get it", true).action == Action::Swallow);
    ASSERT(classify_once(classifier, "Got it, sounds good", true).action == Action::Swallow);
    // "no kidding" is backchannel, but "no" alone is a directive and wins
    ASSERT(classify_once(classifier, "No kidding", true).action == Action::Interrupt);

    // Cover check is not greedy: "x y z" splits as "x" + "y z"
    Lexicon cover_lexicon({"x y", "x", "y z"}, {"halt"}, {}, {});
    InterruptionClassifier cover_classifier(cover_lexicon);
    ASSERT(cover_classifier.is_fully_acceptable(tokenize("x y z", cover_lexicon)));
    ASSERT(!cover_classifier.is_fully_acceptable(tokenize("x z", cover_lexicon)));
    ASSERT(classify_once(cover_classifier, "x y z", true).action == Action::Swallow);

    // --- Stop words never change the action ---
    const std::vector<std::pair<std::string, std::string>> stop_word_variants = {
        {"yeah okay", "the yeah to okay at"},
        {"stop", "to stop"},
        {"tell me weather", "tell me the weather"},
        {"hang on", "hang on the"},
        {"hang on", "hang the on"},
        {"got it", "got it in a"},
    };
    for (const auto& [plain, padded] : stop_word_variants) {
        for (bool speaking : {true, false}) {
            ASSERT(classify_once(classifier, plain, speaking).action ==
                   classify_once(classifier, padded, speaking).action);
        }
    }

    // --- Debounce ---
    const TimePoint t0 = Clock::now();
    {
        DebounceState debounce;
        ASSERT(debounce.is_idle());
        ClassificationResult first = classifier.classify("Stop", true, t0, debounce);
        ASSERT(first.action == Action::Interrupt);
        ASSERT(!debounce.is_idle());

        ClassificationResult second = classifier.classify("Stop", true, t0 + milliseconds(100), debounce);
        ASSERT(second.action == Action::Swallow);
        ASSERT(second.reason == "debounced: duplicate within 150ms of prior decision");

        // Still cooling from t0: suppressed calls do not extend the window
        ASSERT(classifier.classify("banana", true, t0 + milliseconds(149), debounce).action == Action::Swallow);
        ASSERT(classifier.classify("stop", true, t0 + milliseconds(150), debounce).action == Action::Interrupt);
        ASSERT(debounce.last_decision() == t0 + milliseconds(150));
    }
    {
        // Swallow decisions start the window too
        DebounceState debounce;
        ASSERT(classifier.classify("yeah", true, t0, debounce).action == Action::Swallow);
        ClassificationResult r = classifier.classify("stop", true, t0 + milliseconds(50), debounce);
        ASSERT(r.action == Action::Swallow);
        ASSERT(starts_with(r.reason, "debounced"));
    }
    {
        // Empty transcripts neither trigger nor consume the window
        DebounceState debounce;
        ASSERT(classifier.classify("...", true, t0, debounce).action == Action::Swallow);
        ASSERT(debounce.is_idle());
        ASSERT(classifier.classify("stop", true, t0 + milliseconds(10), debounce).action == Action::Interrupt);
        ClassificationResult noise = classifier.classify("...", true, t0 + milliseconds(20), debounce);
        ASSERT(noise.reason == "no tokens");
        ASSERT(debounce.last_decision() == t0 + milliseconds(10));
    }
    {
        // A silent-agent transcript ends the speaking epoch
        DebounceState debounce;
        ASSERT(classifier.classify("stop", true, t0, debounce).action == Action::Interrupt);
        ASSERT(classifier.classify("hello", false, t0 + milliseconds(10), debounce).action == Action::Respond);
        ASSERT(debounce.is_idle());
        ASSERT(classifier.classify("stop", true, t0 + milliseconds(20), debounce).action == Action::Interrupt);
    }
    {
        // Silence ends the epoch even when the transcript has no tokens
        DebounceState debounce;
        ASSERT(classifier.classify("stop", true, t0, debounce).action == Action::Interrupt);
        ClassificationResult noise = classifier.classify("...", false, t0 + milliseconds(10), debounce);
        ASSERT(noise.action == Action::Swallow);
        ASSERT(noise.reason == "no tokens");
        ASSERT(debounce.is_idle());
        ASSERT(classifier.classify("stop", true, t0 + milliseconds(20), debounce).action == Action::Interrupt);
    }
    {
        // Zero window disables debouncing
        Lexicon no_debounce({"yeah"}, {"stop"}, {}, {}, Duration(0));
        InterruptionClassifier eager(no_debounce);
        DebounceState debounce;
        ASSERT(eager.classify("stop", true, t0, debounce).action == Action::Interrupt);
        ASSERT(eager.classify("stop", true, t0, debounce).action == Action::Interrupt);
    }

    // --- Injected lexicon replaces the defaults entirely ---
    Lexicon radio({"roger"}, {"break"}, {"uh"}, {"the"});
    InterruptionClassifier radio_classifier(radio);
    ASSERT(classify_once(radio_classifier, "Roger, uh", true).action == Action::Swallow);
    ASSERT(classify_once(radio_classifier, "yeah", true).action == Action::Interrupt);
    ClassificationResult brk = classify_once(radio_classifier, "Break break", true);
    ASSERT(brk.action == Action::Interrupt);
    ASSERT(brk.reason == "contains interrupt words: break, break");

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All classifier tests passed.\n";
    return 0;
}
