#include "interruption_classifier.h"
#include "tokenizer.h"
#include "utils.h"
#include <algorithm>
#include <vector>

namespace interrupt_filter {

InterruptionClassifier::InterruptionClassifier(const Lexicon& lexicon)
    : lexicon_(lexicon) {}

ClassificationResult InterruptionClassifier::classify(const std::string& transcript, bool agent_speaking,
                                                      TimePoint now, DebounceState& debounce) const {
    if (!agent_speaking) {
        // Agent has yielded the floor; the next utterance starts a fresh epoch
        debounce.reset();
    }

    TokenList tokens = tokenize(transcript, lexicon_);

    ClassificationResult result = evaluate(tokens, agent_speaking);
    if (tokens.empty() || !agent_speaking) {
        return result;
    }

    const Duration window = lexicon_.debounce_window();
    if (debounce.is_cooling(now, window)) {
        return ClassificationResult(Action::Swallow,
            "debounced: duplicate within " + std::to_string(window.count()) + "ms of prior decision");
    }
    debounce.record(now);
    return result;
}

ClassificationResult InterruptionClassifier::evaluate(const TokenList& tokens, bool agent_speaking) const {
    if (tokens.empty()) {
        return ClassificationResult(Action::Swallow, "no tokens");
    }

    if (!agent_speaking) {
        return ClassificationResult(Action::Respond, "agent silent, treat as normal input");
    }

    PhraseList interrupts = find_interrupt_phrases(tokens);
    if (!interrupts.empty()) {
        return ClassificationResult(Action::Interrupt,
            "contains interrupt words: " + utils::join(interrupts, ", "));
    }

    if (is_fully_acceptable(tokens)) {
        return ClassificationResult(Action::Swallow,
            "only passive/filler words: " + utils::join(tokens, ", "));
    }

    return ClassificationResult(Action::Interrupt,
        "mixed content detected: " + utils::join(tokens, ", "));
}

PhraseList InterruptionClassifier::find_interrupt_phrases(const TokenList& tokens) const {
    PhraseList matches;
    const size_t max_words = lexicon_.max_phrase_words();
    size_t i = 0;
    while (i < tokens.size()) {
        size_t matched_len = 0;
        for (size_t n = std::min(max_words, tokens.size() - i); n >= 1; --n) {
            std::string phrase = utils::join(tokens, i, i + n);
            if (lexicon_.is_interrupt_phrase(phrase)) {
                matches.push_back(std::move(phrase));
                matched_len = n;
                break;
            }
        }
        i += matched_len > 0 ? matched_len : 1;
    }
    return matches;
}

bool InterruptionClassifier::is_fully_acceptable(const TokenList& tokens) const {
    // covered[i]: tokens[0, i) split into acceptable phrases
    const size_t max_words = lexicon_.max_phrase_words();
    std::vector<bool> covered(tokens.size() + 1, false);
    covered[0] = true;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!covered[i]) continue;
        for (size_t n = 1; n <= max_words && i + n <= tokens.size(); ++n) {
            if (!covered[i + n] && lexicon_.is_acceptable(utils::join(tokens, i, i + n))) {
                covered[i + n] = true;
            }
        }
    }
    return covered[tokens.size()];
}

} // namespace interrupt_filter
