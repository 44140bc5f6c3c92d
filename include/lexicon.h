#pragma once

#include "common.h"
#include "errors.h"
#include "core/constants.h"
#include <string>
#include <vector>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace interrupt_filter {

using PhraseSet = std::unordered_set<std::string>;
using PhraseList = std::vector<std::string>;

/**
 * @brief Immutable word lists driving the interruption filter
 *
 * Holds the ignore (backchannel), interrupt (directive) and filler phrase
 * sets, the stop-word set and the debounce window. Phrases are stored in the
 * same canonical form the tokenizer produces for transcripts: lowercase,
 * edge punctuation stripped, stop words removed, words joined by one space.
 * "Just a sec" is therefore stored (and matched) as "just sec".
 *
 * There is no mutation API; build a new Lexicon to change the lists.
 */
class Lexicon {
public:
    /**
     * @brief Build a lexicon from raw phrase lists
     * @param ignore_phrases Passive acknowledgements swallowed while the agent speaks
     * @param interrupt_phrases Directives that always interrupt the agent
     * @param filler_phrases Connectives tolerated alongside ignore phrases
     * @param stop_words Function words dropped before classification
     * @param debounce_window Minimum spacing between speaking-context decisions
     *
     * Phrases that canonicalize to nothing, or to more than
     * constants::classifier::MAX_PHRASE_WORDS words, are dropped with a warning.
     */
    Lexicon(const PhraseList& ignore_phrases,
            const PhraseList& interrupt_phrases,
            const PhraseList& filler_phrases,
            const PhraseList& stop_words,
            Duration debounce_window = Duration(constants::classifier::MICRO_DEBOUNCE_MS));

    /**
     * @brief Built-in English lists, constructed once
     */
    static const Lexicon& defaults();

    /**
     * @brief Build a lexicon from a JSON object
     *
     * Recognized keys: ignore_phrases, interrupt_phrases, filler_phrases,
     * stop_words (arrays of strings) and debounce_ms (non-negative integer).
     * Absent keys keep the corresponding list from base.
     *
     * @return The lexicon, or a ParseError / InvalidConfig error
     */
    static Result<Lexicon> from_json(const nlohmann::json& j, const Lexicon& base = defaults());

    /**
     * Phrase lookups. The argument is canonicalized first, so raw text works:
     * is_interrupt_phrase("Hold on!") matches the stored "hold". A phrase made
     * only of stop words canonicalizes to "" and never matches.
     */
    bool is_ignore_phrase(const std::string& phrase) const;
    bool is_interrupt_phrase(const std::string& phrase) const;
    bool is_filler_phrase(const std::string& phrase) const;

    /// is_ignore_phrase || is_filler_phrase, canonicalizing once
    bool is_acceptable(const std::string& phrase) const;

    /// Single-word lookup; case-insensitive
    bool is_stop_word(const std::string& token) const;

    Duration debounce_window() const { return debounce_window_; }

    /// Word count of the longest stored phrase (1 when all lists are empty)
    size_t max_phrase_words() const { return max_phrase_words_; }

    /**
     * @brief Canonical form of a phrase under this lexicon's stop words
     */
    std::string canonicalize(const std::string& phrase) const;

    // Sorted canonical listings (for display and diagnostics)
    PhraseList ignore_phrases() const;
    PhraseList interrupt_phrases() const;
    PhraseList filler_phrases() const;
    PhraseList stop_words() const;

    /// Phrases present in both the ignore and interrupt sets (interrupt wins)
    PhraseList overlapping_phrases() const;

private:
    void add_phrases(const PhraseList& source, PhraseSet& target, const char* set_name);

    // Raw lists as supplied; from_json rebuilds from these when only stop words change
    PhraseList source_ignore_;
    PhraseList source_interrupt_;
    PhraseList source_filler_;

    PhraseSet stop_words_;
    PhraseSet ignore_;
    PhraseSet interrupt_;
    PhraseSet filler_;
    Duration debounce_window_;
    size_t max_phrase_words_ = 1;
};

} // namespace interrupt_filter
