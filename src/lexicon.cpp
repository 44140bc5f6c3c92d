#include "lexicon.h"
#include "tokenizer.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>

using json = nlohmann::json;

namespace interrupt_filter {

namespace {

PhraseList sorted(const PhraseSet& set) {
    PhraseList out(set.begin(), set.end());
    std::sort(out.begin(), out.end());
    return out;
}

/// Read an array-of-strings key. Absent key leaves out untouched.
Result<void> read_phrase_list(const json& j, const char* key, PhraseList& out) {
    if (!j.contains(key)) return {};
    const auto& arr = j[key];
    if (!arr.is_array()) {
        return make_parse_error(std::string("lexicon.") + key + " must be an array of strings");
    }
    PhraseList phrases;
    for (const auto& item : arr) {
        if (!item.is_string()) {
            return make_parse_error(std::string("lexicon.") + key + " contains a non-string entry: " + item.dump());
        }
        phrases.push_back(item.get<std::string>());
    }
    out = std::move(phrases);
    return {};
}

} // anonymous namespace

Lexicon::Lexicon(const PhraseList& ignore_phrases,
                 const PhraseList& interrupt_phrases,
                 const PhraseList& filler_phrases,
                 const PhraseList& stop_words,
                 Duration debounce_window)
    : source_ignore_(ignore_phrases),
      source_interrupt_(interrupt_phrases),
      source_filler_(filler_phrases),
      debounce_window_(debounce_window) {
    // Stop words first: phrase canonicalization depends on them
    for (const auto& word : stop_words) {
        for (auto& token : normalize_tokens(word)) {
            stop_words_.insert(std::move(token));
        }
    }

    add_phrases(source_ignore_, ignore_, "ignore");
    add_phrases(source_interrupt_, interrupt_, "interrupt");
    add_phrases(source_filler_, filler_, "filler");

    for (const auto& phrase : overlapping_phrases()) {
        Logger::warn("[Lexicon] \"" + phrase + "\" is both an ignore and an interrupt phrase; interrupt takes priority");
    }
}

void Lexicon::add_phrases(const PhraseList& source, PhraseSet& target, const char* set_name) {
    for (const auto& raw : source) {
        TokenList words = normalize_tokens(raw);
        words.erase(std::remove_if(words.begin(), words.end(),
                                   [this](const Token& t) { return is_stop_word(t); }),
                    words.end());
        if (words.empty()) {
            Logger::warn(std::string("[Lexicon] Dropping empty ") + set_name + " phrase \"" + raw + "\"");
            continue;
        }
        if (words.size() > constants::classifier::MAX_PHRASE_WORDS) {
            Logger::warn(std::string("[Lexicon] Dropping ") + set_name + " phrase \"" + raw + "\": longer than " +
                         std::to_string(constants::classifier::MAX_PHRASE_WORDS) + " words");
            continue;
        }
        max_phrase_words_ = std::max(max_phrase_words_, words.size());
        target.insert(utils::join(words));
    }
}

const Lexicon& Lexicon::defaults() {
    static const Lexicon lexicon(
        // Ignore: passive acknowledgements
        {"yeah", "ok", "okay", "hmm", "uh-huh", "right", "yep", "mmhmm",
         "sure", "understood", "got it", "uh", "um", "ah", "yeah yeah",
         "absolutely", "definitely", "certainly", "sounds good", "i see",
         "i know", "i get it", "makes sense", "got ya", "no kidding",
         "you bet", "for sure", "all right", "alright"},
        // Interrupt: directives
        {"stop", "wait", "no", "hold", "cancel", "pause",
         "hold on", "wait wait", "one second", "one sec", "just a sec",
         "hang on", "slow down", "repeat that", "what", "sorry", "excuse me",
         "never mind", "never", "don't", "don't say that"},
        // Filler: connectives
        {"but", "and", "or", "like", "you know", "i mean", "actually",
         "well", "so", "anyway", "basically", "essentially", "practically",
         "kind of", "sort of", "somehow", "somewhat", "quite", "really",
         "very", "pretty", "honestly", "seriously", "literally"},
        // Stop words: articles and short prepositions
        {"a", "an", "the", "to", "in", "on", "at"});
    return lexicon;
}

Result<Lexicon> Lexicon::from_json(const json& j, const Lexicon& base) {
    if (!j.is_object()) {
        return make_parse_error("lexicon must be a JSON object");
    }

    PhraseList ignore = base.source_ignore_;
    PhraseList interrupt = base.source_interrupt_;
    PhraseList filler = base.source_filler_;
    PhraseList stop = base.stop_words();
    Duration debounce = base.debounce_window_;

    for (auto [key, target] : {std::make_pair("ignore_phrases", &ignore),
                               std::make_pair("interrupt_phrases", &interrupt),
                               std::make_pair("filler_phrases", &filler),
                               std::make_pair("stop_words", &stop)}) {
        auto r = read_phrase_list(j, key, *target);
        if (!r) return r.error();
    }

    if (j.contains("debounce_ms")) {
        const auto& d = j["debounce_ms"];
        if (!d.is_number_integer()) {
            return make_parse_error("lexicon.debounce_ms must be an integer");
        }
        int64_t ms = d.get<int64_t>();
        if (ms < 0) {
            return make_config_error("lexicon.debounce_ms must not be negative (got " + std::to_string(ms) + ")");
        }
        debounce = Duration(ms);
    }

    return Lexicon(ignore, interrupt, filler, stop, debounce);
}

bool Lexicon::is_ignore_phrase(const std::string& phrase) const {
    return ignore_.count(canonicalize(phrase)) > 0;
}

bool Lexicon::is_interrupt_phrase(const std::string& phrase) const {
    return interrupt_.count(canonicalize(phrase)) > 0;
}

bool Lexicon::is_filler_phrase(const std::string& phrase) const {
    return filler_.count(canonicalize(phrase)) > 0;
}

bool Lexicon::is_stop_word(const std::string& token) const {
    return stop_words_.count(utils::normalize_copy(token)) > 0;
}

bool Lexicon::is_acceptable(const std::string& phrase) const {
    std::string canonical = canonicalize(phrase);
    return ignore_.count(canonical) > 0 || filler_.count(canonical) > 0;
}

std::string Lexicon::canonicalize(const std::string& phrase) const {
    return utils::join(tokenize(phrase, *this));
}

PhraseList Lexicon::ignore_phrases() const { return sorted(ignore_); }
PhraseList Lexicon::interrupt_phrases() const { return sorted(interrupt_); }
PhraseList Lexicon::filler_phrases() const { return sorted(filler_); }
PhraseList Lexicon::stop_words() const { return sorted(stop_words_); }

PhraseList Lexicon::overlapping_phrases() const {
    PhraseList out;
    for (const auto& phrase : ignore_) {
        if (interrupt_.count(phrase)) out.push_back(phrase);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace interrupt_filter
