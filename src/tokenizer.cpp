#include "tokenizer.h"
#include "utils.h"

namespace interrupt_filter {

TokenList normalize_tokens(const std::string& text) {
    TokenList tokens;
    std::string lower = utils::normalize_copy(text);
    for (const auto& piece : utils::split_whitespace(lower)) {
        std::string token = utils::strip_edges(piece, constants::tokenizer::EDGE_PUNCTUATION);
        if (!token.empty()) {
            tokens.push_back(std::move(token));
        }
    }
    return tokens;
}

TokenList tokenize(const std::string& transcript, const Lexicon& lexicon) {
    TokenList tokens = normalize_tokens(transcript);
    tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                [&lexicon](const Token& t) { return lexicon.is_stop_word(t); }),
                 tokens.end());
    return tokens;
}

} // namespace interrupt_filter
