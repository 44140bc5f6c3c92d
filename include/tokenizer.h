#pragma once

#include "common.h"
#include "lexicon.h"
#include <string>

namespace interrupt_filter {

/**
 * @brief Lowercase, split on whitespace, strip edge punctuation, drop empties
 *
 * Inner punctuation survives ("uh-huh", "don't"). Stop words are kept.
 */
TokenList normalize_tokens(const std::string& text);

/**
 * @brief normalize_tokens() followed by removal of the lexicon's stop words
 */
TokenList tokenize(const std::string& transcript, const Lexicon& lexicon);

} // namespace interrupt_filter
