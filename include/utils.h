#pragma once

#include "core/constants.h"
#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace interrupt_filter {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(constants::tokenizer::WHITESPACE));
    str.erase(str.find_last_not_of(constants::tokenizer::WHITESPACE) + 1);
    return str;
}

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase
 * @param str String to normalize (modified in place)
 * @return Reference to the normalized string
 *
 * ASCII only; bytes of multi-byte UTF-8 sequences pass through unchanged.
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return str;
}

/**
 * @brief Normalize string to lowercase (returns copy)
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

/**
 * @brief Strip a character set from both edges of a string (returns copy)
 * @param str Input piece
 * @param chars Characters to strip
 */
inline std::string strip_edges(const std::string& str, const char* chars) {
    size_t begin = str.find_first_not_of(chars);
    if (begin == std::string::npos) return "";
    size_t end = str.find_last_not_of(chars);
    return str.substr(begin, end - begin + 1);
}

/**
 * @brief Split on runs of whitespace; never yields empty pieces
 */
inline std::vector<std::string> split_whitespace(const std::string& str) {
    std::vector<std::string> pieces;
    size_t pos = str.find_first_not_of(constants::tokenizer::WHITESPACE);
    while (pos != std::string::npos) {
        size_t end = str.find_first_of(constants::tokenizer::WHITESPACE, pos);
        pieces.push_back(str.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
        if (end == std::string::npos) break;
        pos = str.find_first_not_of(constants::tokenizer::WHITESPACE, end);
    }
    return pieces;
}

/**
 * @brief Join [begin, end) of a list with a separator
 */
inline std::string join(const std::vector<std::string>& parts, size_t begin, size_t end,
                        const std::string& sep = " ") {
    std::string out;
    for (size_t i = begin; i < end && i < parts.size(); ++i) {
        if (i > begin) out += sep;
        out += parts[i];
    }
    return out;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep = " ") {
    return join(parts, 0, parts.size(), sep);
}

} // namespace utils

} // namespace interrupt_filter
