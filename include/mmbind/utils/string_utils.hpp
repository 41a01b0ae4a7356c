/**
 * @file string_utils.hpp
 * @brief String helpers shared by the grammar compiler and the client.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace mmbind {
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 */
inline std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

/**
 * @brief Split on runs of whitespace, dropping empty tokens
 */
inline std::vector<std::string> split_words(const std::string& str) {
    std::vector<std::string> words;
    std::istringstream stream(str);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

/**
 * @brief Keep only the alphabetic characters of a word
 *
 * "vm-info" -> "vminfo", "cc" -> "cc", "1" -> "".
 */
inline std::string keep_alpha(const std::string& word) {
    std::string result;
    result.reserve(word.size());
    std::copy_if(word.begin(), word.end(), std::back_inserter(result),
                 [](unsigned char c) { return std::isalpha(c) != 0; });
    return result;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Join strings with delimiter
 */
inline std::string join(const std::vector<std::string>& parts, const std::string& delimiter = " ") {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result += delimiter + parts[i];
    }
    return result;
}

/**
 * @brief Join two slash-separated path components
 *
 * Mirrors POSIX path joining: an absolute @p name replaces @p base.
 */
inline std::string join_path(const std::string& base, const std::string& name) {
    if (name.empty()) return base;
    if (name.front() == '/' || base.empty()) return name;
    if (base.back() == '/') return base + name;
    return base + "/" + name;
}

} // namespace utils
} // namespace mmbind
