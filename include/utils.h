#pragma once

#include <string>
#include <cstdlib>

namespace live_scribe {

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
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
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
 * @brief Check if transcript text is blank (empty or whitespace-only)
 *
 * The literal "undefined" is also blank: some relays stringify a missing
 * field instead of omitting it.
 */
inline bool is_blank(const std::string& text) {
    if (text.find_first_not_of(" \t\n\r") == std::string::npos) return true;
    return trim_copy(text) == "undefined";
}

/**
 * @brief Shorten text for log output, appending "..." when cut
 * @param text Text to shorten
 * @param max_chars Maximum characters kept before the ellipsis
 */
inline std::string preview(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "...";
}

/// Absolute difference of two string lengths
inline size_t length_delta(const std::string& a, const std::string& b) {
    return a.size() > b.size() ? a.size() - b.size() : b.size() - a.size();
}

/// Whether an HTTP status code is in the 2xx range
inline bool is_success_status(long status) {
    return status >= 200 && status < 300;
}

} // namespace utils

} // namespace live_scribe
