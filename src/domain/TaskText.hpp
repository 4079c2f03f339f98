/**
 * @file TaskText.hpp
 * @brief Text normalization rules applied to task content.
 */

#pragma once
#include <string>

namespace todopad::domain {

/**
 * @brief Returns the text without leading and trailing whitespace.
 */
std::string TrimTaskText(const std::string& text);

/**
 * @brief True if the text is empty or consists only of whitespace.
 */
bool IsBlankTaskText(const std::string& text);

} // namespace todopad::domain
