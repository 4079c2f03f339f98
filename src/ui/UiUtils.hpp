#pragma once

#include "imgui.h"
#include <string>

namespace todopad::ui {

/**
 * @brief Helper for InputTextWithHint with std::string and auto-resize.
 */
bool InputTextString(const char* label, const char* hint, std::string* str, ImGuiInputTextFlags flags = 0);

/**
 * @brief Helper for InputTextMultiline with std::string and auto-resize.
 */
bool InputTextMultilineString(const char* label, std::string* str, const ImVec2& size, ImGuiInputTextFlags flags = 0);

/**
 * @brief Width of a button with the given caption, including frame padding.
 */
float ButtonWidth(const char* caption);

} // namespace todopad::ui
