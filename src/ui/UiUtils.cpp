#include "ui/UiUtils.hpp"

namespace todopad::ui {

static int TextEditCallback(ImGuiInputTextCallbackData* data) {
    if (data->EventFlag == ImGuiInputTextFlags_CallbackResize) {
        auto* str = static_cast<std::string*>(data->UserData);
        str->resize(data->BufTextLen);
        data->Buf = str->data();
    }
    return 0;
}

bool InputTextString(const char* label, const char* hint, std::string* str, ImGuiInputTextFlags flags) {
    flags |= ImGuiInputTextFlags_CallbackResize;
    if (str->capacity() == 0) {
        str->reserve(128);
    }
    return ImGui::InputTextWithHint(label, hint, str->data(), str->capacity() + 1, flags, TextEditCallback, str);
}

bool InputTextMultilineString(const char* label, std::string* str, const ImVec2& size, ImGuiInputTextFlags flags) {
    flags |= ImGuiInputTextFlags_CallbackResize;
    flags |= ImGuiInputTextFlags_NoHorizontalScroll; // Word wrap
    if (str->capacity() == 0) {
        str->reserve(256);
    }
    return ImGui::InputTextMultiline(label, str->data(), str->capacity() + 1, size, flags, TextEditCallback, str);
}

float ButtonWidth(const char* caption) {
    return ImGui::CalcTextSize(caption, nullptr, true).x + ImGui::GetStyle().FramePadding.x * 2.0f;
}

} // namespace todopad::ui
