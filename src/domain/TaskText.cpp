#include "domain/TaskText.hpp"

namespace todopad::domain {

namespace {
constexpr const char* kWhitespace = " \t\r\n\v\f";
}

std::string TrimTaskText(const std::string& text) {
    const size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return {};
    }
    const size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

bool IsBlankTaskText(const std::string& text) {
    return text.find_first_not_of(kWhitespace) == std::string::npos;
}

} // namespace todopad::domain
