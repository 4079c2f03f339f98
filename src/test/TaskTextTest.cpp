#include <cassert>
#include <iostream>

#include "domain/TaskText.hpp"

using namespace todopad::domain;

int main() {
    std::cout << "[Test] Starting TaskText Test..." << std::endl;

    assert(TrimTaskText("") == "");
    assert(TrimTaskText("   ") == "");
    assert(TrimTaskText("\t\r\n\v\f") == "");
    assert(TrimTaskText("milk") == "milk");
    assert(TrimTaskText("  milk  ") == "milk");
    assert(TrimTaskText("\nwrite\treport\n") == "write\treport");
    assert(TrimTaskText("a  b") == "a  b");

    assert(IsBlankTaskText(""));
    assert(IsBlankTaskText(" \t\n"));
    assert(!IsBlankTaskText(" x "));
    assert(!IsBlankTaskText("."));

    std::cout << "[PASS] TaskText Test." << std::endl;
    return 0;
}
