// Automated tests for hotkey normalization and validation
// Compile: g++ -std=c++17 -I../include -o test_hotkey_spec test_hotkey_spec.cpp ../src/hotkey_spec.cpp

#include "hotkey_spec.hpp"
#include <iostream>
#include <cassert>

using namespace voxkey;

void test_normalize_simple() {
    std::cout << "Testing simple modifier+key combos..." << std::endl;

    assert(normalize_hotkey("ctrl+r") == "ctrl+r");
    assert(normalize_hotkey("alt+x") == "alt+x");
    assert(normalize_hotkey("shift+a") == "shift+a");

    // Main key comes after modifiers
    assert(normalize_hotkey("r+ctrl") == "ctrl+r");
    assert(normalize_hotkey("x+alt+ctrl") == "ctrl+alt+x");

    std::cout << "  PASS" << std::endl;
}

void test_normalize_modifier_order() {
    std::cout << "Testing canonical modifier order..." << std::endl;

    assert(normalize_hotkey("shift+ctrl+alt+win+x") == "ctrl+alt+shift+win+x");
    assert(normalize_hotkey("win+shift+alt+ctrl+x") == "ctrl+alt+shift+win+x");

    std::cout << "  PASS" << std::endl;
}

void test_normalize_synonyms() {
    std::cout << "Testing key name synonyms..." << std::endl;

    assert(normalize_hotkey("windows+ctrl") == "ctrl+win");
    assert(normalize_hotkey("left windows+alt") == "alt+win");
    assert(normalize_hotkey("right windows+shift") == "shift+win");
    assert(normalize_hotkey("control+r") == "ctrl+r");
    assert(normalize_hotkey(" Control + Windows + R ") == "ctrl+win+r");

    std::cout << "  PASS" << std::endl;
}

void test_normalize_duplicates() {
    std::cout << "Testing duplicate removal..." << std::endl;

    assert(normalize_hotkey("ctrl+ctrl+r") == "ctrl+r");
    assert(normalize_hotkey("ctrl+r+r") == "ctrl+r");
    assert(normalize_hotkey("win+windows+ctrl") == "ctrl+win");
    assert(normalize_hotkey("control+ctrl+shift") == "ctrl+shift");

    std::cout << "  PASS" << std::endl;
}

void test_normalize_main_keys_sorted() {
    std::cout << "Testing main key ordering..." << std::endl;

    assert(normalize_hotkey("ctrl+b+a") == "ctrl+a+b");
    assert(normalize_hotkey("f5+alt+a") == "alt+a+f5");

    std::cout << "  PASS" << std::endl;
}

void test_normalize_order_and_case_insensitive() {
    std::cout << "Testing order and case insensitivity..." << std::endl;

    const std::string expected = "ctrl+win+r";
    const char* inputs[] = {"ctrl+win+r", "win+ctrl+r", "r+win+ctrl", "r+ctrl+win", "R+CTRL+WIN"};
    for (const char* input : inputs) {
        assert(normalize_hotkey(input) == expected);
    }

    assert(normalize_hotkey("Ctrl+Win+X") == "ctrl+win+x");

    std::cout << "  PASS" << std::endl;
}

void test_normalize_empty() {
    std::cout << "Testing blank input..." << std::endl;

    assert(normalize_hotkey("") == "");
    assert(normalize_hotkey("   ") == "   ");

    std::cout << "  PASS" << std::endl;
}

void test_normalize_idempotent() {
    std::cout << "Testing normalize is idempotent..." << std::endl;

    const char* inputs[] = {
        "ctrl+win", "r+win+ctrl", "Shift+Alt+Control+B+A", "windows+left windows+q",
        "ctrl+ctrl+r+r", "f12+shift", "   ", "", "a+b+c", "ctrl",
    };
    for (const char* input : inputs) {
        std::string once = normalize_hotkey(input);
        assert(normalize_hotkey(once) == once);
    }

    std::cout << "  PASS" << std::endl;
}

void test_validate_valid() {
    std::cout << "Testing valid hotkeys..." << std::endl;

    auto result = validate_hotkey("ctrl+r");
    assert(result.valid && result.error.empty());

    result = validate_hotkey("ctrl+shift+r");
    assert(result.valid);

    // Two modifiers without a main key
    result = validate_hotkey("ctrl+win");
    assert(result.valid && result.error.empty());
    assert(validate_hotkey("ctrl+shift").valid);
    assert(validate_hotkey("control+windows").valid);

    std::cout << "  PASS" << std::endl;
}

void test_validate_invalid() {
    std::cout << "Testing invalid hotkeys..." << std::endl;

    auto result = validate_hotkey("");
    assert(!result.valid);
    assert(result.error.find("empty") != std::string::npos);

    result = validate_hotkey("   ");
    assert(!result.valid && result.error.find("empty") != std::string::npos);

    result = validate_hotkey("r");
    assert(!result.valid);

    result = validate_hotkey("ctrl");
    assert(!result.valid);
    assert(result.error.find("two keys") != std::string::npos);

    // Main keys only: a modifier is required
    result = validate_hotkey("a+b");
    assert(!result.valid);
    assert(result.error.find("modifier") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_conflicts() {
    std::cout << "Testing conflict detection..." << std::endl;

    assert(hotkeys_conflict("ctrl+r", "ctrl+r"));
    assert(hotkeys_conflict("ctrl+win+r", "win+ctrl+r"));
    assert(hotkeys_conflict("r+ctrl+win", "ctrl+win+r"));
    assert(hotkeys_conflict("ctrl+win", "ctrl+windows"));

    assert(!hotkeys_conflict("ctrl+r", "ctrl+t"));
    assert(!hotkeys_conflict("ctrl+win", "ctrl+shift+win"));

    assert(!hotkeys_conflict("", "ctrl+r"));
    assert(!hotkeys_conflict("ctrl+r", ""));
    assert(!hotkeys_conflict("  ", "  "));

    std::cout << "  PASS" << std::endl;
}

void test_release_keys() {
    std::cout << "Testing release key extraction..." << std::endl;

    auto keys = hotkey_release_keys("Ctrl + Left Windows + R");
    assert(keys.size() == 3);
    assert(keys[0] == "ctrl" && keys[1] == "win" && keys[2] == "r");

    assert(hotkey_release_keys("").empty());
    assert(is_modifier_key("shift") && !is_modifier_key("windows") && !is_modifier_key("r"));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Hotkey Spec Test Suite ===" << std::endl << std::endl;

    test_normalize_simple();
    test_normalize_modifier_order();
    test_normalize_synonyms();
    test_normalize_duplicates();
    test_normalize_main_keys_sorted();
    test_normalize_order_and_case_insensitive();
    test_normalize_empty();
    test_normalize_idempotent();
    test_validate_valid();
    test_validate_invalid();
    test_conflicts();
    test_release_keys();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
