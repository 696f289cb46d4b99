/**
 * test_version.cpp - Unit tests for semantic version bumps
 */

#include "version.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

void test_parse() {
    SemVer v = SemVer::parse("1.2.3");
    assert(v.major == 1 && v.minor == 2 && v.patch == 3);

    SemVer tagged = SemVer::parse("v0.4.10");
    assert(tagged.major == 0 && tagged.minor == 4 && tagged.patch == 10);
    assert(tagged.to_string() == "0.4.10");

    std::cout << "[PASS] test_parse\n";
}

void test_parse_rejects_garbage() {
    for (const char* text : {"", "1.2", "1.2.3.4", "one.two.three", "1.2.3-rc1"}) {
        bool thrown = false;
        try {
            SemVer::parse(text);
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "[PASS] test_parse_rejects_garbage\n";
}

void test_bumps() {
    SemVer v = SemVer::parse("1.2.3");

    assert(bump_version(v, Bump::Major).to_string() == "2.0.0");
    assert(bump_version(v, Bump::Minor).to_string() == "1.3.0");
    assert(bump_version(v, Bump::Patch).to_string() == "1.2.4");
    assert(bump_version(v, Bump::None).to_string() == "1.2.3");

    std::cout << "[PASS] test_bumps\n";
}

void test_major_version_zero_bump() {
    SemVer v = SemVer::parse("0.9.1");
    Bump increment = classify_change("feat", true, true);

    assert(bump_version(v, increment).to_string() == "0.10.0");

    std::cout << "[PASS] test_major_version_zero_bump\n";
}

void test_bump_overflow() {
    std::string max = std::to_string(std::numeric_limits<int>::max());
    SemVer at_limit = SemVer::parse(max + "." + max + "." + max);
    for (Bump increment : {Bump::Major, Bump::Minor, Bump::Patch}) {
        bool thrown = false;
        try {
            bump_version(at_limit, increment);
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
    }
    assert(bump_version(at_limit, Bump::None).major == std::numeric_limits<int>::max());

    std::cout << "[PASS] test_bump_overflow\n";
}

int main() {
    std::cout << "Running version tests...\n\n";

    test_parse();
    test_parse_rejects_garbage();
    test_bumps();
    test_major_version_zero_bump();
    test_bump_overflow();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
