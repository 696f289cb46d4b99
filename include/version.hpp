#pragma once

#include <string>

#include "commit_rules.hpp"

struct SemVer {
    int major = 0;
    int minor = 0;
    int patch = 0;

    static SemVer parse(const std::string& text);
    std::string to_string() const;
};

SemVer bump_version(const SemVer& current, Bump increment);
