#include "version.hpp"

#include <limits>
#include <regex>
#include <stdexcept>

SemVer SemVer::parse(const std::string& text) {
    static const std::regex pattern("v?(\\d+)\\.(\\d+)\\.(\\d+)");
    std::smatch m;
    if (!std::regex_match(text, m, pattern)) {
        throw std::runtime_error("Invalid version '" + text + "', expected MAJOR.MINOR.PATCH");
    }
    SemVer version;
    try {
        version.major = std::stoi(m[1].str());
        version.minor = std::stoi(m[2].str());
        version.patch = std::stoi(m[3].str());
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Version component out of range in '" + text + "'");
    }
    return version;
}

std::string SemVer::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

namespace {

int increment_component(int value, const char* name) {
    if (value == std::numeric_limits<int>::max()) {
        throw std::runtime_error(std::string("Cannot bump ") + name + " version past " + std::to_string(value));
    }
    return value + 1;
}

}

SemVer bump_version(const SemVer& current, Bump increment) {
    SemVer next = current;
    switch (increment) {
        case Bump::Major:
            next.major = increment_component(next.major, "major");
            next.minor = 0;
            next.patch = 0;
            break;
        case Bump::Minor:
            next.minor = increment_component(next.minor, "minor");
            next.patch = 0;
            break;
        case Bump::Patch:
            next.patch = increment_component(next.patch, "patch");
            break;
        case Bump::None:
            break;
    }
    return next;
}
