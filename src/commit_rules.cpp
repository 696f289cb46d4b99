#include "commit_rules.hpp"

#include <array>
#include <utility>

const char* const BREAKING_SECTION_LABEL = "BREAKING CHANGE";
const char* const OTHER_BREAKING_SECTION_LABEL = "Other Breaking";

namespace {

constexpr std::array<std::pair<CommitType, const char*>, 13> COMMIT_TYPE_NAMES = {{
    {CommitType::Feat, "feat"},
    {CommitType::Fix, "fix"},
    {CommitType::Refactor, "refactor"},
    {CommitType::Perf, "perf"},
    {CommitType::Docs, "docs"},
    {CommitType::Style, "style"},
    {CommitType::Test, "test"},
    {CommitType::Build, "build"},
    {CommitType::Ci, "ci"},
    {CommitType::Chore, "chore"},
    {CommitType::Revert, "revert"},
    {CommitType::Bump, "bump"},
    {CommitType::BreakingChange, "BREAKING CHANGE"},
}};

// Non-breaking lookups are shared by both regimes; only the breaking row differs.
Bump bump_map(CommitType type) {
    switch (type) {
        case CommitType::Feat:
            return Bump::Minor;
        case CommitType::Fix:
        case CommitType::Perf:
        case CommitType::Refactor:
            return Bump::Patch;
        case CommitType::Docs:
        case CommitType::Style:
        case CommitType::Test:
        case CommitType::Build:
        case CommitType::Ci:
        case CommitType::Chore:
        case CommitType::Revert:
        case CommitType::Bump:
        case CommitType::BreakingChange:
            return Bump::None;
    }
    return Bump::None;
}

}

std::optional<CommitType> commit_type_from_string(const std::string& token) {
    for (const auto& [type, name] : COMMIT_TYPE_NAMES) {
        if (token == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::string to_string(CommitType type) {
    for (const auto& [candidate, name] : COMMIT_TYPE_NAMES) {
        if (candidate == type) {
            return name;
        }
    }
    return "";
}

std::string to_string(Bump bump) {
    switch (bump) {
        case Bump::Major: return "MAJOR";
        case Bump::Minor: return "MINOR";
        case Bump::Patch: return "PATCH";
        case Bump::None: return "none";
    }
    return "none";
}

std::optional<std::string> change_type_label(CommitType type) {
    switch (type) {
        case CommitType::Feat: return std::string("Feat");
        case CommitType::Fix: return std::string("Fix");
        case CommitType::Refactor: return std::string("Refactor");
        case CommitType::Perf: return std::string("Perf");
        default: return std::nullopt;
    }
}

Bump bump_for_type(CommitType type, bool major_version_zero) {
    if (type == CommitType::BreakingChange) {
        return bump_for_breaking(major_version_zero);
    }
    return bump_map(type);
}

Bump bump_for_breaking(bool major_version_zero) {
    // 0.x is unstable, so breaking changes only move the minor number there.
    return major_version_zero ? Bump::Minor : Bump::Major;
}

Bump classify_change(std::optional<CommitType> type, bool breaking, bool major_version_zero) {
    if (breaking) {
        return bump_for_breaking(major_version_zero);
    }
    if (!type) {
        return Bump::None;
    }
    return bump_for_type(*type, major_version_zero);
}

Bump classify_change(const std::string& change_type, bool breaking, bool major_version_zero) {
    return classify_change(commit_type_from_string(change_type), breaking, major_version_zero);
}
