#pragma once

#include <optional>
#include <string>

enum class CommitType {
    Feat,
    Fix,
    Refactor,
    Perf,
    Docs,
    Style,
    Test,
    Build,
    Ci,
    Chore,
    Revert,
    Bump,
    BreakingChange
};

// Ordered by severity, so std::max picks the stronger increment.
enum class Bump {
    None,
    Patch,
    Minor,
    Major
};

std::optional<CommitType> commit_type_from_string(const std::string& token);
std::string to_string(CommitType type);
std::string to_string(Bump bump);

// Section header for a non-breaking change, or nullopt for types left out of the changelog.
std::optional<std::string> change_type_label(CommitType type);

Bump bump_for_type(CommitType type, bool major_version_zero);
Bump bump_for_breaking(bool major_version_zero);

Bump classify_change(std::optional<CommitType> type, bool breaking, bool major_version_zero);
Bump classify_change(const std::string& change_type, bool breaking, bool major_version_zero);

extern const char* const BREAKING_SECTION_LABEL;
extern const char* const OTHER_BREAKING_SECTION_LABEL;
