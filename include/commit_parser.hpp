#pragma once

#include <optional>
#include <string>

#include "commit_rules.hpp"

struct ParsedCommit {
    CommitType type;
    std::optional<std::string> scope;
    bool breaking = false;
    std::string subject;
    std::optional<std::string> body;
    std::optional<std::string> footer;
};

// Result of the looser changelog pattern. `type` is empty when the header only
// matched as a bare "word!:" breaking change.
struct ChangeEntry {
    std::string change_type;
    std::optional<CommitType> type;
    std::optional<std::string> scope;
    bool breaking = false;
    std::string message;
};

// Returns the stripped subject, or "" when the message is not a conventional commit.
std::string process_commit(const std::string& message);

std::optional<ParsedCommit> parse_commit(const std::string& message);

std::optional<ChangeEntry> extract_change(const std::string& message);

// Merge, revert, fixup and similar messages that `check` lets through untouched.
bool is_allowed_prefix(const std::string& message);
