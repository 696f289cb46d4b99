#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "commit_parser.hpp"
#include "commit_rules.hpp"

struct ClassifiedCommit {
    ChangeEntry entry;
    Bump bump = Bump::None;
    std::optional<std::string> section;
};

std::optional<std::string> changelog_section(const ChangeEntry& entry);

// Messages the extraction pattern rejects are skipped; the rest keep their input order.
std::vector<ClassifiedCommit> classify_commits(const std::vector<std::string>& messages, bool major_version_zero);

Bump overall_increment(const std::vector<ClassifiedCommit>& commits);

std::string render_changelog(const std::vector<ClassifiedCommit>& commits);
nlohmann::json changelog_to_json(const std::vector<ClassifiedCommit>& commits);
