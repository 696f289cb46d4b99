#include "changelog.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <sstream>

std::optional<std::string> changelog_section(const ChangeEntry& entry) {
    if (entry.breaking) {
        return std::string(entry.type ? BREAKING_SECTION_LABEL : OTHER_BREAKING_SECTION_LABEL);
    }
    if (!entry.type) {
        return std::nullopt;
    }
    return change_type_label(*entry.type);
}

std::vector<ClassifiedCommit> classify_commits(const std::vector<std::string>& messages, bool major_version_zero) {
    std::vector<ClassifiedCommit> classified;
    for (const auto& message : messages) {
        auto entry = extract_change(message);
        if (!entry) continue;

        ClassifiedCommit commit;
        commit.entry = *entry;
        commit.bump = classify_change(entry->type, entry->breaking, major_version_zero);
        commit.section = changelog_section(*entry);
        classified.push_back(commit);
    }
    return classified;
}

Bump overall_increment(const std::vector<ClassifiedCommit>& commits) {
    Bump increment = Bump::None;
    for (const auto& commit : commits) {
        increment = std::max(increment, commit.bump);
    }
    return increment;
}

std::string render_changelog(const std::vector<ClassifiedCommit>& commits) {
    static const std::array<const char*, 6> section_order = {
        BREAKING_SECTION_LABEL, OTHER_BREAKING_SECTION_LABEL, "Feat", "Fix", "Refactor", "Perf"
    };

    std::map<std::string, std::vector<const ClassifiedCommit*>> by_section;
    for (const auto& commit : commits) {
        if (commit.section) {
            by_section[*commit.section].push_back(&commit);
        }
    }

    std::ostringstream out;
    bool first = true;
    for (const char* label : section_order) {
        auto it = by_section.find(label);
        if (it == by_section.end()) continue;

        if (!first) out << "\n";
        first = false;
        out << "### " << label << "\n\n";
        for (const ClassifiedCommit* commit : it->second) {
            out << "- ";
            if (commit->entry.scope) {
                out << "**" << *commit->entry.scope << "**: ";
            }
            out << commit->entry.message << "\n";
        }
    }
    return out.str();
}

nlohmann::json changelog_to_json(const std::vector<ClassifiedCommit>& commits) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& commit : commits) {
        nlohmann::json j = {
            {"change_type", commit.entry.change_type},
            {"breaking", commit.entry.breaking},
            {"message", commit.entry.message},
            {"increment", to_string(commit.bump)}
        };
        j["scope"] = commit.entry.scope ? nlohmann::json(*commit.entry.scope) : nlohmann::json(nullptr);
        j["section"] = commit.section ? nlohmann::json(*commit.section) : nlohmann::json(nullptr);
        entries.push_back(j);
    }
    return entries;
}
