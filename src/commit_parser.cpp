#include "commit_parser.hpp"
#include "message_fields.hpp"

#include <array>
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace {

struct Header {
    std::string type;
    std::string scope;
    bool breaking;
    std::string subject;
};

// libstdc++ std::regex recurses once per matched character, so the patterns below
// only ever see the first MAX_PREFIX_LENGTH characters of a line. The subject and
// message past the prefix are taken by hand.
constexpr size_t MAX_PREFIX_LENGTH = 512;

const std::regex& header_pattern() {
    static const std::regex pattern(
        "(build|ci|docs|feat|fix|perf|refactor|style|test|chore|revert|bump|BREAKING CHANGE)"  // type
        "(\\(\\S+\\))?"                                                                        // scope
        "(!)?: ");
    return pattern;
}

const std::regex& change_pattern() {
    static const std::regex pattern(
        "((feat|fix|refactor|perf|BREAKING CHANGE)(?:\\(([^()\\r\\n]*)\\)|\\()?(!)?|\\w+!):\\s");
    return pattern;
}

const std::regex& trailer_pattern() {
    static const std::regex pattern("(BREAKING[ -]CHANGE:|[A-Za-z][\\w-]*(: | #))");
    return pattern;
}

// "closes issue #12", "Fixes: #3" and the like.
const std::regex& issue_keyword_pattern() {
    static const std::regex pattern("(close[sd]?|fix(e[sd])?|resolve[sd]?|refs?)\\b", std::regex::icase);
    return pattern;
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string first_line(const std::string& text) {
    return text.substr(0, text.find_first_of("\r\n"));
}

std::optional<Header> match_header(const std::string& message, std::string& rest) {
    size_t header_end = message.find_first_of("\r\n");
    std::string header = message.substr(0, header_end);
    rest = header_end == std::string::npos ? std::string() : message.substr(header_end);

    std::string prefix = header.substr(0, MAX_PREFIX_LENGTH);
    std::smatch m;
    if (!std::regex_search(prefix, m, header_pattern(), std::regex_constants::match_continuous)) {
        return std::nullopt;
    }
    std::string subject = header.substr(m.length());
    if (subject.empty()) {
        return std::nullopt;
    }
    // Whatever follows the header is either a paragraph after a blank line or trailing whitespace.
    if (!starts_with(rest, "\n\n") && !is_blank(rest)) {
        return std::nullopt;
    }

    Header result;
    result.type = m[1].str();
    result.scope = m[2].matched ? m[2].str().substr(1, m[2].length() - 2) : std::string();
    result.breaking = m[3].matched;
    result.subject = trim(subject);
    return result;
}

std::vector<std::string> split_paragraphs(const std::string& text) {
    std::vector<std::string> paragraphs;
    std::istringstream lines(text);
    std::string line;
    std::string current;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_blank(line)) {
            if (!current.empty()) {
                paragraphs.push_back(current);
                current.clear();
            }
            continue;
        }
        if (!current.empty()) current += "\n";
        current += line;
    }
    if (!current.empty()) paragraphs.push_back(current);
    return paragraphs;
}

bool has_issue_reference(const std::string& line) {
    for (size_t pos = line.find('#'); pos != std::string::npos; pos = line.find('#', pos + 1)) {
        if (pos + 1 < line.size() && std::isdigit(static_cast<unsigned char>(line[pos + 1]))) {
            return true;
        }
    }
    return false;
}

bool looks_like_footer(const std::string& paragraph) {
    std::string line = first_line(paragraph);
    std::string prefix = line.substr(0, MAX_PREFIX_LENGTH);
    if (std::regex_search(prefix, trailer_pattern(), std::regex_constants::match_continuous)) {
        return true;
    }
    return has_issue_reference(line) &&
           std::regex_search(prefix, issue_keyword_pattern(), std::regex_constants::match_continuous);
}

bool is_breaking_footer(const std::string& footer) {
    return starts_with(footer, "BREAKING CHANGE:") || starts_with(footer, "BREAKING-CHANGE:");
}

bool has_breaking_footer(const std::vector<std::string>& paragraphs) {
    for (const auto& paragraph : paragraphs) {
        if (is_breaking_footer(paragraph)) {
            return true;
        }
    }
    return false;
}

}

std::string process_commit(const std::string& message) {
    std::string rest;
    auto header = match_header(message, rest);
    if (!header) {
        return "";
    }
    return header->subject;
}

std::optional<ParsedCommit> parse_commit(const std::string& message) {
    std::string rest;
    auto header = match_header(message, rest);
    if (!header || header->subject.empty()) {
        return std::nullopt;
    }
    auto type = commit_type_from_string(header->type);
    if (!type) {
        return std::nullopt;
    }

    ParsedCommit commit;
    commit.type = *type;
    if (!header->scope.empty()) commit.scope = header->scope;
    commit.subject = header->subject;
    commit.breaking = header->breaking || *type == CommitType::BreakingChange;

    auto paragraphs = split_paragraphs(rest);
    if (paragraphs.size() == 1) {
        if (looks_like_footer(paragraphs[0])) {
            commit.footer = paragraphs[0];
        } else {
            commit.body = paragraphs[0];
        }
    } else if (paragraphs.size() > 1) {
        commit.footer = paragraphs.back();
        std::string body = paragraphs[0];
        for (size_t i = 1; i + 1 < paragraphs.size(); ++i) {
            body += "\n\n" + paragraphs[i];
        }
        commit.body = body;
    }

    if (has_breaking_footer(paragraphs)) {
        commit.breaking = true;
    }
    return commit;
}

std::optional<ChangeEntry> extract_change(const std::string& message) {
    std::string prefix = message.substr(0, MAX_PREFIX_LENGTH);
    std::smatch m;
    if (!std::regex_search(prefix, m, change_pattern(), std::regex_constants::match_continuous)) {
        return std::nullopt;
    }

    ChangeEntry entry;
    if (m[2].matched) {
        entry.change_type = m[2].str();
        entry.breaking = m[4].matched;
        if (m[3].matched && !m[3].str().empty()) {
            entry.scope = m[3].str();
        }
    } else {
        // Bare "word!:" form.
        std::string word = m[1].str();
        word.pop_back();
        entry.change_type = word;
        entry.breaking = true;
    }
    entry.type = commit_type_from_string(entry.change_type);
    entry.message = trim(first_line(message.substr(m.length())));

    size_t header_end = message.find_first_of("\r\n");
    if (entry.type == CommitType::BreakingChange ||
        (header_end != std::string::npos && has_breaking_footer(split_paragraphs(message.substr(header_end))))) {
        entry.breaking = true;
    }
    return entry;
}

bool is_allowed_prefix(const std::string& message) {
    static const std::array<const char*, 6> allowed = {
        "Merge", "Revert", "Pull request", "fixup!", "squash!", "amend!"
    };
    for (const char* prefix : allowed) {
        if (starts_with(message, prefix)) {
            return true;
        }
    }
    return false;
}
