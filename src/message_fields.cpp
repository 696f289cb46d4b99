#include "message_fields.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char ch) { return std::isspace(ch); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char ch) { return std::isspace(ch); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string parse_scope(const std::optional<std::string>& text) {
    if (!text || text->empty()) return "";

    std::istringstream words(*text);
    std::vector<std::string> tokens;
    std::string word;
    while (words >> word) {
        tokens.push_back(word);
    }

    if (tokens.empty()) return "";
    if (tokens.size() == 1) return tokens[0];

    std::string scope = tokens[0];
    for (size_t i = 1; i < tokens.size(); ++i) {
        scope += "-" + tokens[i];
    }
    return scope;
}

std::string parse_subject(const std::optional<std::string>& text) {
    if (!text) {
        throw ValidationError("Subject is required.");
    }

    std::string subject = *text;
    size_t first = subject.find_first_not_of('.');
    size_t last = subject.find_last_not_of('.');
    subject = (first == std::string::npos) ? std::string() : subject.substr(first, last - first + 1);
    subject = trim(subject);

    if (subject.empty()) {
        throw ValidationError("Subject is required.");
    }
    return subject;
}

std::string join_body_lines(const std::optional<std::string>& text) {
    if (!text) return "";

    std::istringstream pieces(*text);
    std::string piece;
    std::string body;
    size_t joined = 0;
    while (std::getline(pieces, piece, '|')) {
        if (piece.empty()) continue;
        if (joined++ > 0) body += "\n";
        body += trim(piece);
    }
    return body;
}
