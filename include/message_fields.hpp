#pragma once

#include <optional>
#include <stdexcept>
#include <string>

class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

std::string trim(const std::string& s);

// "  a   b  c " -> "a-b-c". Total: absent or blank input gives "".
std::string parse_scope(const std::optional<std::string>& text);

// Throws ValidationError when nothing is left after stripping periods and whitespace.
std::string parse_subject(const std::optional<std::string>& text);

// The body prompt is a single line; '|' marks where the user wants a line break.
std::string join_body_lines(const std::optional<std::string>& text);
