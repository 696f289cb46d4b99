#pragma once

#include <string>

struct Answers {
    std::string prefix;
    std::string scope;
    std::string subject;
    std::string body;
    bool is_breaking_change = false;
    std::string footer;
};

std::string compose_message(const Answers& answers);

std::string example_message();
std::string schema_text();
