#include "message_composer.hpp"

std::string compose_message(const Answers& answers) {
    std::string scope = answers.scope;
    std::string body = answers.body;
    std::string footer = answers.footer;

    if (!scope.empty()) {
        scope = "(" + scope + ")";
    }
    if (!body.empty()) {
        body = "\n\n" + body;
    }
    // Kept even with an empty footer, so the breaking flag survives in the text.
    if (answers.is_breaking_change) {
        footer = "BREAKING CHANGE: " + footer;
    }
    if (!footer.empty()) {
        footer = "\n\n" + footer;
    }

    return answers.prefix + scope + ": " + answers.subject + body + footer;
}

std::string example_message() {
    return "fix: correct minor typos in code\n"
           "\n"
           "see the issue for details on the typos fixed\n"
           "\n"
           "closes issue #12";
}

std::string schema_text() {
    return "<type>(<scope>): <subject>\n"
           "<BLANK LINE>\n"
           "<body>\n"
           "<BLANK LINE>\n"
           "(BREAKING CHANGE: )<footer>";
}
