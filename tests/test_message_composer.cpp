/**
 * test_message_composer.cpp - Unit tests for rendering commit messages
 */

#include "commit_parser.hpp"
#include "message_composer.hpp"
#include "message_fields.hpp"

#include <cassert>
#include <iostream>

void test_header_with_scope() {
    Answers answers;
    answers.prefix = "fix";
    answers.scope = "parser";
    answers.subject = "handle empty input";

    assert(compose_message(answers) == "fix(parser): handle empty input");

    std::cout << "[PASS] test_header_with_scope\n";
}

void test_breaking_change_with_empty_footer() {
    Answers answers;
    answers.prefix = "feat";
    answers.subject = "drop legacy api";
    answers.is_breaking_change = true;

    assert(compose_message(answers) == "feat: drop legacy api\n\nBREAKING CHANGE: ");

    std::cout << "[PASS] test_breaking_change_with_empty_footer\n";
}

void test_body_and_footer_paragraphs() {
    Answers answers;
    answers.prefix = "fix";
    answers.subject = "correct minor typos in code";
    answers.body = "see the issue for details on the typos fixed";
    answers.footer = "closes issue #12";

    assert(compose_message(answers) == example_message());

    std::cout << "[PASS] test_body_and_footer_paragraphs\n";
}

void test_breaking_change_prefixes_footer() {
    Answers answers;
    answers.prefix = "refactor";
    answers.scope = "core";
    answers.subject = "rename session type";
    answers.is_breaking_change = true;
    answers.footer = "Session is now Connection";

    assert(compose_message(answers) ==
           "refactor(core): rename session type\n\nBREAKING CHANGE: Session is now Connection");

    std::cout << "[PASS] test_breaking_change_prefixes_footer\n";
}

void test_subject_round_trip() {
    const char* subjects[] = {"fix bug.", "  add the thing  ", "support (nested) parens", "ünïcode subject"};
    for (const char* raw : subjects) {
        Answers answers;
        answers.prefix = "perf";
        answers.scope = parse_scope("hot path");
        answers.subject = parse_subject(raw);
        answers.body = join_body_lines("why|how");
        answers.is_breaking_change = true;
        answers.footer = "closes #7";

        assert(process_commit(compose_message(answers)) == parse_subject(raw));
    }

    std::cout << "[PASS] test_subject_round_trip\n";
}

void test_schema_text() {
    assert(schema_text().find("<type>(<scope>): <subject>") == 0);
    assert(schema_text().find("(BREAKING CHANGE: )<footer>") != std::string::npos);

    std::cout << "[PASS] test_schema_text\n";
}

int main() {
    std::cout << "Running message composer tests...\n\n";

    test_header_with_scope();
    test_breaking_change_with_empty_footer();
    test_body_and_footer_paragraphs();
    test_breaking_change_prefixes_footer();
    test_subject_round_trip();
    test_schema_text();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
