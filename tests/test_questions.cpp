/**
 * test_questions.cpp - Unit tests for the interactive question flow
 */

#include "questions.hpp"

#include <cassert>
#include <deque>
#include <iostream>

class ScriptedPrompter : public Prompter {
public:
    std::deque<std::string> selections;
    std::deque<std::string> inputs;
    std::deque<bool> confirmations;
    bool retry = true;
    int retries = 0;
    bool abort_on_confirm = false;

    std::string select(const Question&, const ChoiceStep&) override {
        std::string value = selections.front();
        selections.pop_front();
        return value;
    }

    std::string input(const Question&) override {
        std::string value = inputs.front();
        inputs.pop_front();
        return value;
    }

    bool confirm(const Question&, const ConfirmStep&) override {
        if (abort_on_confirm) {
            throw PromptAborted();
        }
        bool value = confirmations.front();
        confirmations.pop_front();
        return value;
    }

    bool retry_after(const Question& question, const ValidationError&) override {
        assert(question.id == StepId::Subject);
        ++retries;
        return retry;
    }
};

void test_question_order() {
    Translator translator;
    auto questions = build_questions(translator, "en");

    assert(questions.size() == 6);
    assert(questions[0].id == StepId::Prefix);
    assert(questions[1].id == StepId::Scope);
    assert(questions[2].id == StepId::Subject);
    assert(questions[3].id == StepId::Body);
    assert(questions[4].id == StepId::IsBreakingChange);
    assert(questions[5].id == StepId::Footer);

    assert(std::holds_alternative<ChoiceStep>(questions[0].step));
    assert(std::holds_alternative<ConfirmStep>(questions[4].step));
    assert(std::get<InputStep>(questions[1].step).transform == &parse_scope);
    assert(std::get<InputStep>(questions[2].step).transform == &parse_subject);
    assert(std::get<InputStep>(questions[3].step).transform == &join_body_lines);
    assert(std::get<InputStep>(questions[5].step).transform == nullptr);
    assert(!std::get<ConfirmStep>(questions[4].step).default_value);

    std::cout << "[PASS] test_question_order\n";
}

void test_type_choices() {
    Translator translator;
    auto questions = build_questions(translator, "en");
    const auto& choices = std::get<ChoiceStep>(questions[0].step).choices;

    assert(choices.size() == 9);
    assert(choices[0].value == "fix");
    assert(choices[0].key == 'x');
    assert(choices[0].name == "fix: A bug fix. Correlates with PATCH in SemVer");
    assert(choices[1].value == "feat");
    assert(choices[1].key == 'f');
    assert(choices[8].value == "ci");

    std::cout << "[PASS] test_type_choices\n";
}

void test_translated_prompts() {
    Translator translator;
    auto english = build_questions(translator, "en");
    auto portuguese = build_questions(translator, "pt-br");
    auto unknown = build_questions(translator, "xx");

    assert(english[0].message == "Select the type of change you are committing");
    assert(portuguese[0].message == "Selecione o tipo de mudança que você está commitando");
    assert(unknown[0].message == english[0].message);
    assert(std::get<ConfirmStep>(portuguese[4].step).yes_label == "Sim");

    std::cout << "[PASS] test_translated_prompts\n";
}

void test_answers_pass_through_filters() {
    Translator translator;
    ScriptedPrompter prompter;
    prompter.selections = {"feat"};
    prompter.inputs = {"  my  module ", "   ", "add flag.", "first|second", "closes #9"};
    prompter.confirmations = {false};

    Answers answers = ask_questions(build_questions(translator, "en"), prompter);

    assert(prompter.retries == 1);
    assert(answers.prefix == "feat");
    assert(answers.scope == "my-module");
    assert(answers.subject == "add flag");
    assert(answers.body == "first\nsecond");
    assert(!answers.is_breaking_change);
    assert(answers.footer == "closes #9");
    assert(compose_message(answers) == "feat(my-module): add flag\n\nfirst\nsecond\n\ncloses #9");

    std::cout << "[PASS] test_answers_pass_through_filters\n";
}

void test_breaking_confirmation() {
    Translator translator;
    ScriptedPrompter prompter;
    prompter.selections = {"fix"};
    prompter.inputs = {"", "drop legacy api", "", ""};
    prompter.confirmations = {true};

    Answers answers = ask_questions(build_questions(translator, "en"), prompter);

    assert(answers.is_breaking_change);
    assert(compose_message(answers) == "fix: drop legacy api\n\nBREAKING CHANGE: ");

    std::cout << "[PASS] test_breaking_confirmation\n";
}

void test_validation_abort() {
    Translator translator;
    ScriptedPrompter prompter;
    prompter.retry = false;
    prompter.selections = {"fix"};
    prompter.inputs = {"", "."};

    bool thrown = false;
    try {
        ask_questions(build_questions(translator, "en"), prompter);
    } catch (const ValidationError&) {
        thrown = true;
    }
    assert(thrown);
    assert(prompter.retries == 1);

    std::cout << "[PASS] test_validation_abort\n";
}

void test_prompt_aborted() {
    Translator translator;
    ScriptedPrompter prompter;
    prompter.abort_on_confirm = true;
    prompter.selections = {"docs"};
    prompter.inputs = {"", "explain flags", ""};

    bool thrown = false;
    try {
        ask_questions(build_questions(translator, "en"), prompter);
    } catch (const PromptAborted&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[PASS] test_prompt_aborted\n";
}

int main() {
    std::cout << "Running question flow tests...\n\n";

    test_question_order();
    test_type_choices();
    test_translated_prompts();
    test_answers_pass_through_filters();
    test_breaking_confirmation();
    test_validation_abort();
    test_prompt_aborted();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
