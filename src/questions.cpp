#include "questions.hpp"

namespace {

struct ChoiceText {
    const char* value;
    const char* description;
    char key;
};

const ChoiceText CHANGE_TYPES[] = {
    {"fix", "A bug fix. Correlates with PATCH in SemVer", 'x'},
    {"feat", "A new feature. Correlates with MINOR in SemVer", 'f'},
    {"docs", "Documentation only changes", 'd'},
    {"style", "Changes that do not affect the meaning of the code (white-space, formatting, missing semi-colons, etc)", 's'},
    {"refactor", "A code change that neither fixes a bug nor adds a feature", 'r'},
    {"perf", "A code change that improves performance", 'p'},
    {"test", "Adding missing or correcting existing tests", 't'},
    {"build", "Changes that affect the build system or external dependencies (example scopes: pip, docker, npm)", 'b'},
    {"ci", "Changes to CI configuration files and scripts (example scopes: GitLabCI)", 'c'},
};

void store(Answers& answers, StepId id, const std::string& value) {
    switch (id) {
        case StepId::Prefix: answers.prefix = value; break;
        case StepId::Scope: answers.scope = value; break;
        case StepId::Subject: answers.subject = value; break;
        case StepId::Body: answers.body = value; break;
        case StepId::Footer: answers.footer = value; break;
        case StepId::IsBreakingChange: break;
    }
}

std::string ask_input(const Question& question, const InputStep& step, Prompter& prompter) {
    while (true) {
        std::string raw = prompter.input(question);
        if (!step.transform) {
            return raw;
        }
        try {
            return step.transform(raw);
        } catch (const ValidationError& e) {
            if (!prompter.retry_after(question, e)) {
                throw;
            }
        }
    }
}

}

std::vector<Question> build_questions(const Translator& translator, const std::string& language) {
    auto tr = [&](const std::string& text, const std::string& key) {
        return translator.translate(text, language, key);
    };

    ChoiceStep prefix_step;
    for (const auto& type : CHANGE_TYPES) {
        prefix_step.choices.push_back({type.value, std::string(type.value) + ": " + tr(type.description, type.value), type.key});
    }

    ConfirmStep breaking_step;
    breaking_step.default_value = false;
    breaking_step.yes_label = tr("Yes", "yes");
    breaking_step.no_label = tr("No", "no");

    return {
        {StepId::Prefix, tr("Select the type of change you are committing", "prefix"), prefix_step},
        {StepId::Scope,
         tr("What is the scope of this change? (class or file name): (press [enter] to skip)\n", "scope"),
         InputStep{parse_scope}},
        {StepId::Subject,
         tr("Write a short and imperative summary of the code changes: (lower case and no period)\n", "subject"),
         InputStep{parse_subject}},
        {StepId::Body,
         tr("Provide additional contextual information about the code changes: (use '|' for line breaks, press [enter] to skip)\n", "body"),
         InputStep{join_body_lines}},
        {StepId::IsBreakingChange, tr("Is this a BREAKING CHANGE? Correlates with MAJOR in SemVer", "is_breaking_change"), breaking_step},
        {StepId::Footer,
         tr("Footer. Information about Breaking Changes and reference issues that this commit closes: (press [enter] to skip)\n", "footer"),
         InputStep{}},
    };
}

Answers ask_questions(const std::vector<Question>& questions, Prompter& prompter) {
    Answers answers;
    for (const auto& question : questions) {
        if (const auto* choice = std::get_if<ChoiceStep>(&question.step)) {
            store(answers, question.id, prompter.select(question, *choice));
        } else if (const auto* input = std::get_if<InputStep>(&question.step)) {
            store(answers, question.id, ask_input(question, *input, prompter));
        } else if (const auto* confirm = std::get_if<ConfirmStep>(&question.step)) {
            bool value = prompter.confirm(question, *confirm);
            if (question.id == StepId::IsBreakingChange) {
                answers.is_breaking_change = value;
            }
        }
    }
    return answers;
}
