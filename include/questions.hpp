#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "message_composer.hpp"
#include "message_fields.hpp"
#include "translator.hpp"

enum class StepId {
    Prefix,
    Scope,
    Subject,
    Body,
    IsBreakingChange,
    Footer
};

using FieldTransform = std::string (*)(const std::optional<std::string>&);

struct Choice {
    std::string value;
    std::string name;
    char key;
};

struct ChoiceStep {
    std::vector<Choice> choices;
};

struct InputStep {
    FieldTransform transform = nullptr;
};

struct ConfirmStep {
    bool default_value = false;
    std::string yes_label;
    std::string no_label;
};

struct Question {
    StepId id;
    std::string message;
    std::variant<ChoiceStep, InputStep, ConfirmStep> step;
};

// Thrown by a Prompter when the user cancels; the whole flow is abandoned.
class PromptAborted : public std::runtime_error {
public:
    PromptAborted() : std::runtime_error("Aborted.") {}
};

class Prompter {
public:
    virtual ~Prompter() = default;
    virtual std::string select(const Question& question, const ChoiceStep& step) = 0;
    virtual std::string input(const Question& question) = 0;
    virtual bool confirm(const Question& question, const ConfirmStep& step) = 0;
    // Return true to ask the same question again, false to give up on the flow.
    virtual bool retry_after(const Question& question, const ValidationError& error) = 0;
};

std::vector<Question> build_questions(const Translator& translator, const std::string& language);

Answers ask_questions(const std::vector<Question>& questions, Prompter& prompter);
