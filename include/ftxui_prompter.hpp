#pragma once

#include "questions.hpp"

// Terminal front end for the question flow. Esc on any screen throws PromptAborted;
// an invalid answer is reported in red and asked again.
class FtxuiPrompter : public Prompter {
public:
    std::string select(const Question& question, const ChoiceStep& step) override;
    std::string input(const Question& question) override;
    bool confirm(const Question& question, const ConfirmStep& step) override;
    bool retry_after(const Question& question, const ValidationError& error) override;
};
