#include "ftxui_prompter.hpp"
#include "colors.hpp"
#include <functional>
#include <iostream>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>

namespace {

// Runs one prompt screen. Returns false when the user pressed Esc.
bool run_screen(const std::string& message, ftxui::Component component, const std::string& hint,
                const std::function<bool(const ftxui::Event&)>& on_event) {
    auto screen = ftxui::ScreenInteractive::TerminalOutput();
    bool accepted = false;

    auto renderer = ftxui::Renderer(component, [&] {
        return ftxui::vbox(
            ftxui::paragraph(trim(message)) | ftxui::bold,
            ftxui::separator(),
            component->Render(),
            ftxui::separator(),
            ftxui::text(hint) | ftxui::dim
        ) | ftxui::border;
    });

    auto event_handler = ftxui::CatchEvent(renderer, [&](ftxui::Event event) {
        if (event == ftxui::Event::Escape) {
            screen.ExitLoopClosure()();
            return true;
        }
        if (event == ftxui::Event::Return || on_event(event)) {
            accepted = true;
            screen.ExitLoopClosure()();
            return true;
        }
        return false;
    });

    component->TakeFocus();
    screen.Loop(event_handler);
    return accepted;
}

void echo_answer(const Question& question, const std::string& answer) {
    std::cout << Colors::YELLOW << "? " << Colors::RESET << trim(question.message) << " "
              << Colors::GREEN << answer << Colors::RESET << std::endl;
}

}

std::string FtxuiPrompter::select(const Question& question, const ChoiceStep& step) {
    std::vector<std::string> names;
    for (const auto& choice : step.choices) {
        names.push_back("(" + std::string(1, choice.key) + ") " + choice.name);
    }
    int selected = 0;

    auto menu = ftxui::Menu(&names, &selected, ftxui::MenuOption());
    bool accepted = run_screen(question.message, menu, "Use arrows or the shortcut key, Enter to select, Esc to cancel",
        [&](const ftxui::Event& event) {
            if (!event.is_character()) return false;
            for (size_t i = 0; i < step.choices.size(); ++i) {
                if (event.character() == std::string(1, step.choices[i].key)) {
                    selected = static_cast<int>(i);
                    return true;
                }
            }
            return false;
        });
    if (!accepted) {
        throw PromptAborted();
    }

    const std::string& value = step.choices[selected].value;
    echo_answer(question, value);
    return value;
}

std::string FtxuiPrompter::input(const Question& question) {
    std::string value;
    ftxui::InputOption input_option;
    auto field = ftxui::Input(&value, "", input_option);

    bool accepted = run_screen(question.message, field, "Enter to confirm, Esc to cancel",
        [](const ftxui::Event&) { return false; });
    if (!accepted) {
        throw PromptAborted();
    }

    echo_answer(question, value);
    return value;
}

bool FtxuiPrompter::confirm(const Question& question, const ConfirmStep& step) {
    std::vector<std::string> options = {step.yes_label, step.no_label};
    int selected = step.default_value ? 0 : 1;

    auto menu = ftxui::Menu(&options, &selected, ftxui::MenuOption());
    bool accepted = run_screen(question.message, menu, "y/n or arrows, Enter to confirm, Esc to cancel",
        [&](const ftxui::Event& event) {
            if (event == ftxui::Event::Character('y') || event == ftxui::Event::Character('Y')) {
                selected = 0;
                return true;
            }
            if (event == ftxui::Event::Character('n') || event == ftxui::Event::Character('N')) {
                selected = 1;
                return true;
            }
            return false;
        });
    if (!accepted) {
        throw PromptAborted();
    }

    echo_answer(question, options[selected]);
    return selected == 0;
}

bool FtxuiPrompter::retry_after(const Question&, const ValidationError& error) {
    std::cerr << Colors::RED << error.what() << Colors::RESET << std::endl;
    return true;
}
