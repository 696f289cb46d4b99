#include "config.hpp"
#include "colors.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <sys/ioctl.h>
#include <unistd.h>

void configure_app(const std::string& config_path) {
    // Query terminal height
    struct winsize ws;
    int terminal_height = 24;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) {
        terminal_height = ws.ws_row;
    }

    // Only the global file is edited, so local overrides are not folded in.
    Config existing = Config::load_from_file(config_path);

    enum class ConfigStep { Language, MajorVersionZero };
    ConfigStep current_step = ConfigStep::Language;

    std::vector<std::string> languages = {"en", "pt-br", "es"};
    int language_index = 0;
    for (size_t i = 0; i < languages.size(); ++i) {
        if (languages[i] == existing.language) {
            language_index = static_cast<int>(i);
        }
    }

    std::vector<std::string> zero_options = {
        "no  - breaking changes bump MAJOR",
        "yes - project is 0.x, breaking changes bump MINOR"
    };
    int zero_index = existing.major_version_zero ? 1 : 0;

    bool saved = false;

    auto language_menu = ftxui::Menu(&languages, &language_index, ftxui::MenuOption());
    auto zero_menu = ftxui::Menu(&zero_options, &zero_index, ftxui::MenuOption());

    auto screen = ftxui::ScreenInteractive::TerminalOutput();

    auto layout = ftxui::Container::Vertical(std::vector<ftxui::Component>{
        ftxui::Renderer(language_menu, [&] {
            if (current_step != ConfigStep::Language) return ftxui::text("");
            return ftxui::vbox(ftxui::text("Prompt language:"), language_menu->Render());
        }),
        ftxui::Renderer(zero_menu, [&] {
            if (current_step != ConfigStep::MajorVersionZero) return ftxui::text("");
            return ftxui::vbox(ftxui::text("Major version zero:"), zero_menu->Render());
        }),
    });

    auto renderer = ftxui::Renderer(layout, [&] {
        std::string step_title = current_step == ConfigStep::Language
            ? "Step 1/2: Select Language"
            : "Step 2/2: Major Version Zero";
        return ftxui::vbox(
            ftxui::text("Configuration Setup") | ftxui::bold,
            ftxui::text(step_title) | ftxui::dim,
            ftxui::separator(),
            layout->Render() | ftxui::flex,
            ftxui::separator(),
            ftxui::text("Press Enter to advance, Esc to cancel")
        ) | ftxui::border | ftxui::size(ftxui::HEIGHT, ftxui::LESS_THAN, terminal_height);
    });

    auto event_handler = ftxui::CatchEvent(renderer, [&](ftxui::Event event) {
        if (event == ftxui::Event::Return) {
            if (current_step == ConfigStep::Language) {
                current_step = ConfigStep::MajorVersionZero;
                zero_menu->TakeFocus();
            } else {
                saved = true;
                screen.ExitLoopClosure()();
            }
        } else if (event == ftxui::Event::Escape) {
            screen.ExitLoopClosure()();
        } else if (event.is_mouse()) {
            return true;
        }
        return (event == ftxui::Event::Return || event == ftxui::Event::Escape);
    });

    language_menu->TakeFocus();
    screen.Loop(event_handler);

    if (!saved) {
        std::cout << Colors::YELLOW << "Configuration unchanged." << Colors::RESET << std::endl;
        return;
    }

    existing.language = languages[language_index];
    existing.major_version_zero = zero_index == 1;
    existing.save_to_file(config_path);
    std::cout << Colors::GREEN << "Configuration saved to " << config_path << Colors::RESET << std::endl;
}
