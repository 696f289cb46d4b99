#include <CLI/CLI.hpp>
#include <iostream>
#include <string>
#include <cstdlib>
#include <fstream>
#include <cstring>
#include <vector>
#include "changelog.hpp"
#include "colors.hpp"
#include "commit_parser.hpp"
#include "config.hpp"
#include "ftxui_prompter.hpp"
#include "git_utils.hpp"
#include "info_document.hpp"
#include "message_composer.hpp"
#include "questions.hpp"
#include "translator.hpp"
#include "version.hpp"

std::string get_config_path() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    std::string config_dir;
    if (xdg_config && strlen(xdg_config) > 0) {
        config_dir = xdg_config;
    } else {
        const char* home = std::getenv("HOME");
        if (!home || strlen(home) == 0) {
            throw std::runtime_error("HOME environment variable not set");
        }
        config_dir = std::string(home) + "/.config";
    }
    return config_dir + "/convcommit/config.txt";
}

// Commit messages on stdin are separated by lines holding only "---".
std::vector<std::string> read_messages_from_stdin() {
    std::vector<std::string> messages;
    std::string current;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "---") {
            messages.push_back(current);
            current.clear();
            continue;
        }
        if (!current.empty()) current += "\n";
        current += line;
    }
    if (!current.empty()) messages.push_back(current);
    return messages;
}

std::string read_commit_msg_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to read commit message file: " + path);
    }
    // git leaves its instructions in the file as '#' comment lines.
    std::string message;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line[0] == '#') continue;
        if (!message.empty()) message += "\n";
        message += line;
    }
    return message;
}

int run_commit(GitRepository& repo, const Config& config, const std::string& language, bool dry_run) {
    GitUtils git_utils(repo);

    if (!dry_run && !git_utils.has_staged_changes()) {
        std::cerr << Colors::YELLOW << "No files added to staging!" << Colors::RESET << std::endl;
        return 1;
    }

    Translator translator;
    if (!config.translations.empty()) {
        translator.load_catalog(config.translations);
    }

    FtxuiPrompter prompter;
    Answers answers = ask_questions(build_questions(translator, language), prompter);
    std::string commit_msg = compose_message(answers);

    if (dry_run) {
        std::cout << std::endl;
        std::cout << Colors::GREEN << "[DRY RUN] Would commit with message:" << Colors::RESET << std::endl;
        std::cout << commit_msg << std::endl;
        return 0;
    }

    auto [hash, summary] = git_utils.commit_with_output(commit_msg);
    std::cout << std::endl;
    std::cout << Colors::BLUE << hash << Colors::RESET << " ";
    std::cout << Colors::GREEN << "Committed:" << Colors::RESET << " " << summary << std::endl;
    return 0;
}

int run_check(GitRepository& repo, const std::string& message, const std::string& commit_msg_file, const std::string& rev_range) {
    std::vector<std::string> messages;
    if (!message.empty()) {
        messages.push_back(message);
    } else if (!commit_msg_file.empty()) {
        messages.push_back(read_commit_msg_file(commit_msg_file));
    } else {
        GitUtils git_utils(repo);
        messages = git_utils.get_commit_messages(rev_range);
    }

    int failures = 0;
    for (const auto& msg : messages) {
        if (is_allowed_prefix(msg)) continue;
        if (process_commit(msg).empty()) {
            ++failures;
            std::cerr << Colors::RED << "commit validation: failed!" << Colors::RESET << std::endl;
            std::cerr << "please enter a commit message in the conventional commits format." << std::endl;
            std::cerr << "commit: \"" << msg.substr(0, msg.find('\n')) << "\"" << std::endl;
            std::cerr << "pattern: " << schema_text() << std::endl << std::endl;
        }
    }

    if (failures > 0) {
        return 1;
    }
    std::cout << Colors::GREEN << "Commit validation: successful!" << Colors::RESET << std::endl;
    return 0;
}

std::vector<std::string> collect_messages(GitRepository& repo, bool from_stdin, const std::string& rev_range) {
    if (from_stdin) {
        return read_messages_from_stdin();
    }
    GitUtils git_utils(repo);
    return git_utils.get_commit_messages(rev_range);
}

int run_bump(const std::vector<std::string>& messages, const std::string& current_version, bool major_version_zero) {
    if (major_version_zero && !current_version.empty() && SemVer::parse(current_version).major != 0) {
        throw std::runtime_error("--major-version-zero is meaningless for current version " + current_version);
    }

    auto commits = classify_commits(messages, major_version_zero);
    Bump increment = overall_increment(commits);

    std::cout << "increment: " << to_string(increment) << std::endl;
    if (!current_version.empty()) {
        SemVer next = bump_version(SemVer::parse(current_version), increment);
        std::cout << "version: " << SemVer::parse(current_version).to_string() << " -> " << next.to_string() << std::endl;
    }
    return 0;
}

int run_changelog(const std::vector<std::string>& messages, bool json, bool major_version_zero) {
    auto commits = classify_commits(messages, major_version_zero);
    if (json) {
        std::cout << changelog_to_json(commits).dump(2) << std::endl;
        return 0;
    }
    std::string rendered = render_changelog(commits);
    if (rendered.empty()) {
        std::cout << Colors::YELLOW << "No commits found for the changelog" << Colors::RESET << std::endl;
        return 0;
    }
    std::cout << rendered;
    return 0;
}

int main(int argc, char** argv) {
    CLI::App app{"convcommit - Write, check and classify conventional commit messages"};

    std::string config_path;
    try {
        config_path = get_config_path();
    } catch (const std::exception& e) {
        std::cerr << Colors::RED << "Error: " << e.what() << Colors::RESET << std::endl;
        return 1;
    }
    bool configure = false;

    app.set_help_flag("--help", "Print help message");
    app.footer("Configuration file location: " + config_path);
    app.add_option("--config", config_path, "Path to config file");
    app.add_flag("--configure", configure, "Configure the application interactively");
    app.require_subcommand(0, 1);

    bool dry_run = false;
    std::string language;
    auto* commit_cmd = app.add_subcommand("commit", "Create a new commit interactively (default)");
    commit_cmd->add_flag("--dry-run", dry_run, "Print the composed message instead of committing");
    commit_cmd->add_option("-l,--language", language, "Language for the prompts (en, pt-br, es)");

    std::string message;
    std::string commit_msg_file;
    std::string rev_range;
    auto* check_cmd = app.add_subcommand("check", "Validate commit messages against the schema");
    auto* message_opt = check_cmd->add_option("-m,--message", message, "Commit message to validate");
    auto* file_opt = check_cmd->add_option("--commit-msg-file", commit_msg_file, "File holding the message, as given to a commit-msg hook");
    auto* range_opt = check_cmd->add_option("--rev-range", rev_range, "Revision range to validate, e.g. v1.0.0..HEAD");
    message_opt->excludes(file_opt)->excludes(range_opt);
    file_opt->excludes(range_opt);

    bool from_stdin = false;
    bool major_version_zero = false;
    std::string current_version;
    auto* bump_cmd = app.add_subcommand("bump", "Report the version increment implied by the commits");
    bump_cmd->add_option("--rev-range", rev_range, "Revision range to classify (default: all of HEAD)");
    bump_cmd->add_flag("--stdin", from_stdin, "Read messages from stdin, separated by '---' lines");
    bump_cmd->add_option("--current-version", current_version, "Current version, to print the next one");
    bump_cmd->add_flag("--major-version-zero", major_version_zero, "Breaking changes bump MINOR while at 0.x");

    bool json = false;
    auto* changelog_cmd = app.add_subcommand("changelog", "Print changelog sections for the commits");
    changelog_cmd->add_option("--rev-range", rev_range, "Revision range to include (default: all of HEAD)");
    changelog_cmd->add_flag("--stdin", from_stdin, "Read messages from stdin, separated by '---' lines");
    changelog_cmd->add_flag("--json", json, "Emit the classified commits as JSON");
    changelog_cmd->add_flag("--major-version-zero", major_version_zero, "Breaking changes bump MINOR while at 0.x");

    auto* example_cmd = app.add_subcommand("example", "Show an example commit message");
    auto* schema_cmd = app.add_subcommand("schema", "Show the commit message schema");
    auto* info_cmd = app.add_subcommand("info", "Show information about conventional commits");

    CLI11_PARSE(app, argc, argv);

    try {
        if (configure) {
            configure_app(config_path);
            return 0;
        }

        GitRepository repo;
        Config config = Config::load_from_file(config_path, repo.get_repo_root());
        major_version_zero = major_version_zero || config.major_version_zero;

        if (*example_cmd) {
            std::cout << example_message() << std::endl;
            return 0;
        }
        if (*schema_cmd) {
            std::cout << schema_text() << std::endl;
            return 0;
        }
        if (*info_cmd) {
            std::cout << read_info_document(config.info_path, config.encoding);
            return 0;
        }
        if (*check_cmd) {
            return run_check(repo, message, commit_msg_file, rev_range);
        }
        if (*bump_cmd) {
            return run_bump(collect_messages(repo, from_stdin, rev_range), current_version, major_version_zero);
        }
        if (*changelog_cmd) {
            return run_changelog(collect_messages(repo, from_stdin, rev_range), json, major_version_zero);
        }
        return run_commit(repo, config, language.empty() ? config.language : language, dry_run);
    } catch (const PromptAborted& e) {
        std::cerr << Colors::YELLOW << e.what() << Colors::RESET << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << Colors::RED << "Error: " << e.what() << Colors::RESET << std::endl;
        return 1;
    }
}
