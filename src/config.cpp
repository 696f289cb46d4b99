#include "config.hpp"
#include "info_document.hpp"
#include "message_fields.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw std::runtime_error("Invalid boolean for '" + key + "': " + value);
}

}

std::map<std::string, std::string> parse_config_file(const std::string& path) {
    std::map<std::string, std::string> values;
    std::ifstream file(path);
    if (!file) return values;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq != std::string::npos) {
            std::string key = trim(line.substr(0, eq));
            std::string value = trim(line.substr(eq + 1));
            values[key] = value;
        }
    }
    return values;
}

void Config::apply(const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        if (key == "language") language = value;
        else if (key == "encoding") encoding = value;
        else if (key == "major_version_zero") major_version_zero = parse_bool(key, value);
        else if (key == "info_path") info_path = value;
        else if (key == "translations") translations = value;
    }
}

Config Config::load_from_file(const std::string& path, const std::string& repo_root) {
    Config config;
    config.language = "en";
    config.encoding = "utf-8";
    config.major_version_zero = false;
    config.info_path = default_info_path();
    config.translations = "";

    config.apply(parse_config_file(path));

    if (!repo_root.empty()) {
        std::string local_path = (std::filesystem::path(repo_root) / ".convcommit.conf").string();
        config.apply(parse_config_file(local_path));
    }

    return config;
}

void Config::save_to_file(const std::string& path) const {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    // Backup existing config if it exists
    if (std::filesystem::exists(path)) {
        std::filesystem::copy_file(path, path + ".bak", std::filesystem::copy_options::overwrite_existing);
    }
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << "# Language for interactive prompts (en, pt-br, es)\n";
    file << "language=" << language << "\n";
    file << "# Encoding of the info document (utf-8, latin-1)\n";
    file << "encoding=" << encoding << "\n";
    file << "# Breaking changes bump MINOR instead of MAJOR while the project is 0.x\n";
    file << "major_version_zero=" << (major_version_zero ? "true" : "false") << "\n";
    file << "# Location of the conventional commits help text\n";
    file << "info_path=" << info_path << "\n";
    if (!translations.empty()) {
        file << "# Extra translation catalog (JSON)\n";
        file << "translations=" << translations << "\n";
    }
}
