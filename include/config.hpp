#pragma once

#include <map>
#include <string>

struct Config {
    std::string language;
    std::string encoding;
    bool major_version_zero = false;
    std::string info_path;
    std::string translations;

    // Global file first, then <repo_root>/.convcommit.conf on top when repo_root is set.
    static Config load_from_file(const std::string& path, const std::string& repo_root = "");
    void apply(const std::map<std::string, std::string>& values);
    void save_to_file(const std::string& path) const;
};

std::map<std::string, std::string> parse_config_file(const std::string& path);

void configure_app(const std::string& config_path);
