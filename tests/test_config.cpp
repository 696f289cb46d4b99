/**
 * test_config.cpp - Unit tests for configuration loading
 */

#include "config.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

fs::path make_test_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("convcommit_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

}

void test_defaults() {
    Config blank;
    assert(!blank.major_version_zero);

    fs::path dir = make_test_dir("defaults");
    Config config = Config::load_from_file((dir / "missing.txt").string());

    assert(config.language == "en");
    assert(config.encoding == "utf-8");
    assert(!config.major_version_zero);
    assert(!config.info_path.empty());
    assert(config.translations.empty());

    fs::remove_all(dir);
    std::cout << "[PASS] test_defaults\n";
}

void test_parse_config_file() {
    fs::path dir = make_test_dir("parse");
    write_file(dir / "config.txt",
               "# comment line\n"
               "\n"
               "language = es\n"
               "encoding=latin-1\n"
               "not a setting\n");

    auto values = parse_config_file((dir / "config.txt").string());
    assert(values.size() == 2);
    assert(values["language"] == "es");
    assert(values["encoding"] == "latin-1");

    fs::remove_all(dir);
    std::cout << "[PASS] test_parse_config_file\n";
}

void test_local_overrides_global() {
    fs::path dir = make_test_dir("override");
    fs::path repo = dir / "repo";
    fs::create_directories(repo);
    write_file(dir / "config.txt", "language=es\nmajor_version_zero=true\n");
    write_file(repo / ".convcommit.conf", "language=pt-br\n");

    Config config = Config::load_from_file((dir / "config.txt").string(), repo.string());
    assert(config.language == "pt-br");
    assert(config.major_version_zero);

    fs::remove_all(dir);
    std::cout << "[PASS] test_local_overrides_global\n";
}

void test_invalid_boolean() {
    fs::path dir = make_test_dir("bool");
    write_file(dir / "config.txt", "major_version_zero=maybe\n");

    bool thrown = false;
    try {
        Config::load_from_file((dir / "config.txt").string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    fs::remove_all(dir);
    std::cout << "[PASS] test_invalid_boolean\n";
}

void test_save_and_reload() {
    fs::path dir = make_test_dir("save");
    std::string path = (dir / "nested" / "config.txt").string();

    Config config = Config::load_from_file(path);
    config.language = "es";
    config.major_version_zero = true;
    config.save_to_file(path);
    assert(!fs::exists(path + ".bak"));

    Config reloaded = Config::load_from_file(path);
    assert(reloaded.language == "es");
    assert(reloaded.major_version_zero);

    reloaded.language = "en";
    reloaded.save_to_file(path);
    assert(fs::exists(path + ".bak"));
    assert(Config::load_from_file(path + ".bak").language == "es");
    assert(Config::load_from_file(path).language == "en");

    fs::remove_all(dir);
    std::cout << "[PASS] test_save_and_reload\n";
}

int main() {
    std::cout << "Running config tests...\n\n";

    test_defaults();
    test_parse_config_file();
    test_local_overrides_global();
    test_invalid_boolean();
    test_save_and_reload();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
