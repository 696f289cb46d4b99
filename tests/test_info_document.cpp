/**
 * test_info_document.cpp - Unit tests for reading the info help text
 */

#include "info_document.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

fs::path write_bytes(const std::string& name, const std::string& bytes) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream file(path, std::ios::binary);
    file << bytes;
    return path;
}

bool throws_runtime_error(const std::string& path, const std::string& encoding) {
    try {
        read_info_document(path, encoding);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

}

void test_reads_bundled_document() {
    std::string info = read_info_document(std::string(CONVCOMMIT_SOURCE_DIR) + "/resources/conventional_commits_info.txt");

    assert(!info.empty());
    assert(info.find("BREAKING CHANGE") != std::string::npos);

    std::cout << "[PASS] test_reads_bundled_document\n";
}

void test_returned_verbatim() {
    fs::path path = write_bytes("convcommit_info_verbatim.txt", "line one\n\n  indented\n");
    assert(read_info_document(path.string()) == "line one\n\n  indented\n");
    fs::remove(path);

    std::cout << "[PASS] test_returned_verbatim\n";
}

void test_missing_file() {
    assert(throws_runtime_error("/nonexistent/convcommit/info.txt", "utf-8"));

    std::cout << "[PASS] test_missing_file\n";
}

void test_encodings() {
    fs::path path = write_bytes("convcommit_info_latin1.txt", "caf\xE9");

    assert(read_info_document(path.string(), "latin-1") == "caf\xC3\xA9");
    assert(read_info_document(path.string(), "ISO-8859-1") == "caf\xC3\xA9");
    assert(throws_runtime_error(path.string(), "utf-8"));
    assert(throws_runtime_error(path.string(), "ebcdic"));
    fs::remove(path);

    std::cout << "[PASS] test_encodings\n";
}

int main() {
    std::cout << "Running info document tests...\n\n";

    test_reads_bundled_document();
    test_returned_verbatim();
    test_missing_file();
    test_encodings();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
