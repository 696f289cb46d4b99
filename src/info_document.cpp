#include "info_document.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#ifndef CONVCOMMIT_DATA_DIR
#define CONVCOMMIT_DATA_DIR "share/convcommit"
#endif

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) { return std::tolower(ch); });
    return s;
}

bool is_valid_utf8(const std::string& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char c = bytes[i];
        size_t length;
        if (c < 0x80) length = 1;
        else if ((c >> 5) == 0x6) length = 2;
        else if ((c >> 4) == 0xE) length = 3;
        else if ((c >> 3) == 0x1E) length = 4;
        else return false;

        if (i + length > bytes.size()) return false;
        for (size_t k = 1; k < length; ++k) {
            if ((static_cast<unsigned char>(bytes[i + k]) >> 6) != 0x2) return false;
        }
        i += length;
    }
    return true;
}

std::string latin1_to_utf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (unsigned char c : bytes) {
        if (c < 0x80) {
            out += static_cast<char>(c);
        } else {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

}

std::string default_info_path() {
    return std::string(CONVCOMMIT_DATA_DIR) + "/conventional_commits_info.txt";
}

std::string read_info_document(const std::string& path, const std::string& encoding) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open info document: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    std::string enc = lower(encoding);
    if (enc == "utf-8" || enc == "utf8") {
        if (!is_valid_utf8(content)) {
            throw std::runtime_error("Info document is not valid UTF-8: " + path);
        }
        return content;
    }
    if (enc == "latin-1" || enc == "latin1" || enc == "iso-8859-1") {
        return latin1_to_utf8(content);
    }
    throw std::runtime_error("Unsupported encoding '" + encoding + "'");
}
