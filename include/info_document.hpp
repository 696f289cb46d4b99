#pragma once

#include <string>

std::string default_info_path();

// Returns the file as UTF-8. Throws std::runtime_error if it cannot be read or decoded.
std::string read_info_document(const std::string& path, const std::string& encoding = "utf-8");
