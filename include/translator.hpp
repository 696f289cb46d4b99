#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

class Translator {
public:
    Translator();

    // Unknown language or key returns english_text untouched.
    std::string translate(const std::string& english_text, const std::string& language, const std::string& key) const;

    void merge_catalog(const nlohmann::json& catalog);
    void load_catalog(const std::string& path);

private:
    std::map<std::string, std::map<std::string, std::string>> catalog_;
};
