#include "translator.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace {

const char* const BUILTIN_CATALOG = R"CATALOG(
{
  "pt-br": {
    "prefix": "Selecione o tipo de mudança que você está commitando",
    "fix": "Correção de bug. Corresponde a PATCH no SemVer",
    "feat": "Nova funcionalidade. Corresponde a MINOR no SemVer",
    "docs": "Mudanças apenas na documentação",
    "style": "Mudanças que não afetam o significado do código (espaços, formatação, ponto e vírgula, etc)",
    "refactor": "Mudança de código que não corrige bug nem adiciona funcionalidade",
    "perf": "Mudança de código que melhora o desempenho",
    "test": "Adição de testes ausentes ou correção de testes existentes",
    "build": "Mudanças no sistema de build ou em dependências externas (exemplos de escopo: pip, docker, npm)",
    "ci": "Mudanças em arquivos e scripts de configuração de CI (exemplo de escopo: GitLabCI)",
    "scope": "Qual é o escopo desta mudança? (nome da classe ou arquivo): (pressione [enter] para pular)\n",
    "subject": "Escreva um resumo curto e imperativo das mudanças: (minúsculas e sem ponto final)\n",
    "body": "Forneça informações adicionais sobre as mudanças: (use '|' para quebrar linhas, [enter] para pular)\n",
    "is_breaking_change": "Esta é uma BREAKING CHANGE? Corresponde a MAJOR no SemVer",
    "footer": "Rodapé. Informações sobre Breaking Changes e issues que este commit fecha: (pressione [enter] para pular)\n",
    "yes": "Sim",
    "no": "Não"
  },
  "es": {
    "prefix": "Seleccione el tipo de cambio que está confirmando",
    "fix": "Corrección de un error. Corresponde a PATCH en SemVer",
    "feat": "Nueva funcionalidad. Corresponde a MINOR en SemVer",
    "docs": "Cambios solo en la documentación",
    "style": "Cambios que no afectan el significado del código (espacios, formato, punto y coma, etc)",
    "refactor": "Cambio de código que no corrige un error ni añade funcionalidad",
    "perf": "Cambio de código que mejora el rendimiento",
    "test": "Añadir pruebas que faltan o corregir pruebas existentes",
    "build": "Cambios en el sistema de compilación o dependencias externas (ejemplos de alcance: pip, docker, npm)",
    "ci": "Cambios en archivos y scripts de configuración de CI (ejemplo de alcance: GitLabCI)",
    "scope": "¿Cuál es el alcance de este cambio? (nombre de clase o archivo): (pulse [enter] para omitir)\n",
    "subject": "Escriba un resumen corto e imperativo de los cambios: (en minúsculas y sin punto final)\n",
    "body": "Proporcione información adicional sobre los cambios: (use '|' para saltos de línea, [enter] para omitir)\n",
    "is_breaking_change": "¿Es un BREAKING CHANGE? Corresponde a MAJOR en SemVer",
    "footer": "Pie. Información sobre Breaking Changes e issues que cierra este commit: (pulse [enter] para omitir)\n",
    "yes": "Sí",
    "no": "No"
  }
}
)CATALOG";

std::string normalize_language(const std::string& language) {
    std::string normalized = language;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return ch == '_' ? '-' : std::tolower(ch); });
    return normalized;
}

}

Translator::Translator() {
    merge_catalog(nlohmann::json::parse(BUILTIN_CATALOG));
}

std::string Translator::translate(const std::string& english_text, const std::string& language, const std::string& key) const {
    auto lang = catalog_.find(normalize_language(language));
    if (lang == catalog_.end()) {
        return english_text;
    }
    auto entry = lang->second.find(key);
    if (entry == lang->second.end()) {
        return english_text;
    }
    return entry->second;
}

void Translator::merge_catalog(const nlohmann::json& catalog) {
    if (!catalog.is_object()) {
        throw std::runtime_error("Translation catalog must be a JSON object keyed by language");
    }
    for (const auto& [language, entries] : catalog.items()) {
        if (!entries.is_object()) {
            throw std::runtime_error("Translations for '" + language + "' must be a JSON object");
        }
        auto& table = catalog_[normalize_language(language)];
        for (const auto& [key, text] : entries.items()) {
            if (!text.is_string()) {
                throw std::runtime_error("Translation '" + language + "." + key + "' must be a string");
            }
            table[key] = text.get<std::string>();
        }
    }
}

void Translator::load_catalog(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open translation catalog: " + path);
    }
    nlohmann::json catalog;
    try {
        file >> catalog;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed translation catalog " + path + ": " + e.what());
    }
    merge_catalog(catalog);
}
