#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Languages the analyzer knows how to parse
enum class Language {
    Go,
    JavaScript,
    TypeScript,
    Python,
    Java,
    C,
    Cpp,
    Rust,
    CSharp,
    Lua,
    Php,
    Ruby,
    Swift,
    Shell,
    Unknown
};

// Detect language from the file extension (case-insensitive)
Language detectLanguage(const fs::path& filePath);

// Lowercase tag used in reports and config files ("go", "cpp", "csharp", ...)
std::string languageToString(Language language);

// Inverse of languageToString; unrecognized tags map to Language::Unknown
Language languageFromString(const std::string& tag);

// Every concrete language (Unknown excluded)
const std::vector<Language>& supportedLanguageList();
