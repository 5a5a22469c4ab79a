#include "language.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace {

const std::unordered_map<std::string, Language>& extensionMap() {
    static const std::unordered_map<std::string, Language> extensions = {
        {".go", Language::Go},
        {".js", Language::JavaScript}, {".mjs", Language::JavaScript},
        {".cjs", Language::JavaScript}, {".jsx", Language::JavaScript},
        {".ts", Language::TypeScript}, {".mts", Language::TypeScript},
        {".cts", Language::TypeScript}, {".tsx", Language::TypeScript},
        {".py", Language::Python}, {".pyw", Language::Python},
        {".java", Language::Java},
        {".c", Language::C}, {".h", Language::C},
        {".cpp", Language::Cpp}, {".cc", Language::Cpp}, {".cxx", Language::Cpp},
        {".hpp", Language::Cpp}, {".hxx", Language::Cpp},
        {".rs", Language::Rust},
        {".cs", Language::CSharp},
        {".lua", Language::Lua},
        {".php", Language::Php},
        {".rb", Language::Ruby},
        {".swift", Language::Swift},
        {".sh", Language::Shell}, {".bash", Language::Shell}
    };
    return extensions;
}

} // namespace

Language detectLanguage(const fs::path& filePath) {
    std::string ext = filePath.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& extensions = extensionMap();
    auto it = extensions.find(ext);
    if (it == extensions.end()) {
        return Language::Unknown;
    }
    return it->second;
}

std::string languageToString(Language language) {
    switch (language) {
        case Language::Go: return "go";
        case Language::JavaScript: return "javascript";
        case Language::TypeScript: return "typescript";
        case Language::Python: return "python";
        case Language::Java: return "java";
        case Language::C: return "c";
        case Language::Cpp: return "cpp";
        case Language::Rust: return "rust";
        case Language::CSharp: return "csharp";
        case Language::Lua: return "lua";
        case Language::Php: return "php";
        case Language::Ruby: return "ruby";
        case Language::Swift: return "swift";
        case Language::Shell: return "shell";
        case Language::Unknown:
        default:
            return "unknown";
    }
}

Language languageFromString(const std::string& tag) {
    for (Language language : supportedLanguageList()) {
        if (languageToString(language) == tag) {
            return language;
        }
    }
    return Language::Unknown;
}

const std::vector<Language>& supportedLanguageList() {
    static const std::vector<Language> languages = {
        Language::Go, Language::JavaScript, Language::TypeScript, Language::Python,
        Language::Java, Language::C, Language::Cpp, Language::Rust, Language::CSharp,
        Language::Lua, Language::Php, Language::Ruby, Language::Swift, Language::Shell
    };
    return languages;
}
