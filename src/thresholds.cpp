#include "thresholds.hpp"
#include <unordered_map>

namespace {

LanguageThresholds makeThresholds(ThresholdConfig cyclomatic, ThresholdConfig cognitive,
                                  ThresholdConfig functionLength, ThresholdConfig fileLength,
                                  ThresholdConfig parameterCount, ThresholdConfig nestingDepth) {
    LanguageThresholds thresholds;
    thresholds.cyclomaticComplexity = cyclomatic;
    thresholds.cognitiveComplexity = cognitive;
    thresholds.functionLength = functionLength;
    thresholds.fileLength = fileLength;
    thresholds.parameterCount = parameterCount;
    thresholds.nestingDepth = nestingDepth;
    return thresholds;
}

// Shared by C++, Rust, C# and Lua
LanguageThresholds systemsDefaults() {
    return makeThresholds({5, 10, 15, 20}, {8, 15, 25, 35}, {50, 100, 200, 300},
                          {300, 500, 1000, 1500}, {3, 5, 7, 10}, {3, 4, 5, 7});
}

const std::unordered_map<Language, LanguageThresholds>& thresholdTable() {
    static const std::unordered_map<Language, LanguageThresholds> table = {
        {Language::Go, makeThresholds({5, 10, 15, 20}, {7, 15, 25, 35}, {50, 100, 200, 300},
                                      {300, 500, 1000, 1500}, {3, 5, 7, 10}, {3, 4, 5, 7})},
        {Language::JavaScript, makeThresholds({5, 10, 20, 30}, {8, 15, 25, 40}, {50, 100, 200, 300},
                                              {250, 400, 800, 1200}, {3, 4, 6, 8}, {3, 4, 5, 7})},
        {Language::Python, makeThresholds({5, 10, 15, 20}, {7, 12, 20, 30}, {30, 50, 100, 150},
                                          {300, 500, 1000, 1500}, {3, 5, 7, 10}, {3, 5, 7, 10})},
        {Language::Java, makeThresholds({5, 10, 15, 20}, {8, 15, 25, 35}, {50, 100, 150, 250},
                                        {300, 500, 1000, 1500}, {3, 5, 7, 10}, {3, 4, 5, 7})},
        {Language::C, makeThresholds({5, 10, 15, 20}, {7, 12, 20, 30}, {40, 80, 150, 250},
                                     {300, 500, 1000, 1500}, {3, 5, 7, 10}, {3, 4, 5, 7})},
        {Language::Cpp, systemsDefaults()},
        {Language::Rust, systemsDefaults()},
        {Language::CSharp, systemsDefaults()},
        {Language::Lua, systemsDefaults()},
        {Language::Php, makeThresholds({5, 10, 15, 20}, {8, 15, 25, 35}, {50, 100, 200, 300},
                                       {300, 500, 1000, 1500}, {3, 5, 7, 10}, {3, 5, 7, 10})},
        {Language::Ruby, makeThresholds({4, 7, 12, 18}, {5, 8, 15, 25}, {20, 50, 100, 200},
                                        {250, 400, 800, 1200}, {3, 4, 6, 8}, {3, 4, 5, 7})},
        {Language::Swift, makeThresholds({5, 10, 20, 30}, {7, 12, 20, 30}, {30, 40, 100, 150},
                                         {200, 350, 600, 1000}, {3, 5, 7, 10}, {3, 4, 5, 7})},
        {Language::Shell, makeThresholds({5, 10, 15, 20}, {7, 12, 20, 30}, {30, 50, 100, 150},
                                         {200, 300, 600, 1000}, {3, 5, 7, 10}, {3, 4, 5, 7})}
    };
    return table;
}

} // namespace

const LanguageThresholds& getLanguageThresholds(Language language) {
    const auto& table = thresholdTable();
    auto it = table.find(language);
    if (it == table.end()) {
        return table.at(Language::JavaScript);
    }
    return it->second;
}
