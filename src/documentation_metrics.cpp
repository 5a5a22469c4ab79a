#include "metrics.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_map>

namespace {

constexpr double MIN_OPTIMAL = 10.0;
constexpr double MAX_OPTIMAL = 25.0;
constexpr double MIN_ACCEPTABLE = 5.0;
constexpr double MAX_ACCEPTABLE = 40.0;
constexpr size_t MAX_NAMING_LOCATIONS = 10;

enum class NamingStyle { Camel, Pascal, Snake, UpperSnake };

const std::regex& stylePattern(NamingStyle style) {
    static const std::regex camel(R"(^[a-z][a-zA-Z0-9]*$)");
    static const std::regex pascal(R"(^[A-Z][a-zA-Z0-9]*$)");
    static const std::regex snake(R"(^[a-z][a-z0-9_]*$)");
    static const std::regex upperSnake(R"(^[A-Z][A-Z0-9_]*$)");
    switch (style) {
        case NamingStyle::Camel: return camel;
        case NamingStyle::Pascal: return pascal;
        case NamingStyle::Snake: return snake;
        case NamingStyle::UpperSnake: return upperSnake;
    }
    return camel;
}

const char* styleName(NamingStyle style) {
    switch (style) {
        case NamingStyle::Camel: return "camelCase";
        case NamingStyle::Pascal: return "PascalCase";
        case NamingStyle::Snake: return "snake_case";
        case NamingStyle::UpperSnake: return "UPPER_SNAKE_CASE";
    }
    return "camelCase";
}

const std::vector<NamingStyle>& functionStyles(Language language) {
    using S = NamingStyle;
    static const std::unordered_map<Language, std::vector<NamingStyle>> rules = {
        {Language::Go, {S::Pascal, S::Camel}},
        {Language::JavaScript, {S::Camel, S::Pascal}},
        {Language::TypeScript, {S::Camel, S::Pascal}},
        {Language::Python, {S::Snake}},
        {Language::Java, {S::Camel}},
        {Language::C, {S::Snake, S::Camel}},
        {Language::Cpp, {S::Camel, S::Snake, S::Pascal}},
        {Language::Rust, {S::Snake}},
        {Language::CSharp, {S::Pascal}},
        {Language::Lua, {S::Camel, S::Snake}},
        {Language::Php, {S::Camel, S::Snake}},
        {Language::Ruby, {S::Snake}},
        {Language::Swift, {S::Camel}},
        {Language::Shell, {S::Snake}},
        {Language::Unknown, {S::Camel, S::Snake, S::Pascal}}
    };
    auto it = rules.find(language);
    return it != rules.end() ? it->second : rules.at(Language::Unknown);
}

// Strip qualifiers and decorations that are not part of the naming style:
// "M.foo" -> "foo", "~Widget" -> "Widget", "valid?" -> "valid", "__init__" -> "init__".
// Empty when what remains is not a plain identifier (operators, shell names with '-').
std::string normalizeName(const std::string& raw) {
    std::string name = raw;
    size_t qualifier = name.find_last_of(".:");
    if (qualifier != std::string::npos) {
        name = name.substr(qualifier + 1);
    }
    while (!name.empty() && (name.front() == '~' || name.front() == '_' || name.front() == '$')) {
        name.erase(name.begin());
    }
    while (!name.empty() && (name.back() == '?' || name.back() == '!' || name.back() == '=')) {
        name.pop_back();
    }
    bool plain = !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '_';
    });
    return plain ? name : std::string();
}

} // namespace

CommentRatioMetric::CommentRatioMetric()
    : Metric("comment_ratio", MetricCategory::Documentation) {
}

MetricResult CommentRatioMetric::calculate(const ParseResult& parseResult) const {
    if (parseResult.codeLines == 0) {
        return neutralResult(0.0, "No code lines");
    }

    const double ratio = static_cast<double>(parseResult.commentLines) / parseResult.codeLines * 100.0;

    double score;
    if (ratio >= MIN_OPTIMAL && ratio <= MAX_OPTIMAL) {
        score = 100.0;
    } else if (ratio < MIN_OPTIMAL) {
        if (ratio >= MIN_ACCEPTABLE) {
            score = 70.0 + (ratio - MIN_ACCEPTABLE) / (MIN_OPTIMAL - MIN_ACCEPTABLE) * 30.0;
        } else {
            score = std::max(0.0, ratio * 14.0);
        }
    } else if (ratio <= MAX_ACCEPTABLE) {
        score = 100.0 - (ratio - MAX_OPTIMAL) / (MAX_ACCEPTABLE - MAX_OPTIMAL) * 40.0;
    } else {
        score = std::max(0.0, 60.0 - (ratio - MAX_ACCEPTABLE) * 1.5);
    }

    MetricResult result = makeResult();
    result.value = ratio;
    result.normalizedScore = roundScore(score);
    if (ratio >= MIN_OPTIMAL && ratio <= MAX_OPTIMAL) {
        result.severity = Severity::Info;
    } else if (ratio >= MIN_ACCEPTABLE && ratio <= MAX_ACCEPTABLE) {
        result.severity = Severity::Warning;
    } else {
        result.severity = Severity::Error;
    }
    result.details = formatDecimal(ratio) + "% (" + std::to_string(parseResult.commentLines) + " comment / " +
                     std::to_string(parseResult.codeLines) + " code lines)";
    return result;
}

NamingConventionMetric::NamingConventionMetric(Language language)
    : Metric("naming_convention", MetricCategory::Naming), language_(language) {
}

MetricResult NamingConventionMetric::calculate(const ParseResult& parseResult) const {
    const auto& styles = functionStyles(language_);
    std::string allowed;
    for (auto style : styles) {
        if (!allowed.empty()) {
            allowed += "/";
        }
        allowed += styleName(style);
    }

    MetricResult result = makeResult();
    int total = 0;
    int violations = 0;

    for (const auto& fn : parseResult.functions) {
        const std::string name = normalizeName(fn.name);
        if (name.empty()) {
            continue;
        }
        ++total;
        bool matches = std::any_of(styles.begin(), styles.end(), [&](NamingStyle style) {
            return std::regex_match(name, stylePattern(style));
        });
        if (!matches) {
            ++violations;
            result.locations.push_back({parseResult.filePath, fn.startLine, fn.name,
                                        "\"" + fn.name + "\" - " + allowed});
        }
    }

    // Types are PascalCase in every language
    for (const auto& cls : parseResult.classes) {
        const std::string name = normalizeName(cls.name);
        if (name.empty()) {
            continue;
        }
        ++total;
        if (!std::regex_match(name, stylePattern(NamingStyle::Pascal))) {
            ++violations;
            result.locations.push_back({parseResult.filePath, cls.startLine, "", "\"" + cls.name + "\" - PascalCase"});
        }
    }

    if (total == 0) {
        return neutralResult(100.0, "No violations");
    }
    if (result.locations.size() > MAX_NAMING_LOCATIONS) {
        result.locations.resize(MAX_NAMING_LOCATIONS);
    }

    const double compliance = static_cast<double>(total - violations) / total * 100.0;
    result.value = compliance;
    result.normalizedScore = roundScore(compliance);
    if (compliance >= 90.0) {
        result.severity = Severity::Info;
    } else if (compliance >= 70.0) {
        result.severity = Severity::Warning;
    } else if (compliance >= 50.0) {
        result.severity = Severity::Error;
    } else {
        result.severity = Severity::Critical;
    }
    result.details = violations > 0 ? std::to_string(violations) + " violations" : "No violations";
    return result;
}
