#include "metrics.hpp"
#include "code_parser.hpp"
#include <algorithm>
#include <regex>
#include <unordered_map>

namespace {

const ScoreCurve DUPLICATION_CURVE{20.0, 35.0, 30.0, 15.0, 20.0};
const ThresholdConfig DUPLICATION_THRESHOLDS{5.0, 10.0, 20.0, 35.0};

struct SignatureRule {
    char symbol;
    std::regex pattern;
};

const std::vector<SignatureRule>& signatureRules() {
    static const std::vector<SignatureRule> rules = {
        {'I', std::regex(R"(^(?:if|elif|elsif|elseif)\b|^\}?\s*else\s+if\b)")},
        {'F', std::regex(R"(^(?:for|foreach)\b)")},
        {'W', std::regex(R"(^while\b)")},
        {'S', std::regex(R"(^(?:switch|match)\s*[\s(])")},
        {'C', std::regex(R"(^(?:case|when)\s+)")},
        {'R', std::regex(R"(^return\b)")},
        {'A', std::regex(R"(^(?:const|let|var)\s+\w)")}
    };
    return rules;
}

const std::regex COMPARISON_PATTERN(R"([=!<>]=)");

} // namespace

CodeDuplicationMetric::CodeDuplicationMetric()
    : Metric("code_duplication", MetricCategory::Duplication) {
}

std::string CodeDuplicationMetric::controlFlowSignature(const std::vector<std::string>& lines, int startLine,
                                                        int endLine) {
    std::string signature;
    const int first = std::max(0, startLine - 1);
    const int last = std::min(endLine, static_cast<int>(lines.size()));

    for (int i = first; i < last; ++i) {
        const std::string trimmed = parser_utils::trim(lines[i]);
        if (trimmed.empty()) {
            continue;
        }

        char symbol = 0;
        for (const auto& rule : signatureRules()) {
            if (parser_utils::searchLine(rule.pattern, trimmed)) {
                symbol = rule.symbol;
                break;
            }
        }
        // Plain assignment, not a comparison
        if (!symbol && trimmed.find('=') != std::string::npos &&
            !parser_utils::searchLine(COMPARISON_PATTERN, trimmed)) {
            symbol = 'A';
        }
        if (symbol) {
            signature += symbol;
        }
    }
    return signature;
}

MetricResult CodeDuplicationMetric::calculate(const ParseResult& parseResult) const {
    const auto& functions = parseResult.functions;
    if (functions.size() < 3 || !parseResult.content) {
        return neutralResult(0.0, "Not enough functions to compare");
    }

    const auto lines = parser_utils::splitLines(*parseResult.content);

    // Groups keep first-seen order
    std::unordered_map<std::string, size_t> groupIndex;
    std::vector<std::vector<const FunctionInfo*>> groups;
    for (const auto& fn : functions) {
        std::string signature = controlFlowSignature(lines, fn.startLine, fn.endLine);
        if (signature.size() < MIN_SIGNATURE_LENGTH) {
            continue;
        }
        auto it = groupIndex.find(signature);
        if (it == groupIndex.end()) {
            groupIndex.emplace(signature, groups.size());
            groups.push_back({&fn});
        } else {
            groups[it->second].push_back(&fn);
        }
    }

    MetricResult result = makeResult();
    int duplicateCount = 0;
    for (const auto& group : groups) {
        if (group.size() < 2) {
            continue;
        }
        duplicateCount += static_cast<int>(group.size()) - 1;

        std::string names;
        for (const auto* fn : group) {
            if (!names.empty()) {
                names += ", ";
            }
            names += fn->name;
        }
        result.locations.push_back({parseResult.filePath, group.front()->startLine, group.front()->name,
                                    "Duplicate pattern: " + names});
    }

    const double percent = static_cast<double>(duplicateCount) / functions.size() * 100.0;
    result.value = percent;
    result.normalizedScore = roundScore(scoreOnCurve(percent, DUPLICATION_THRESHOLDS, DUPLICATION_CURVE));
    result.severity = severityFor(percent, DUPLICATION_THRESHOLDS);
    result.details = formatDecimal(percent) + "% duplicated (" + std::to_string(duplicateCount) + " of " +
                     std::to_string(functions.size()) + " functions)";
    return result;
}
