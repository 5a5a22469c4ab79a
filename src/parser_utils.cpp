#include "code_parser.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace parser_utils {

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, end - start));
        start = end + 1;
    }

    // Drop carriage returns from CRLF input
    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    }
    return lines;
}

std::string trim(const std::string& text) {
    auto begin = std::find_if(text.begin(), text.end(),
                              [](unsigned char ch) { return !std::isspace(ch); });
    auto end = std::find_if(text.rbegin(), text.rend(),
                            [](unsigned char ch) { return !std::isspace(ch); }).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

size_t indentOf(const std::string& line) {
    size_t indent = 0;
    while (indent < line.size() && std::isspace(static_cast<unsigned char>(line[indent]))) {
        ++indent;
    }
    return indent;
}

int countParameters(const std::string& line) {
    size_t open = line.find('(');
    if (open == std::string::npos) {
        return 0;
    }
    size_t close = line.find(')', open + 1);
    if (close == std::string::npos) {
        return 0;
    }

    const std::string inner = trim(line.substr(open + 1, close - open - 1));
    if (inner.empty()) {
        return 0;
    }
    return static_cast<int>(std::count(inner.begin(), inner.end(), ',')) + 1;
}

bool searchLine(const std::regex& pattern, const std::string& line, std::smatch* match) {
    if (line.size() > MAX_REGEX_LINE_LENGTH) {
        return false;
    }
    if (match) {
        return std::regex_search(line, *match, pattern);
    }
    return std::regex_search(line, pattern);
}

int countMatches(const std::regex& pattern, const std::string& line) {
    if (line.size() > MAX_REGEX_LINE_LENGTH) {
        return 0;
    }
    auto begin = std::sregex_iterator(line.begin(), line.end(), pattern);
    return static_cast<int>(std::distance(begin, std::sregex_iterator()));
}

std::string escapeRegex(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char ch : text) {
        if (special.find(ch) != std::string::npos) {
            escaped += '\\';
        }
        escaped += ch;
    }
    return escaped;
}

} // namespace parser_utils
