#include "tab2fig/process/LatexLogParser.hpp"

#include <charconv>
#include <regex>
#include <sstream>

namespace tab2fig {
namespace process {

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

// -file-line-error 形式：./table.tex:12: Undefined control sequence.
const std::regex& fileLineErrorPattern() {
    static const std::regex pattern(R"(^[^\s:]+\.tex:(\d+): (.+)$)");
    return pattern;
}

const std::regex& lineMarkerPattern() {
    static const std::regex pattern(R"(^l\.(\d+)\b.*$)");
    return pattern;
}

// 超出 int 范围的行号视为未知
std::optional<int> parseLineNumber(const std::string& digits) {
    int value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) return std::nullopt;
    return value;
}

bool isErrorStart(const std::string& line) {
    return line.rfind("! ", 0) == 0 || std::regex_match(line, fileLineErrorPattern());
}

} // namespace

std::optional<LatexError> LatexLogParser::firstError(const std::string& log) {
    const auto lines = splitLines(log);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!isErrorStart(lines[i])) continue;

        LatexError error;
        std::smatch match;
        if (std::regex_match(lines[i], match, fileLineErrorPattern())) {
            error.line = parseLineNumber(match[1].str());
            error.message = match[2].str();
        } else {
            error.message = lines[i].substr(2);
        }

        std::string block = lines[i];
        for (size_t j = i + 1; j < lines.size() && j - i < kMaxBlockLines; ++j) {
            if (lines[j].empty()) break;
            block += '\n';
            block += lines[j];
            if (std::regex_match(lines[j], match, lineMarkerPattern())) {
                if (const auto line = parseLineNumber(match[1].str())) error.line = line;
                break;
            }
        }
        error.block = block;
        return error;
    }
    return std::nullopt;
}

std::vector<std::string> LatexLogParser::errorMessages(const std::string& log, size_t max_errors) {
    std::vector<std::string> messages;
    for (const auto& line : splitLines(log)) {
        if (messages.size() >= max_errors) break;
        if (isErrorStart(line)) {
            messages.push_back(line);
        }
    }
    return messages;
}

std::string LatexLogParser::tail(const std::string& log, size_t lines) {
    const auto all = splitLines(log);
    const size_t first = all.size() > lines ? all.size() - lines : 0;
    std::string out;
    for (size_t i = first; i < all.size(); ++i) {
        if (!out.empty()) out += '\n';
        out += all[i];
    }
    return out;
}

std::string LatexLogParser::failureDetail(const std::string& log) {
    if (auto error = firstError(log)) {
        return error->block;
    }
    return tail(log);
}

}} // namespace tab2fig::process
