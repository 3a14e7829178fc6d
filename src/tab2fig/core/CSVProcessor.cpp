#include "tab2fig/core/CSVProcessor.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/core/Path.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace tab2fig {
namespace core {

namespace {

void trimField(std::string& field) {
    const size_t start = field.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        field.clear();
        return;
    }
    const size_t end = field.find_last_not_of(" \t\r\n");
    field = field.substr(start, end - start + 1);
}

bool isBlankRecord(const std::vector<std::string>& record) {
    return record.size() == 1 && record[0].empty();
}

} // namespace

std::vector<std::vector<std::string>> CSVProcessor::parseString(const std::string& content,
                                                                CSVParseInfo* info) const {
    std::vector<std::vector<std::string>> result;
    if (content.empty()) {
        if (info) {
            info->success = false;
            info->error_message = "Empty content";
        }
        return result;
    }

    CSVOptions options = options_;
    if (options.auto_detect_delimiter) {
        options.delimiter = detectDelimiter(content.substr(0, std::min<size_t>(content.size(), 4096)));
    }

    // 跳过 UTF-8 BOM
    size_t pos = 0;
    if (content.size() >= 3 &&
        static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB &&
        static_cast<unsigned char>(content[2]) == 0xBF) {
        pos = 3;
    }

    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;
    size_t line = 1;
    size_t quote_line = 0;

    auto finishField = [&]() {
        if (options.trim_whitespace && !field_quoted) {
            trimField(field);
        }
        record.push_back(std::move(field));
        field.clear();
        field_quoted = false;
    };
    auto finishRecord = [&]() {
        finishField();
        if (!(options.skip_empty_lines && isBlankRecord(record))) {
            result.push_back(std::move(record));
        }
        record.clear();
    };

    for (; pos < content.size(); ++pos) {
        const char c = content[pos];
        if (in_quotes) {
            if (c == options.escape_char && pos + 1 < content.size() &&
                content[pos + 1] == options.quote_char) {
                field += options.quote_char;
                ++pos;
            } else if (c == options.quote_char) {
                in_quotes = false;
            } else {
                if (c == '\n') ++line;
                field += c;
            }
        } else if (c == options.quote_char) {
            in_quotes = true;
            field_quoted = true;
            quote_line = line;
        } else if (c == options.delimiter) {
            finishField();
        } else if (c == '\r') {
            // CRLF 行尾，单独的 \r 也视为换行
            if (pos + 1 < content.size() && content[pos + 1] == '\n') ++pos;
            ++line;
            finishRecord();
        } else if (c == '\n') {
            ++line;
            finishRecord();
        } else {
            field += c;
        }
    }

    if (in_quotes) {
        TAB2FIG_THROW(InputValidationException, ErrorCode::MalformedInput,
                      fmt::format("unterminated quoted field starting on line {}", quote_line));
    }
    if (!field.empty() || field_quoted || !record.empty()) {
        finishRecord();
    }

    if (info) {
        info->success = true;
        info->rows_parsed = static_cast<int>(result.size());
        info->columns_detected = 0;
        for (const auto& row : result) {
            info->columns_detected = std::max(info->columns_detected, static_cast<int>(row.size()));
        }
        if (options.has_header && !result.empty()) {
            info->has_header_row = true;
            info->column_names = result.front();
        }
    }
    return result;
}

Table CSVProcessor::parseTable(const std::string& content, const std::string& table_name) const {
    CSVParseInfo info;
    auto records = parseString(content, &info);
    if (records.empty()) {
        TAB2FIG_THROW(InputValidationException, ErrorCode::NotTabular,
                      fmt::format("'{}' contains no tabular data", table_name));
    }

    std::vector<std::string> header;
    size_t first_data = 0;
    if (options_.has_header) {
        header = records.front();
        first_data = 1;
    } else {
        const size_t width = records.front().size();
        for (size_t i = 0; i < width; ++i) {
            header.push_back(fmt::format("V{}", i + 1));
        }
    }

    Table table(table_name, header);
    for (size_t i = first_data; i < records.size(); ++i) {
        try {
            table.addRow(std::move(records[i]));
        } catch (InputValidationException& e) {
            e.addContext(fmt::format("while reading CSV record {} of '{}'", i + 1, table_name));
            throw;
        }
    }
    table.inferNumericColumns();

    CORE_DEBUG("Parsed CSV '{}': {} columns, {} rows", table_name, table.columnCount(), table.rowCount());
    return table;
}

std::string CSVProcessor::formatRow(const std::vector<std::string>& row) const {
    std::ostringstream oss;

    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            oss << options_.delimiter;
        }

        const std::string& cell = row[i];
        const bool needs_quotes = cell.find(options_.delimiter) != std::string::npos ||
                                  cell.find(options_.quote_char) != std::string::npos ||
                                  cell.find('\n') != std::string::npos ||
                                  cell.find('\r') != std::string::npos;

        if (needs_quotes) {
            oss << options_.quote_char;
            for (char c : cell) {
                if (c == options_.quote_char) {
                    oss << options_.escape_char << options_.quote_char;
                } else {
                    oss << c;
                }
            }
            oss << options_.quote_char;
        } else {
            oss << cell;
        }
    }

    return oss.str();
}

Table readTableFromFile(const std::string& filepath, const CSVOptions& options) {
    Path path(filepath);
    std::string content;
    if (!path.isFile() || !path.readText(content)) {
        throw FilesystemException("Cannot read CSV file", filepath,
                                  ErrorCode::FileReadError, __FILE__, __LINE__);
    }

    CSVProcessor processor(options);
    return processor.parseTable(content, path.stem());
}

// 统计候选分隔符出现频率，取最高者
char detectDelimiter(const std::string& sample) {
    const char candidates[] = {',', ';', '\t', '|'};

    char best_delimiter = ',';
    long max_count = 0;
    for (char delimiter : candidates) {
        const long count = static_cast<long>(std::count(sample.begin(), sample.end(), delimiter));
        if (count > max_count) {
            max_count = count;
            best_delimiter = delimiter;
        }
    }
    return best_delimiter;
}

bool isCSVFile(const std::string& filepath) {
    const size_t dot_pos = filepath.find_last_of('.');
    if (dot_pos == std::string::npos) {
        return false;
    }

    std::string ext = filepath.substr(dot_pos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return ext == "csv" || ext == "tsv" || ext == "txt";
}

}} // namespace tab2fig::core
