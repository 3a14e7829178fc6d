#include "tab2fig/latex/ColumnSpec.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <regex>

namespace tab2fig {
namespace latex {

using core::ConfigurationException;
using core::ErrorCode;

namespace {

const std::regex& tableFormatPattern() {
    static const std::regex pattern(R"(^\d+(\.\d+)?$)");
    return pattern;
}

const std::regex& decimalTokenPattern() {
    static const std::regex pattern(R"(^S(\[[^\]]*\])?$)");
    return pattern;
}

const std::regex& plainTokenPattern() {
    static const std::regex pattern(R"(^([lcrX]|[pmb]\{[^{}]+\})$)");
    return pattern;
}

void appendUnique(std::vector<std::string>& out, const std::vector<std::string>& items) {
    for (const auto& item : items) {
        if (std::find(out.begin(), out.end(), item) == out.end()) {
            out.push_back(item);
        }
    }
}

// 单个记号转换为列指令，并记录是否为 S 列
std::string resolveToken(const std::string& token, bool& is_decimal) {
    if (isDecimalToken(token)) {
        is_decimal = true;
        return token;
    }
    is_decimal = false;
    if (!std::regex_match(token, plainTokenPattern())) {
        TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidColumnToken,
                      fmt::format("invalid column alignment token '{}'", token));
    }
    return token;
}

bool isLcrString(const std::string& token) {
    return !token.empty() &&
           token.find_first_not_of("lcr") == std::string::npos;
}

} // namespace

// ========== DecimalColumn ==========

DecimalColumn::DecimalColumn(const std::string& table_format)
    : table_format_(table_format) {
    if (!std::regex_match(table_format_, tableFormatPattern())) {
        TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidColumnToken,
                      fmt::format("invalid table-format '{}': expected <integers>.<decimals>", table_format_));
    }
}

DecimalColumn DecimalColumn::decimal(int integers, int decimals) {
    if (integers < 0 || decimals < 0) {
        TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidColumnToken,
                      fmt::format("decimal column digits must be non-negative (got {}.{})", integers, decimals));
    }
    return DecimalColumn(fmt::format("{}.{}", integers, decimals));
}

DecimalColumn& DecimalColumn::setRounding(RoundMode mode, int precision) {
    if (mode != RoundMode::None && precision < 0) {
        TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidColumnToken,
                      fmt::format("round precision must be non-negative (got {})", precision));
    }
    round_mode_ = mode;
    round_precision_ = precision;
    return *this;
}

std::string DecimalColumn::toDirective() const {
    std::vector<std::string> opts;
    opts.push_back("table-format=" + table_format_);
    if (round_mode_ != RoundMode::None) {
        opts.push_back(round_mode_ == RoundMode::Places ? "round-mode=places" : "round-mode=figures");
        opts.push_back(fmt::format("round-precision={}", round_precision_));
    }
    if (detect_weight_) {
        opts.push_back("detect-weight=true");
        opts.push_back("mode=text");
    }
    if (group_separator_) {
        opts.push_back("group-separator={" + *group_separator_ + "}");
    }
    return fmt::format("S[{}]", fmt::join(opts, ","));
}

const std::vector<std::string>& DecimalColumn::requiredPackages() {
    static const std::vector<std::string> packages = {
        "\\usepackage{siunitx}",
        "\\sisetup{detect-all}"
    };
    return packages;
}

bool DecimalColumn::operator==(const DecimalColumn& other) const {
    return toDirective() == other.toDirective();
}

// ========== ColumnSpec ==========

ColumnSpec::ColumnSpec(std::initializer_list<ColumnDirective> directives)
    : kind_(Kind::PerColumn), directives_(directives) {
}

ColumnSpec ColumnSpec::uniform(const std::string& token) {
    ColumnSpec spec;
    spec.kind_ = Kind::Uniform;
    spec.uniform_ = token;
    return spec;
}

ColumnSpec ColumnSpec::perColumn(std::vector<ColumnDirective> directives) {
    ColumnSpec spec;
    spec.kind_ = Kind::PerColumn;
    spec.directives_ = std::move(directives);
    return spec;
}

// ========== 布局 ==========

bool isDecimalToken(const std::string& token) {
    return std::regex_match(token, decimalTokenPattern());
}

std::vector<size_t> detectDecimalColumns(const ColumnSpec& spec) {
    std::vector<size_t> positions;
    if (spec.kind() != ColumnSpec::Kind::PerColumn) {
        return positions;
    }
    const auto& directives = spec.directives();
    for (size_t i = 0; i < directives.size(); ++i) {
        const auto& d = directives[i];
        if (std::holds_alternative<DecimalColumn>(d) ||
            isDecimalToken(std::get<std::string>(d))) {
            positions.push_back(i + 1);
        }
    }
    return positions;
}

ColumnLayout buildLayout(const ColumnSpec& spec, size_t column_count,
                         const std::vector<bool>& numeric) {
    ColumnLayout layout;
    layout.directives.reserve(column_count);

    switch (spec.kind()) {
    case ColumnSpec::Kind::Default:
        for (size_t i = 0; i < column_count; ++i) {
            const bool is_numeric = i < numeric.size() && numeric[i];
            layout.directives.push_back(is_numeric ? "r" : "l");
        }
        break;

    case ColumnSpec::Kind::Uniform: {
        const std::string& token = spec.uniformToken();
        if (isLcrString(token) && token.size() > 1) {
            // "lcr" 形式的多字母串逐列拆分
            if (token.size() != column_count) {
                TAB2FIG_THROW(ConfigurationException, ErrorCode::ColumnSpecMismatch,
                              fmt::format("alignment '{}' has {} columns but the table has {}",
                                          token, token.size(), column_count));
            }
            for (char c : token) {
                layout.directives.emplace_back(1, c);
            }
        } else {
            bool is_decimal = false;
            const std::string directive = resolveToken(token, is_decimal);
            for (size_t i = 0; i < column_count; ++i) {
                layout.directives.push_back(directive);
                if (is_decimal) {
                    layout.protected_columns.push_back(i + 1);
                }
            }
            if (is_decimal) {
                appendUnique(layout.packages, DecimalColumn::requiredPackages());
            }
        }
        break;
    }

    case ColumnSpec::Kind::PerColumn: {
        const auto& directives = spec.directives();
        if (directives.size() != column_count) {
            TAB2FIG_THROW(ConfigurationException, ErrorCode::ColumnSpecMismatch,
                          fmt::format("alignment specifies {} columns but the table has {}",
                                      directives.size(), column_count));
        }
        for (size_t i = 0; i < directives.size(); ++i) {
            if (const auto* dec = std::get_if<DecimalColumn>(&directives[i])) {
                layout.directives.push_back(dec->toDirective());
                layout.protected_columns.push_back(i + 1);
                appendUnique(layout.packages, DecimalColumn::requiredPackages());
                continue;
            }
            bool is_decimal = false;
            layout.directives.push_back(resolveToken(std::get<std::string>(directives[i]), is_decimal));
            if (is_decimal) {
                layout.protected_columns.push_back(i + 1);
                appendUnique(layout.packages, DecimalColumn::requiredPackages());
            }
        }
        break;
    }
    }

    for (const auto& d : layout.directives) {
        layout.preamble += d;
    }

    LATEX_DEBUG("Column layout '{}' ({} protected column(s))",
                layout.preamble, layout.protected_columns.size());
    return layout;
}

}} // namespace tab2fig::latex
