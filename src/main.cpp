#include "tab2fig/Tab2Fig.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace {

void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " <table.csv> [options]\n"
              << "Options:\n"
              << "  --output-dir, -o <dir>        Output directory (default: output)\n"
              << "  --filename <name>             Base name of the generated files (default: CSV file stem)\n"
              << "  --theme <name>                Theme: minimal, apa, nature, nejm (default: current/minimal)\n"
              << "  --shading <color>             Row shading color, e.g. gray!10\n"
              << "  --font-size <size>            LaTeX font size, e.g. small\n"
              << "  --no-stripes                  Disable row striping\n"
              << "  --no-bold-header              Do not bold the header row\n"
              << "  --align <spec>                Column alignment, e.g. lrr or c\n"
              << "  --caption <text>              Table caption\n"
              << "  --label <label>               LaTeX label\n"
              << "  --longtable                   Use a multi-page longtable\n"
              << "  --document-class <class>      Document class (default: article)\n"
              << "  --package <line>              Extra preamble line (repeatable)\n"
              << "  --bold-col <name>             Bold every cell of a column (repeatable)\n"
              << "  --italic-col <name>           Italicize every cell of a column (repeatable)\n"
              << "  --no-crop                     Skip pdfcrop\n"
              << "  --crop-margin <pt>            Crop margin in points (default: 10)\n"
              << "  --compiler <cmd>              LaTeX compiler (default: pdflatex)\n"
              << "  --cropper <cmd>               Crop tool (default: pdfcrop)\n"
              << "  --timeout <seconds>           Timeout for each external tool\n"
              << "  --format <pdf|png|svg|tex>    Output format (default: pdf)\n"
              << "  --cache                       Reuse previously compiled PDFs for identical input\n"
              << "  --cache-dir <dir>             Cache directory (default: <tmp>/tab2fig_cache)\n"
              << "  --delimiter <char>            CSV delimiter (default: auto-detect)\n"
              << "  --log-file <path>             Write logs to a file\n"
              << "  --verbose                     Enable progress messages\n"
              << "  --version                     Show version\n"
              << "  --help                        Show this help message\n";
}

struct CliConfig {
    std::string input;
    std::string log_file;
    std::optional<std::string> cache_dir;
    bool show_help = false;
    bool show_version = false;
    bool delimiter_set = false;
    char delimiter = ',';
    tab2fig::GenerationOptions options;
};

int parseIntStrict(const std::string& value, const std::string& flag, int min_value) {
    char* end = nullptr;
    const long parsed = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || parsed < min_value) {
        TAB2FIG_THROW(tab2fig::core::ConfigurationException, tab2fig::core::ErrorCode::InvalidArgument,
                      fmt::format("{} expects an integer >= {}, got '{}'", flag, min_value, value));
    }
    return static_cast<int>(parsed);
}

CliConfig parseArgs(int argc, char* argv[]) {
    CliConfig config;
    auto& options = config.options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                TAB2FIG_THROW(tab2fig::core::ConfigurationException, tab2fig::core::ErrorCode::InvalidArgument,
                              fmt::format("{} requires a value", arg));
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--version") {
            config.show_version = true;
        } else if (arg == "--output-dir" || arg == "-o") {
            options.output_directory = next();
        } else if (arg == "--filename") {
            options.filename = next();
        } else if (arg == "--theme") {
            options.theme = next();
        } else if (arg == "--shading") {
            options.shading_color = next();
        } else if (arg == "--font-size") {
            options.font_size = next();
        } else if (arg == "--no-stripes") {
            options.striped = false;
        } else if (arg == "--no-bold-header") {
            options.header_bold = false;
        } else if (arg == "--align") {
            options.alignment = tab2fig::latex::ColumnSpec::uniform(next());
        } else if (arg == "--caption") {
            options.caption = next();
        } else if (arg == "--label") {
            options.label = next();
        } else if (arg == "--longtable") {
            options.longtable = true;
        } else if (arg == "--document-class") {
            options.document_class = next();
        } else if (arg == "--package") {
            options.extra_packages.push_back(tab2fig::latex::PackageSpec::raw(next()));
        } else if (arg == "--bold-col") {
            options.cell_formats.push_back(tab2fig::latex::CellFormat::boldNamedColumns({next()}));
        } else if (arg == "--italic-col") {
            options.cell_formats.push_back(tab2fig::latex::CellFormat::italicNamedColumns({next()}));
        } else if (arg == "--no-crop") {
            options.crop = false;
        } else if (arg == "--crop-margin") {
            options.crop_margin = parseIntStrict(next(), arg, 0);
        } else if (arg == "--compiler") {
            options.toolchain.compiler = next();
        } else if (arg == "--cropper") {
            options.toolchain.cropper = next();
        } else if (arg == "--timeout") {
            options.toolchain.timeout = std::chrono::seconds(parseIntStrict(next(), arg, 1));
            options.convert.timeout = options.toolchain.timeout;
        } else if (arg == "--format") {
            options.output_format = tab2fig::process::parseOutputFormat(next());
        } else if (arg == "--cache") {
            options.cache = true;
        } else if (arg == "--cache-dir") {
            config.cache_dir = next();
            options.cache = true;
        } else if (arg == "--delimiter") {
            const std::string value = next();
            if (value.size() != 1) {
                TAB2FIG_THROW(tab2fig::core::ConfigurationException, tab2fig::core::ErrorCode::InvalidArgument,
                              "--delimiter expects a single character");
            }
            config.delimiter = value[0];
            config.delimiter_set = true;
        } else if (arg == "--log-file") {
            config.log_file = next();
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            TAB2FIG_THROW(tab2fig::core::ConfigurationException, tab2fig::core::ErrorCode::InvalidArgument,
                          fmt::format("Unknown option '{}'", arg));
        } else if (config.input.empty()) {
            config.input = arg;
        } else {
            TAB2FIG_THROW(tab2fig::core::ConfigurationException, tab2fig::core::ErrorCode::InvalidArgument,
                          fmt::format("Unexpected argument '{}'", arg));
        }
    }
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string prog = argc > 0 ? argv[0] : "tab2fig";

    CliConfig config;
    try {
        config = parseArgs(argc, argv);
    } catch (const tab2fig::core::Tab2FigException& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(prog);
        return 2;
    }

    if (config.show_help) {
        printUsage(prog);
        return 0;
    }
    if (config.show_version) {
        std::cout << "tab2fig " << tab2fig::getVersion() << std::endl;
        return 0;
    }
    if (config.input.empty()) {
        printUsage(prog);
        return 2;
    }

    if (!tab2fig::initialize(config.log_file, true, config.options.verbose)) {
        return 1;
    }

    int exit_code = 0;
    try {
        if (config.cache_dir) {
            tab2fig::process::ArtifactCache::global().setDirectory(config.cache_dir);
        }

        tab2fig::core::CSVOptions csv;
        csv.auto_detect_delimiter = !config.delimiter_set;
        csv.delimiter = config.delimiter;
        const tab2fig::Table table = tab2fig::core::readTableFromFile(config.input, csv);

        const tab2fig::GenerationResult result = tab2fig::generate(table, config.options);
        if (result.cropped_missing) {
            std::cerr << "Warning: " << result.warning << std::endl;
        }
        std::cout << result.output << std::endl;
    } catch (const tab2fig::core::Tab2FigException& e) {
        std::cerr << "Error: " << e.getDetailedMessage() << std::endl;
        exit_code = 1;
    }

    tab2fig::cleanup();
    return exit_code;
}
