#include "tab2fig/api/TableGenerator.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/core/Path.hpp"
#include "tab2fig/core/Sanitizer.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace tab2fig {
namespace api {

TableGenerator::TableGenerator(const theme::ThemeRegistry& registry,
                               std::shared_ptr<const latex::ITableRenderer> renderer)
    : registry_(registry), assembler_(std::move(renderer)) {}

std::string TableGenerator::resolveName(const core::Table& table, const GenerationOptions& options) {
    return core::Sanitizer::sanitizeFilename(options.filename.value_or(table.name()));
}

PreparedDocument TableGenerator::prepare(const core::Table& table, const GenerationOptions& options) const {
    table.validate();

    PreparedDocument prepared;
    prepared.name = resolveName(table, options);

    theme::StyleOverrides overrides;
    overrides.shading_color = options.shading_color;
    overrides.header_bold = options.header_bold;
    overrides.font_size = options.font_size;
    overrides.striped = options.striped;
    prepared.style = theme::StyleResolver(registry_).resolve(options.theme, overrides);

    TAB2FIG_PROGRESS(options.verbose, "Generating '{}' ({} rows x {} columns, theme '{}')", prepared.name,
                     table.rowCount(), table.columnCount(), prepared.style.theme_name);

    const core::SanitizedTable sanitized = core::Sanitizer::sanitizeTable(table);

    latex::RenderOptions render;
    render.caption = options.caption;
    render.caption_short = options.caption_short;
    render.label = options.label;
    render.longtable = options.longtable;

    latex::TableExtras extras;
    extras.cell_formats = options.cell_formats;
    extras.footnote = options.footnote;
    extras.header_groups = options.header_groups;
    extras.collapse_rows = options.collapse_rows;

    prepared.table = assembler_.assemble(sanitized, prepared.style, options.alignment, render, extras);

    latex::DocumentOptions document;
    document.document_class = options.document_class;
    document.extra_packages = options.extra_packages;
    prepared.source = document_.assemble(prepared.table, document);
    return prepared;
}

std::string TableGenerator::cacheKey(const PreparedDocument& prepared, const GenerationOptions& options) {
    const std::string settings = fmt::format("{} {}|crop={}|margin={}", options.toolchain.compiler,
                                             fmt::join(options.toolchain.compiler_args, " "),
                                             options.crop, options.crop_margin);
    return process::ArtifactCache::computeKey(prepared.source, settings);
}

std::optional<process::CompileResult> TableGenerator::restoreFromCache(
    const process::CompileRequest& request, const std::string& key,
    const process::ToolchainOptions& toolchain) const {
    process::ArtifactCache& cache = process::ArtifactCache::global();
    const auto full = cache.lookup(key, ".pdf");
    const auto cropped = request.crop ? cache.lookup(key, "_cropped.pdf") : std::nullopt;
    if (!full || (request.crop && !cropped)) {
        return std::nullopt;
    }

    process::CompileRequest source_only = request;
    source_only.compile = false;
    process::CompileResult result = process::CompileOrchestrator(toolchain).run(source_only);

    const core::Path directory = core::Path(result.source_path).parent();
    const std::string full_target = (directory / (request.name + ".pdf")).string();
    if (!cache.retrieve(*full, full_target)) {
        CORE_WARN("Cannot restore {} from cache, compiling instead", full_target);
        return std::nullopt;
    }
    result.full_artifact = full_target;
    result.state = process::CompileState::Compiled;

    if (request.crop) {
        const std::string cropped_target = (directory / (request.name + "_cropped.pdf")).string();
        if (!cache.retrieve(*cropped, cropped_target)) {
            CORE_WARN("Cannot restore {} from cache, compiling instead", cropped_target);
            return std::nullopt;
        }
        result.cropped_artifact = cropped_target;
        result.state = process::CompileState::Cropped;
    }
    result.success = true;
    return result;
}

void TableGenerator::storeInCache(const process::CompileResult& compiled, const std::string& key) {
    const bool complete = compiled.state == process::CompileState::Cropped ||
                          compiled.state == process::CompileState::Compiled;
    if (!complete) return;

    process::ArtifactCache& cache = process::ArtifactCache::global();
    cache.store(compiled.full_artifact, key, ".pdf");
    if (compiled.hasCroppedArtifact()) {
        cache.store(compiled.cropped_artifact, key, "_cropped.pdf");
    }
}

GenerationResult TableGenerator::generate(const core::Table& table, const GenerationOptions& options) const {
    const PreparedDocument prepared = prepare(table, options);

    process::CompileRequest request;
    request.output_directory = options.output_directory;
    request.name = prepared.name;
    request.source = prepared.source;
    request.compile = options.output_format != process::OutputFormat::Tex;
    request.crop = options.crop;
    request.crop_margin = options.crop_margin;
    request.verbose = options.verbose;

    const bool use_cache = options.cache && request.compile;
    const std::string key = use_cache ? cacheKey(prepared, options) : std::string();

    std::optional<process::CompileResult> cached;
    if (use_cache) {
        cached = restoreFromCache(request, key, options.toolchain);
    }

    const process::CompileOrchestrator orchestrator(options.toolchain);
    const process::CompileResult compiled = cached ? *cached : orchestrator.run(request);
    if (cached) {
        TAB2FIG_PROGRESS(options.verbose, "Using cached PDF for '{}' (key {})", prepared.name, key);
    } else if (use_cache) {
        storeInCache(compiled, key);
    }

    GenerationResult result;
    result.from_cache = cached.has_value();
    result.name = prepared.name;
    result.source_path = compiled.source_path;
    result.full_artifact = compiled.full_artifact;
    result.cropped_artifact = compiled.cropped_artifact;
    result.state = compiled.state;

    if (!request.compile) {
        result.output = compiled.source_path;
        return result;
    }

    if (compiled.state == process::CompileState::CompileFailed) {
        throw core::ExternalToolException(
            fmt::format("LaTeX compilation of '{}' failed: {}", prepared.name, compiled.error_detail),
            options.toolchain.compiler, compiled.exit_code, compiled.error_detail, compiled.error_code,
            __FILE__, __LINE__);
    }

    if (compiled.state == process::CompileState::CropFailed) {
        result.cropped_missing = true;
        result.warning = fmt::format("Cropping failed, using uncropped PDF: {}", compiled.error_detail);
        CORE_WARN("{}: {}", prepared.name, result.warning);
    }

    result.output = compiled.hasCroppedArtifact() ? compiled.cropped_artifact : compiled.full_artifact;

    if (options.output_format != process::OutputFormat::Pdf) {
        const process::FormatConverter converter(options.convert);
        result.output = converter.convert(result.output, options.output_format, compiled.source_path);
        TAB2FIG_PROGRESS(options.verbose, "Converted to {}: {}", process::toString(options.output_format),
                         result.output);
    }

    TAB2FIG_PROGRESS(options.verbose, "Table '{}' written to {}", prepared.name, result.output);
    return result;
}

GenerationResult TableGenerator::generate(const adapters::ModelSummary& summary,
                                          const GenerationOptions& options,
                                          const adapters::AdapterOptions& adapter_options,
                                          const adapters::AdapterRegistry& registry) const {
    core::Table table = registry.toTable(summary, adapter_options);
    if (table.name().empty()) table.setName(summary.type_tag);
    return generate(table, options);
}

std::vector<BatchItem> TableGenerator::generateBatch(
    const std::vector<std::pair<std::string, core::Table>>& tables,
    const GenerationOptions& options) const {
    if (tables.empty()) {
        TAB2FIG_THROW(core::InputValidationException, core::ErrorCode::EmptyTable,
                      "Batch generation requires at least one table");
    }

    TAB2FIG_PROGRESS(options.verbose, "Processing {} tables sequentially", tables.size());

    std::vector<BatchItem> items;
    items.reserve(tables.size());
    size_t index = 0;
    for (const auto& entry : tables) {
        ++index;
        BatchItem item;
        item.name = entry.first.empty() ? fmt::format("table_{}", index) : entry.first;

        GenerationOptions per_table = options;
        per_table.filename = item.name;
        TAB2FIG_PROGRESS(options.verbose, "Processing: {}", item.name);

        try {
            item.result = generate(entry.second, per_table);
        } catch (const core::Tab2FigException& e) {
            item.error = e.what();
            item.error_code = e.getErrorCode();
            CORE_WARN("Failed to process '{}': {}", item.name, e.what());
        }
        items.push_back(std::move(item));
    }

    size_t succeeded = 0;
    for (const auto& item : items) {
        if (item.ok()) ++succeeded;
    }
    TAB2FIG_PROGRESS(options.verbose, "Completed: {}/{} tables processed successfully", succeeded, items.size());
    return items;
}

}} // namespace tab2fig::api
