#include "formula_exporter.hpp"
#include "classic_algorithms.hpp"
#include "pipeline_generator.hpp"
#include "variation_expander.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using ordered_json = nlohmann::ordered_json;

namespace formula_exporter {

using component_catalog::Component;
using component_catalog::ComponentCatalog;

namespace {

const std::vector<std::string> kComponentColumns = {
    "category",         "name",           "formula_latex",   "formula_ascii",
    "description",      "parameters",     "parameter_values", "complexity_time",
    "complexity_space", "pipeline_stages", "is_lossless",     "prerequisites"};

const std::vector<std::string> kClassicColumns = {
    "algorithm_name",        "pipeline_components",    "pipeline_formula", "combined_description",
    "total_time_complexity", "total_space_complexity", "num_stages"};

const std::vector<std::string> kPipelineColumns = {
    "pipeline_id",           "pipeline_name",          "pipeline_components", "pipeline_formula",
    "total_time_complexity", "total_space_complexity", "num_stages",          "all_lossless"};

std::string bool_field(bool value) {
    return value ? "True" : "False";
}

std::ofstream open_csv(const fs::path& path, const std::vector<std::string>& header) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw ExportError("Could not open output file " + path.string());
    }
    out << csv_row(header);
    return out;
}

void finish_csv(std::ofstream& out, const fs::path& path) {
    out.close();
    if (out.fail()) {
        throw ExportError("Failed writing " + path.string());
    }
}

std::string names_json(const std::vector<std::string>& names) {
    return ordered_json(names).dump();
}

size_t write_components(const ComponentCatalog& catalog, const fs::path& path) {
    std::ofstream out = open_csv(path, kComponentColumns);
    size_t rows = 0;
    for (const auto& comp : catalog.components()) {
        ordered_json parameters = ordered_json::object();
        for (const auto& [symbol, meaning] : comp.parameters) parameters[symbol] = meaning;
        ordered_json stages = ordered_json::array();
        for (auto stage : comp.valid_stages) stages.push_back(static_cast<int>(stage));

        for (const auto& variation : component_catalog::expand(comp)) {
            ordered_json values = ordered_json::object();
            for (const auto& [param, value] : variation.configuration) {
                values[param] = ordered_json(component_catalog::export_value(value));
            }
            out << csv_row({component_catalog::to_string(comp.category), comp.name, comp.formula_latex,
                            comp.formula_ascii, comp.description, parameters.dump(), values.dump(),
                            comp.time_cost, comp.space_cost, stages.dump(), bool_field(comp.lossless),
                            names_json(comp.prerequisites)});
            ++rows;
        }
    }
    finish_csv(out, path);
    return rows;
}

size_t write_classics(const ComponentCatalog& catalog, const fs::path& path) {
    std::ofstream out = open_csv(path, kClassicColumns);
    size_t rows = 0;
    for (const auto& binding : pipeline_generator::default_classic_bindings()) {
        auto resolved = pipeline_generator::resolve(catalog, binding);
        if (resolved.empty()) {
            std::cerr << "[classic] " << binding.algorithm << ": no components resolved, skipped\n";
            continue;
        }
        out << csv_row({binding.algorithm, names_json(binding.component_names), resolved.formula(),
                        resolved.combined_description(), resolved.total_time_cost(),
                        resolved.total_space_cost(), std::to_string(resolved.components.size())});
        ++rows;
    }
    finish_csv(out, path);
    return rows;
}

size_t write_pipelines(const ComponentCatalog& catalog, const pipeline_grammar::StageGrammar& grammar,
                       const GeneratorConfig& config, const fs::path& path) {
    std::vector<std::string> header = kPipelineColumns;
    if (config.include_parameters) header.push_back("parameter_space");
    std::ofstream out = open_csv(path, header);

    pipeline_generator::PipelineGenerator generator(catalog, grammar);
    size_t rows = 0;
    generator.for_each(config.generator_options(), [&](const pipeline_generator::Pipeline& pipeline) {
        ++rows;
        std::vector<std::string> fields = {std::to_string(rows),
                                           pipeline.display_name(),
                                           names_json(pipeline.names()),
                                           pipeline.formula(),
                                           pipeline.total_time_cost(),
                                           pipeline.total_space_cost(),
                                           std::to_string(pipeline.size()),
                                           bool_field(pipeline.all_lossless())};
        if (config.include_parameters) fields.push_back(std::to_string(pipeline.parameter_space()));
        out << csv_row(fields);
        if (config.verbose && rows % 100000 == 0) {
            std::cout << "[exporter] " << rows << " pipelines written\n";
        }
        return true;
    });
    finish_csv(out, path);
    return rows;
}

} // namespace

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string csv_row(const std::vector<std::string>& fields) {
    std::string row;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) row += ',';
        row += csv_field(fields[i]);
    }
    row += "\r\n";
    return row;
}

std::string utc_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

ExportResult export_to_csv(const ComponentCatalog& catalog, const GeneratorConfig& config,
                           const pipeline_grammar::StageGrammar& grammar) {
    // Bad depth bounds must fail before any file is touched.
    if (config.include_pipelines) pipeline_generator::check_options(config.generator_options());

    fs::path output_dir(config.output_dir);
    try {
        fs::create_directories(output_dir);
    } catch (const fs::filesystem_error& e) {
        throw ExportError("Could not create output directory " + output_dir.string() + ": " + e.what());
    }

    ExportResult result;

    fs::path components_file = output_dir / "compression_components.csv";
    result.component_rows = write_components(catalog, components_file);
    result.outputs["components"] = components_file.string();
    if (config.verbose) {
        std::cout << "[exporter] " << result.component_rows << " component variations -> " << components_file.string()
                  << "\n";
    }

    fs::path classics_file = output_dir / "classic_algorithms.csv";
    result.classic_rows = write_classics(catalog, classics_file);
    result.outputs["classics"] = classics_file.string();
    if (config.verbose) {
        std::cout << "[exporter] " << result.classic_rows << " classic algorithms -> " << classics_file.string()
                  << "\n";
    }

    if (config.include_pipelines) {
        fs::path pipelines_file = output_dir / "pipeline_combinations.csv";
        result.pipeline_rows = write_pipelines(catalog, grammar, config, pipelines_file);
        result.outputs["pipelines"] = pipelines_file.string();
        if (config.verbose) {
            std::cout << "[exporter] " << result.pipeline_rows << " pipelines -> " << pipelines_file.string() << "\n";
        }
    }

    std::string categories;
    for (auto category : component_catalog::kAllCategories) {
        if (!categories.empty()) categories += ", ";
        categories += component_catalog::to_string(category);
    }

    fs::path summary_file = output_dir / "generation_summary.csv";
    std::ofstream summary = open_csv(summary_file, {"metric", "value", "description"});
    summary << csv_row({"total_components", std::to_string(catalog.size()),
                        "Number of unique compression components"});
    summary << csv_row({"total_component_variations", std::to_string(result.component_rows),
                        "Components × parameter variations"});
    summary << csv_row({"classic_algorithms", std::to_string(result.classic_rows),
                        "Well-known algorithm pipelines"});
    summary << csv_row({"generated_pipelines", std::to_string(result.pipeline_rows),
                        "Valid pipeline combinations (depth ≤ " + std::to_string(config.max_depth) + ")"});
    summary << csv_row({"generation_timestamp", utc_timestamp(), "UTC timestamp of generation"});
    summary << csv_row({"categories", categories, "Component categories in taxonomy"});
    finish_csv(summary, summary_file);
    result.outputs["summary"] = summary_file.string();

    return result;
}

CatalogStats collect_stats(const ComponentCatalog& catalog) {
    CatalogStats stats;
    stats.unique_components = catalog.size();
    stats.categories = component_catalog::kAllCategories.size();
    auto counts = catalog.count_by_category();
    for (auto category : component_catalog::kAllCategories) {
        auto it = counts.find(category);
        stats.by_category.emplace_back(category, it == counts.end() ? 0 : it->second);
    }
    return stats;
}

} // namespace formula_exporter
