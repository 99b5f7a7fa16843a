#include "formula_console.hpp"
#include "formula_exporter.hpp"
#include "generator_config.hpp"
#include <cxxopts.hpp>
#include <fstream>
#include <iostream>

using formula_exporter::GeneratorConfig;

namespace {

void print_stats(const formula_exporter::CatalogStats& stats, const formula_exporter::ExportResult* result) {
    std::cout << "\nStatistics:\n"
              << "  unique_components: " << stats.unique_components << "\n"
              << "  categories: " << stats.categories << "\n"
              << "  by_category:\n";
    for (const auto& [category, count] : stats.by_category) {
        std::cout << "    " << component_catalog::to_string(category) << ": " << count << "\n";
    }
    if (result) {
        std::cout << "  components: " << result->component_rows << "\n"
                  << "  classics: " << result->classic_rows << "\n";
        if (result->outputs.count("pipelines")) {
            std::cout << "  pipelines: " << result->pipeline_rows << "\n";
        }
    }
}

void dump_catalog(const component_catalog::ComponentCatalog& catalog, const std::string& file_path) {
    std::ofstream out(file_path);
    if (!out.is_open()) {
        throw formula_exporter::ExportError("Could not open file '" + file_path + "' for writing");
    }
    out << component_catalog::catalog_to_json(catalog).dump(4);
    out.close();
    std::cout << "Catalog written to: " << file_path << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("formula_grammar", "Compression formula and pipeline generator");
    options.add_options()
        ("o,output", "Output directory for CSV files", cxxopts::value<std::string>())
        ("min-depth", "Minimum pipeline depth", cxxopts::value<size_t>())
        ("max-depth", "Maximum pipeline depth for combinations", cxxopts::value<size_t>())
        ("no-pipelines", "Skip generating pipeline combinations")
        ("allow-open-ended", "Accept pipelines that do not end in an entropy coder")
        ("parameters", "Add the parameter_space column to pipeline_combinations.csv")
        ("c,config", "JSON generator configuration", cxxopts::value<std::string>())
        ("catalog", "JSON component catalog replacing the built-in one", cxxopts::value<std::string>())
        ("dump-catalog", "Write the active catalog as JSON and exit", cxxopts::value<std::string>())
        ("stats", "Print generation statistics")
        ("i,interactive", "Start the interactive console")
        ("v,verbose", "Enable verbose mode")
        ("h,help", "Print usage");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return 1;
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    try {
        GeneratorConfig config;
        if (result.count("config")) {
            config = formula_exporter::load_config(result["config"].as<std::string>());
        }
        // Command-line flags override the configuration file.
        if (result.count("output")) config.output_dir = result["output"].as<std::string>();
        if (result.count("min-depth")) config.min_depth = result["min-depth"].as<size_t>();
        if (result.count("max-depth")) config.max_depth = result["max-depth"].as<size_t>();
        if (result.count("no-pipelines")) config.include_pipelines = false;
        if (result.count("allow-open-ended")) config.require_entropy_coder = false;
        if (result.count("parameters")) config.include_parameters = true;
        if (result.count("catalog")) config.catalog_file = result["catalog"].as<std::string>();
        if (result.count("verbose")) config.verbose = true;

        if (result.count("interactive")) {
            std::cout << "Starting Compression Formula Console\n";
            formula_console::FormulaConsole console(config);
            console.interactive_console();
            std::cout << "Exiting Compression Formula Console\n";
            return 0;
        }

        std::cout << "Initializing Compression Formula Generator...\n";
        auto catalog = formula_console::open_catalog(config);

        if (result.count("dump-catalog")) {
            dump_catalog(catalog, result["dump-catalog"].as<std::string>());
            return 0;
        }

        std::cout << "Exporting to " << config.output_dir << "...\n";
        auto exported = formula_exporter::export_to_csv(catalog, config);

        std::cout << "\nGenerated files:\n";
        for (const auto& [kind, path] : exported.outputs) {
            std::cout << "  " << kind << ": " << path << "\n";
        }
        if (result.count("stats")) {
            print_stats(formula_exporter::collect_stats(catalog), &exported);
        }
        std::cout << "\nDone!\n";
    } catch (const formula_exporter::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const component_catalog::CatalogError& e) {
        std::cerr << "Catalog error: " << e.what() << "\n";
        return 1;
    } catch (const formula_exporter::ExportError& e) {
        std::cerr << "Export error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid option: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
