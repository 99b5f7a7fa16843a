#include "formula_console.hpp"
#include "classic_algorithms.hpp"
#include "formula_exporter.hpp"
#include "pipeline_generator.hpp"
#include "variation_expander.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <utility>

namespace formula_console {

using component_catalog::Component;
using formula_exporter::GeneratorConfig;

namespace {

constexpr size_t kDefaultListLimit = 20;

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

bool parse_size(const std::string& text, size_t& out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    std::istringstream in(text);
    in >> out;
    return !in.fail();
}

bool parse_bool(const std::string& text, bool& out) {
    std::string lower;
    for (char c : text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        out = false;
        return true;
    }
    return false;
}

// Component names contain spaces, so an optional trailing word is split off the end.
std::string split_last_word(const std::string& text, std::string& last_word) {
    size_t space = text.find_last_of(" \t");
    if (space == std::string::npos) {
        last_word.clear();
        return text;
    }
    last_word = text.substr(space + 1);
    return trim(text.substr(0, space));
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += separator;
        joined += parts[i];
    }
    return joined;
}

std::string stages_text(const Component& comp) {
    std::vector<std::string> parts;
    for (auto stage : comp.valid_stages) {
        parts.push_back(std::to_string(static_cast<int>(stage)) + " (" + component_catalog::to_string(stage) + ")");
    }
    return join(parts, ", ");
}

} // namespace

component_catalog::ComponentCatalog open_catalog(const GeneratorConfig& config) {
    if (config.catalog_file.empty()) return component_catalog::default_catalog();
    return component_catalog::load_catalog(config.catalog_file);
}

std::vector<std::string> split_names(const std::string& text) {
    std::vector<std::string> names;
    std::stringstream ss(text);
    std::string name;
    while (std::getline(ss, name, ',')) {
        name = trim(name);
        if (!name.empty()) names.push_back(name);
    }
    return names;
}

FormulaConsole::FormulaConsole(GeneratorConfig config)
    : config_(std::move(config)), catalog_(open_catalog(config_)) {}

void FormulaConsole::list_components(const std::string& category_filter) const {
    if (category_filter.empty()) {
        std::cout << "Available components:\n";
        for (const auto& comp : catalog_.components()) {
            std::cout << "  - " << comp.name << " (" << component_catalog::to_string(comp.category) << ")\n";
        }
        return;
    }
    component_catalog::Category category;
    if (!component_catalog::parse_category(category_filter, category)) {
        std::cout << "Error: Unknown category " << category_filter << "\n";
        return;
    }
    std::cout << "Components in " << component_catalog::to_string(category) << ":\n";
    for (const auto* comp : catalog_.by_category(category)) {
        std::cout << "  - " << comp->name << "\n";
    }
}

void FormulaConsole::show_component(const std::string& name) const {
    const Component* comp = catalog_.find(name);
    if (!comp) {
        std::cout << "Error: Component " << name << " not found\n";
        return;
    }
    std::cout << "Name: " << comp->name << "\n"
              << "  Category: " << component_catalog::to_string(comp->category) << "\n"
              << "  Formula: " << comp->formula_ascii << "\n"
              << "  LaTeX: " << comp->formula_latex << "\n"
              << "  Description: " << comp->description << "\n";
    if (!comp->parameters.empty()) {
        std::cout << "  Parameters:\n";
        for (const auto& [symbol, meaning] : comp->parameters) {
            std::cout << "    - " << symbol << ": " << meaning << "\n";
        }
    }
    if (!comp->parameter_ranges.empty()) {
        std::cout << "  Ranges:\n";
        for (const auto& [param, values] : comp->parameter_ranges) {
            std::vector<std::string> rendered;
            for (const auto& value : values) rendered.push_back(component_catalog::format_value(value));
            std::cout << "    - " << param << ": " << join(rendered, ", ") << "\n";
        }
    }
    std::cout << "  Time: " << comp->time_cost << ", Space: " << comp->space_cost << "\n"
              << "  Stages: " << stages_text(*comp) << "\n"
              << "  Lossless: " << (comp->lossless ? "yes" : "no") << "\n";
    if (!comp->prerequisites.empty()) {
        std::cout << "  Requires: " << join(comp->prerequisites, ", ") << "\n";
    }
    if (!comp->incompatible_with.empty()) {
        std::cout << "  Incompatible with: " << join(comp->incompatible_with, ", ") << "\n";
    }
}

void FormulaConsole::show_config() const {
    std::cout << "Current configuration:\n"
              << "  Output: " << config_.output_dir << "\n"
              << "  min_depth: " << config_.min_depth << "\n"
              << "  max_depth: " << config_.max_depth << "\n"
              << "  require_terminal: " << (config_.require_entropy_coder ? "true" : "false") << "\n"
              << "  pipelines: " << (config_.include_pipelines ? "true" : "false") << "\n"
              << "  parameters: " << (config_.include_parameters ? "true" : "false") << "\n"
              << "  catalog: " << (config_.catalog_file.empty() ? "(built-in)" : config_.catalog_file) << "\n"
              << "  verbose: " << (config_.verbose ? "true" : "false") << "\n";
}

void FormulaConsole::show_variations(const std::string& name, size_t limit) const {
    const Component* comp = catalog_.find(name);
    if (!comp) {
        std::cout << "Error: Component " << name << " not found\n";
        return;
    }
    auto variations = component_catalog::expand(*comp);
    size_t total = variations.size();
    std::cout << "Variations of " << comp->name << " (" << total << " total):\n";
    size_t shown = 0;
    for (const auto& variation : variations) {
        if (shown == limit) break;
        ++shown;
        std::cout << "  [" << shown << "] " << component_catalog::describe(variation.configuration) << "\n";
    }
    if (shown < total) {
        std::cout << "  ... " << (total - shown) << " more\n";
    }
}

void FormulaConsole::set_option(const std::string& key, const std::string& value) {
    if (value.empty()) {
        std::cout << "Error: Please specify a value for " << key << "\n";
        return;
    }
    if (key == "min_depth" || key == "max_depth") {
        size_t depth;
        if (!parse_size(value, depth)) {
            std::cout << "Error: " << key << " expects a non-negative integer\n";
            return;
        }
        (key == "min_depth" ? config_.min_depth : config_.max_depth) = depth;
    } else if (key == "require_terminal" || key == "parameters" || key == "pipelines" || key == "verbose") {
        bool flag;
        if (!parse_bool(value, flag)) {
            std::cout << "Error: " << key << " expects true or false\n";
            return;
        }
        if (key == "require_terminal") config_.require_entropy_coder = flag;
        else if (key == "parameters") config_.include_parameters = flag;
        else if (key == "pipelines") config_.include_pipelines = flag;
        else config_.verbose = flag;
    } else if (key == "output") {
        config_.output_dir = value;
    } else {
        std::cout << "Error: Unknown setting " << key << "\n";
        return;
    }
    std::cout << key << " set to: " << value << "\n";
}

void FormulaConsole::show_compatible(const std::string& name, bool forward) const {
    if (!catalog_.find(name)) {
        std::cout << "Error: Component " << name << " not found\n";
        return;
    }
    pipeline_generator::PipelineGenerator generator(catalog_);
    auto compatible = generator.compatible(name, forward);
    std::cout << "Compatible components for " << name << " (" << (forward ? "forward" : "backward") << "):\n";
    for (const auto* comp : compatible) {
        std::cout << "  - " << comp->name << " (" << component_catalog::to_string(comp->category) << ")\n";
    }
}

void FormulaConsole::validate_pipeline(const std::vector<std::string>& names) const {
    pipeline_generator::PipelineGenerator generator(catalog_);
    pipeline_generator::Pipeline resolved;
    std::string error;
    if (!generator.validate(names, error, &resolved)) {
        std::cout << "Invalid pipeline: " << error << "\n";
        return;
    }
    std::cout << "Valid pipeline: " << resolved.display_name() << "\n";
    for (const auto& entry : resolved.entries) {
        std::cout << "  [" << component_catalog::to_string(entry.stage) << "] " << entry.component->name << "\n";
    }
    std::cout << "  Time: " << resolved.total_time_cost() << ", Space: " << resolved.total_space_cost()
              << ", Lossless: " << (resolved.all_lossless() ? "yes" : "no") << "\n";
}

void FormulaConsole::show_pipelines(size_t limit) const {
    pipeline_generator::PipelineGenerator generator(catalog_);
    size_t shown = 0;
    generator.for_each(config_.generator_options(), [&shown, limit](const pipeline_generator::Pipeline& pipeline) {
        if (shown == limit) return false;
        ++shown;
        std::cout << "  [" << shown << "] " << pipeline.display_name() << "  (" << pipeline.total_time_cost()
                  << ", " << pipeline.total_space_cost() << ")\n";
        return true;
    });
    std::cout << "Shown " << shown << " pipeline(s) with depth " << config_.min_depth << ".." << config_.max_depth
              << "\n";
}

void FormulaConsole::show_classics() const {
    std::cout << "Classic algorithms:\n";
    for (const auto& binding : pipeline_generator::default_classic_bindings()) {
        auto resolved = pipeline_generator::resolve(catalog_, binding);
        if (resolved.empty()) {
            std::cout << "  - " << binding.algorithm << ": (no components in catalog)\n";
            continue;
        }
        std::vector<std::string> names;
        for (const auto* comp : resolved.components) names.push_back(comp->name);
        std::cout << "  - " << binding.algorithm << ": " << join(names, " → ") << "  (" << resolved.total_time_cost()
                  << ", " << resolved.total_space_cost() << ")\n";
        if (!resolved.missing.empty()) {
            std::cout << "    missing: " << join(resolved.missing, ", ") << "\n";
        }
    }
}

void FormulaConsole::show_stats() const {
    auto stats = formula_exporter::collect_stats(catalog_);
    std::cout << "Statistics:\n"
              << "  unique_components: " << stats.unique_components << "\n"
              << "  categories: " << stats.categories << "\n"
              << "  by_category:\n";
    for (const auto& [category, count] : stats.by_category) {
        std::cout << "    " << component_catalog::to_string(category) << ": " << count << "\n";
    }
}

void FormulaConsole::export_csv(const std::string& output_dir) const {
    GeneratorConfig config = config_;
    if (!output_dir.empty()) config.output_dir = output_dir;
    auto result = formula_exporter::export_to_csv(catalog_, config);
    std::cout << "Generated files:\n";
    for (const auto& [kind, path] : result.outputs) {
        std::cout << "  " << kind << ": " << path << "\n";
    }
}

void FormulaConsole::load_config(const std::string& file_path) {
    GeneratorConfig loaded = formula_exporter::load_config(file_path);
    if (loaded.catalog_file != config_.catalog_file) {
        catalog_ = open_catalog(loaded);
    }
    config_ = loaded;
}

void FormulaConsole::interactive_console() {
    std::cout << "Welcome to the Compression Formula Console (type 'help' for commands)\n";
    std::string command;

    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, command)) break;
        std::stringstream ss(command);
        std::string cmd;
        ss >> cmd;
        std::string rest;
        std::getline(ss, rest);
        rest = trim(rest);

        if (cmd.empty()) continue;
        if (cmd == "exit") break;

        try {
            if (cmd == "help") {
                std::cout << "Commands:\n"
                          << "  list components [category]      - List components, optionally one category\n"
                          << "  show <component>                - Show a component\n"
                          << "  show config                     - Show current configuration\n"
                          << "  variations <component> [limit]  - List parameter variations\n"
                          << "  set <key> <value>               - min_depth, max_depth, require_terminal, output, parameters\n"
                          << "  compatible <component> [forward|backward] - Show compatible components\n"
                          << "  validate <a>, <b>, ...          - Check a pipeline (comma-separated names)\n"
                          << "  pipelines [limit]               - Enumerate pipelines\n"
                          << "  classic                         - Show well-known algorithms\n"
                          << "  stats                           - Catalog statistics\n"
                          << "  export [dir]                    - Write the CSV files\n"
                          << "  save <file>                     - Save configuration to file\n"
                          << "  load <file>                     - Load configuration from file\n"
                          << "  exit                            - Exit console\n";
            } else if (cmd == "list") {
                std::stringstream args(rest);
                std::string what;
                args >> what;
                if (what != "components") {
                    std::cout << "Error: Usage: list components [category]\n";
                } else {
                    std::string category;
                    std::getline(args, category);
                    list_components(trim(category));
                }
            } else if (cmd == "show") {
                if (rest.empty()) {
                    std::cout << "Error: Please specify a component name or 'config'\n";
                } else if (rest == "config") {
                    show_config();
                } else {
                    show_component(rest);
                }
            } else if (cmd == "variations") {
                std::string last;
                std::string name = split_last_word(rest, last);
                size_t limit = kDefaultListLimit;
                if (!parse_size(last, limit)) {
                    name = rest;
                    limit = kDefaultListLimit;
                }
                show_variations(name, limit);
            } else if (cmd == "set") {
                std::stringstream args(rest);
                std::string key, value;
                args >> key;
                std::getline(args, value);
                set_option(key, trim(value));
            } else if (cmd == "compatible") {
                std::string direction;
                std::string name = split_last_word(rest, direction);
                if (direction != "forward" && direction != "backward") {
                    name = rest;
                    direction = "forward";
                }
                show_compatible(name, direction == "forward");
            } else if (cmd == "validate") {
                validate_pipeline(split_names(rest));
            } else if (cmd == "pipelines") {
                size_t limit = kDefaultListLimit;
                if (!rest.empty() && !parse_size(rest, limit)) {
                    std::cout << "Error: pipelines expects a numeric limit\n";
                } else {
                    show_pipelines(limit);
                }
            } else if (cmd == "classic") {
                show_classics();
            } else if (cmd == "stats") {
                show_stats();
            } else if (cmd == "export") {
                export_csv(rest);
            } else if (cmd == "save") {
                if (rest.empty()) {
                    std::cout << "Error: Please specify a file path for saving the configuration\n";
                } else {
                    formula_exporter::save_config(config_, rest);
                }
            } else if (cmd == "load") {
                if (rest.empty()) {
                    std::cout << "Error: Please specify a file path for loading the configuration\n";
                } else {
                    load_config(rest);
                }
            } else {
                std::cout << "Unknown command: " << cmd << ". Type 'help' for commands.\n";
            }
        } catch (const std::exception& e) {
            std::cout << "Error: " << e.what() << "\n";
        }
    }
}

} // namespace formula_console
