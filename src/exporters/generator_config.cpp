#include "generator_config.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace formula_exporter {

namespace {

size_t read_depth(const json& document, const char* key) {
    const json& value = document.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw ConfigError(std::string("Configuration key '") + key + "' must be a non-negative integer");
    }
    return value.get<size_t>();
}

} // namespace

pipeline_generator::GeneratorOptions GeneratorConfig::generator_options() const {
    pipeline_generator::GeneratorOptions options;
    options.min_depth = min_depth;
    options.max_depth = max_depth;
    options.require_terminal_category = require_entropy_coder;
    return options;
}

json config_to_json(const GeneratorConfig& config) {
    json j;
    j["output_dir"] = config.output_dir;
    j["min_depth"] = config.min_depth;
    j["max_depth"] = config.max_depth;
    j["require_entropy_coder"] = config.require_entropy_coder;
    j["include_pipelines"] = config.include_pipelines;
    j["include_parameters"] = config.include_parameters;
    j["catalog_file"] = config.catalog_file;
    j["verbose"] = config.verbose;
    return j;
}

GeneratorConfig config_from_json(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }
    GeneratorConfig config;
    try {
        if (document.contains("output_dir")) {
            config.output_dir = document["output_dir"].get<std::string>();
        }
        if (document.contains("min_depth")) {
            config.min_depth = read_depth(document, "min_depth");
        }
        if (document.contains("max_depth")) {
            config.max_depth = read_depth(document, "max_depth");
        }
        if (document.contains("require_entropy_coder")) {
            config.require_entropy_coder = document["require_entropy_coder"].get<bool>();
        }
        if (document.contains("include_pipelines")) {
            config.include_pipelines = document["include_pipelines"].get<bool>();
        }
        if (document.contains("include_parameters")) {
            config.include_parameters = document["include_parameters"].get<bool>();
        }
        if (document.contains("catalog_file")) {
            config.catalog_file = document["catalog_file"].get<std::string>();
        }
        if (document.contains("verbose")) {
            config.verbose = document["verbose"].get<bool>();
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }
    return config;
}

void save_config(const GeneratorConfig& config, const std::string& file_path) {
    std::ofstream out(file_path);
    if (!out.is_open()) {
        throw ConfigError("Could not open file '" + file_path + "' for writing");
    }
    out << config_to_json(config).dump(4);
    out.close();
    std::cout << "Configuration saved to: " << file_path << "\n";
}

GeneratorConfig load_config(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in.is_open()) {
        throw ConfigError("Could not open file '" + file_path + "' for reading");
    }
    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw ConfigError("Error parsing JSON configuration: " + std::string(e.what()));
    }
    in.close();

    GeneratorConfig config = config_from_json(j);
    std::cout << "Configuration loaded from: " << file_path << "\n";
    return config;
}

} // namespace formula_exporter
