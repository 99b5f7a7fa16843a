#ifndef GENERATOR_CONFIG_HPP
#define GENERATOR_CONFIG_HPP

#include "pipeline_generator.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace formula_exporter {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct GeneratorConfig {
    std::string output_dir = "formula_output";                     // Directory receiving the CSV files
    size_t min_depth = pipeline_generator::kDefaultMinDepth;       // Shortest pipeline exported
    size_t max_depth = 4;                                          // Longest pipeline exported
    bool require_entropy_coder = true;                             // Pipelines must end in an entropy coder
    bool include_pipelines = true;                                 // Write pipeline_combinations.csv
    bool include_parameters = false;                               // Add the parameter_space column
    std::string catalog_file;                                      // Empty: built-in catalog
    bool verbose = false;

    pipeline_generator::GeneratorOptions generator_options() const;
};

nlohmann::json config_to_json(const GeneratorConfig& config);
// Missing keys keep their defaults; wrong types raise ConfigError.
GeneratorConfig config_from_json(const nlohmann::json& document);

void save_config(const GeneratorConfig& config, const std::string& file_path);
GeneratorConfig load_config(const std::string& file_path);

} // namespace formula_exporter

#endif // GENERATOR_CONFIG_HPP
