#ifndef FORMULA_CONSOLE_HPP
#define FORMULA_CONSOLE_HPP

#include "component_catalog.hpp"
#include "generator_config.hpp"
#include <string>
#include <vector>

namespace formula_console {

class FormulaConsole {
private:
    formula_exporter::GeneratorConfig config_; // Stateful configuration
    component_catalog::ComponentCatalog catalog_;

    void list_components(const std::string& category_filter) const;
    void show_component(const std::string& name) const;
    void show_config() const;
    void show_variations(const std::string& name, size_t limit) const;
    void set_option(const std::string& key, const std::string& value);
    void show_compatible(const std::string& name, bool forward) const;
    void validate_pipeline(const std::vector<std::string>& names) const;
    void show_pipelines(size_t limit) const;
    void show_classics() const;
    void show_stats() const;
    void export_csv(const std::string& output_dir) const;
    void load_config(const std::string& file_path);

public:
    explicit FormulaConsole(formula_exporter::GeneratorConfig config = {});
    const formula_exporter::GeneratorConfig& config() const { return config_; }
    const component_catalog::ComponentCatalog& catalog() const { return catalog_; }
    void interactive_console();
};

// Built-in catalog when the config names no catalog file.
component_catalog::ComponentCatalog open_catalog(const formula_exporter::GeneratorConfig& config);

// "a, b , c" -> {"a", "b", "c"}; empty pieces are dropped.
std::vector<std::string> split_names(const std::string& text);

} // namespace formula_console

#endif // FORMULA_CONSOLE_HPP
