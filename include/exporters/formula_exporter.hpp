#ifndef FORMULA_EXPORTER_HPP
#define FORMULA_EXPORTER_HPP

#include "component_catalog.hpp"
#include "generator_config.hpp"
#include "stage_grammar.hpp"
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace formula_exporter {

class ExportError : public std::runtime_error {
public:
    explicit ExportError(const std::string& message) : std::runtime_error(message) {}
};

struct ExportResult {
    std::map<std::string, std::string> outputs; // "components", "classics", "pipelines", "summary" -> path
    size_t component_rows = 0;                   // one per variation
    size_t classic_rows = 0;
    size_t pipeline_rows = 0;
};

struct CatalogStats {
    size_t unique_components = 0;
    size_t categories = 0;
    std::vector<std::pair<component_catalog::Category, size_t>> by_category; // enumeration order
};

// RFC 4180 field: quoted when it holds a comma, quote, CR or LF.
std::string csv_field(const std::string& value);
std::string csv_row(const std::vector<std::string>& fields);

// ISO-8601 UTC time, second precision.
std::string utc_timestamp();

// Writes the four CSV files into config.output_dir, creating it if needed.
// Throws ExportError when a directory or file cannot be written.
ExportResult export_to_csv(const component_catalog::ComponentCatalog& catalog, const GeneratorConfig& config,
                           const pipeline_grammar::StageGrammar& grammar = pipeline_grammar::StageGrammar::standard());

CatalogStats collect_stats(const component_catalog::ComponentCatalog& catalog);

} // namespace formula_exporter

#endif // FORMULA_EXPORTER_HPP
