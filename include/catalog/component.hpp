#ifndef COMPONENT_HPP
#define COMPONENT_HPP

#include <nlohmann/json.hpp>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace component_catalog {

enum class Category {
    EntropyMeasure,
    Transform,
    Predictor,
    Dictionary,
    EntropyCoder,
    RunLength,
    ContextModel,
    Filter,
    IntegerCoder
};

constexpr std::array<Category, 9> kAllCategories = {
    Category::EntropyMeasure, Category::Transform,    Category::Predictor,
    Category::Dictionary,     Category::EntropyCoder, Category::RunLength,
    Category::ContextModel,   Category::Filter,       Category::IntegerCoder};

// A pipeline is complete when its last entry belongs to this category.
constexpr Category kTerminalCategory = Category::EntropyCoder;

enum class Stage : int { PreFilter = 0, Transform = 1, Modeling = 2, EntropyCoding = 3 };

constexpr std::array<Stage, 4> kAllStages = {Stage::PreFilter, Stage::Transform, Stage::Modeling,
                                             Stage::EntropyCoding};

// Candidate value of a parameter range: integer, float (inf allowed), bool or string.
using ParamValue = nlohmann::json;
using ParamRange = std::pair<std::string, std::vector<ParamValue>>;

class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& what) : std::runtime_error(what) {}
};

struct Component {
    Category category = Category::Transform;
    std::string name;
    std::string formula_latex;
    std::string formula_ascii;
    std::string description;
    std::vector<std::pair<std::string, std::string>> parameters; // symbol -> meaning
    std::vector<ParamRange> parameter_ranges;                    // declaration order is kept
    std::string time_cost = "O(n)";
    std::string space_cost = "O(n)";
    std::vector<Stage> valid_stages = {Stage::Transform};
    bool lossless = true;
    std::vector<std::string> prerequisites;
    std::vector<std::string> incompatible_with;

    bool valid_at(Stage stage) const;
};

std::string to_string(Category category);
std::string to_string(Stage stage);
bool parse_category(const std::string& text, Category& out);
bool stage_from_int(int value, Stage& out);

// Renders a single parameter value ("2", "0.5", "inf", "true", "PPMA").
std::string format_value(const ParamValue& value);
// JSON form used by the exporters; non-finite floats become strings.
nlohmann::json export_value(const ParamValue& value);

} // namespace component_catalog

#endif // COMPONENT_HPP
