#include "component_catalog.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace component_catalog {

namespace {

std::vector<std::string> string_list(const json& entry, const std::string& key) {
    if (!entry.contains(key)) return {};
    return entry.at(key).get<std::vector<std::string>>();
}

Component parse_component(const json& entry) {
    Component comp;
    comp.name = entry.at("name").get<std::string>();

    std::string category = entry.at("category").get<std::string>();
    if (!parse_category(category, comp.category)) {
        throw CatalogError("Component '" + comp.name + "' has unknown category '" + category + "'");
    }

    comp.formula_latex = entry.value("formula_latex", "");
    comp.formula_ascii = entry.value("formula_ascii", "");
    comp.description = entry.value("description", "");
    comp.time_cost = entry.value("time_complexity", "O(n)");
    comp.space_cost = entry.value("space_complexity", "O(n)");
    comp.lossless = entry.value("is_lossless", true);

    if (entry.contains("parameters")) {
        for (const auto& pair : entry.at("parameters")) {
            comp.parameters.emplace_back(pair.at(0).get<std::string>(), pair.at(1).get<std::string>());
        }
    }

    // [["name", [v1, v2, ...]], ...] keeps declaration order, which an object would not.
    if (entry.contains("parameter_ranges")) {
        for (const auto& pair : entry.at("parameter_ranges")) {
            const json& values = pair.at(1);
            if (!values.is_array()) {
                throw CatalogError("Component '" + comp.name + "' has a non-list range for parameter '" +
                                   pair.at(0).get<std::string>() + "'");
            }
            comp.parameter_ranges.emplace_back(pair.at(0).get<std::string>(),
                                               std::vector<ParamValue>(values.begin(), values.end()));
        }
    }

    if (entry.contains("pipeline_stages")) {
        comp.valid_stages.clear();
        for (const auto& value : entry.at("pipeline_stages")) {
            Stage stage;
            if (!value.is_number_integer() || !stage_from_int(value.get<int>(), stage)) {
                throw CatalogError("Component '" + comp.name + "' declares invalid stage " + value.dump());
            }
            comp.valid_stages.push_back(stage);
        }
    }

    comp.prerequisites = string_list(entry, "prerequisites");
    comp.incompatible_with = string_list(entry, "incompatible_with");
    return comp;
}

} // namespace

ComponentCatalog parse_catalog(const json& document) {
    std::vector<Component> components;
    try {
        for (const auto& entry : document.at("components")) {
            components.push_back(parse_component(entry));
        }
    } catch (const json::exception& e) {
        throw CatalogError(std::string("Malformed catalog document: ") + e.what());
    }
    return ComponentCatalog(std::move(components));
}

ComponentCatalog load_catalog(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in.is_open()) {
        throw CatalogError("Could not open catalog file '" + file_path + "'");
    }
    json document;
    try {
        in >> document;
    } catch (const json::exception& e) {
        throw CatalogError("Error parsing catalog file '" + file_path + "': " + e.what());
    }
    ComponentCatalog catalog = parse_catalog(document);
    std::cout << "[catalog] Loaded " << catalog.size() << " components from " << file_path << "\n";
    return catalog;
}

json catalog_to_json(const ComponentCatalog& catalog) {
    json components = json::array();
    for (const auto& comp : catalog.components()) {
        json entry;
        entry["category"] = to_string(comp.category);
        entry["name"] = comp.name;
        entry["formula_latex"] = comp.formula_latex;
        entry["formula_ascii"] = comp.formula_ascii;
        entry["description"] = comp.description;
        entry["parameters"] = json::array();
        for (const auto& [symbol, meaning] : comp.parameters) {
            entry["parameters"].push_back(json::array({symbol, meaning}));
        }
        entry["parameter_ranges"] = json::array();
        for (const auto& [param, values] : comp.parameter_ranges) {
            json exported = json::array();
            for (const auto& value : values) exported.push_back(export_value(value));
            entry["parameter_ranges"].push_back(json::array({param, exported}));
        }
        entry["time_complexity"] = comp.time_cost;
        entry["space_complexity"] = comp.space_cost;
        entry["pipeline_stages"] = json::array();
        for (Stage stage : comp.valid_stages) entry["pipeline_stages"].push_back(static_cast<int>(stage));
        entry["is_lossless"] = comp.lossless;
        entry["prerequisites"] = comp.prerequisites;
        entry["incompatible_with"] = comp.incompatible_with;
        components.push_back(entry);
    }
    return json{{"components", components}};
}

} // namespace component_catalog
