#include "component_catalog.hpp"
#include <set>

namespace component_catalog {

ComponentCatalog::ComponentCatalog(std::vector<Component> components)
    : components_(std::move(components)) {
    validate();
    for (size_t i = 0; i < components_.size(); ++i) {
        const Component& comp = components_[i];
        index_[comp.name] = i;
        for (Stage stage : comp.valid_stages) {
            by_stage_[static_cast<int>(stage)].push_back(&comp);
        }
    }
}

void ComponentCatalog::validate() const {
    std::set<std::string> seen;
    for (const auto& comp : components_) {
        if (comp.name.empty()) {
            throw CatalogError("Component with empty name in category " + to_string(comp.category));
        }
        if (!seen.insert(comp.name).second) {
            throw CatalogError("Duplicate component name '" + comp.name + "'");
        }
        if (comp.valid_stages.empty()) {
            throw CatalogError("Component '" + comp.name + "' declares no pipeline stages");
        }
        std::set<int> stages;
        for (Stage stage : comp.valid_stages) {
            int value = static_cast<int>(stage);
            if (value < 0 || value > 3) {
                throw CatalogError("Component '" + comp.name + "' declares invalid stage " + std::to_string(value));
            }
            if (!stages.insert(value).second) {
                throw CatalogError("Component '" + comp.name + "' declares stage " + std::to_string(value) + " twice");
            }
        }
        std::set<std::string> params;
        for (const auto& [param, values] : comp.parameter_ranges) {
            if (!params.insert(param).second) {
                throw CatalogError("Component '" + comp.name + "' declares parameter '" + param + "' twice");
            }
            if (values.empty()) {
                throw CatalogError("Component '" + comp.name + "' has an empty range for parameter '" + param + "'");
            }
        }
    }
}

const Component* ComponentCatalog::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &components_[it->second];
}

std::vector<const Component*> ComponentCatalog::by_category(Category category) const {
    std::vector<const Component*> result;
    for (const auto& comp : components_) {
        if (comp.category == category) result.push_back(&comp);
    }
    return result;
}

std::map<Category, size_t> ComponentCatalog::count_by_category() const {
    std::map<Category, size_t> counts;
    for (Category category : kAllCategories) counts[category] = 0;
    for (const auto& comp : components_) counts[comp.category]++;
    return counts;
}

const std::vector<const Component*>& ComponentCatalog::by_stage(Stage stage) const {
    return by_stage_.at(static_cast<size_t>(stage));
}

ComponentCatalog default_catalog() {
    return ComponentCatalog(builtin_components());
}

} // namespace component_catalog
