#ifndef COMPONENT_CATALOG_HPP
#define COMPONENT_CATALOG_HPP

#include "component.hpp"
#include <array>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace component_catalog {

// Immutable, validated set of components. Pipelines keep raw pointers into
// it, so a catalog is move-only and must outlive every pipeline built from it.
class ComponentCatalog {
public:
    explicit ComponentCatalog(std::vector<Component> components);
    ComponentCatalog(const ComponentCatalog&) = delete;
    ComponentCatalog& operator=(const ComponentCatalog&) = delete;
    ComponentCatalog(ComponentCatalog&&) = default;
    ComponentCatalog& operator=(ComponentCatalog&&) = default;

    const std::vector<Component>& components() const { return components_; }
    size_t size() const { return components_.size(); }
    const Component* find(const std::string& name) const;
    std::vector<const Component*> by_category(Category category) const;
    std::map<Category, size_t> count_by_category() const;
    const std::vector<const Component*>& by_stage(Stage stage) const;

private:
    std::vector<Component> components_;
    std::unordered_map<std::string, size_t> index_;
    std::array<std::vector<const Component*>, 4> by_stage_;

    void validate() const;
};

// The built-in alphabet of compression primitives.
std::vector<Component> builtin_components();
ComponentCatalog default_catalog();

// Reads a catalog document; throws CatalogError on malformed input.
ComponentCatalog load_catalog(const std::string& file_path);
ComponentCatalog parse_catalog(const nlohmann::json& document);
nlohmann::json catalog_to_json(const ComponentCatalog& catalog);

} // namespace component_catalog

#endif // COMPONENT_CATALOG_HPP
