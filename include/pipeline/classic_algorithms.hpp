#ifndef CLASSIC_ALGORITHMS_HPP
#define CLASSIC_ALGORITHMS_HPP

#include "component_catalog.hpp"
#include <string>
#include <vector>

namespace pipeline_generator {

// A well-known algorithm described as an ordered list of catalog names.
struct ClassicBinding {
    std::string algorithm;
    std::vector<std::string> component_names;
};

struct ResolvedClassic {
    const ClassicBinding* binding;
    std::vector<const component_catalog::Component*> components; // names found in the catalog, in order
    std::vector<std::string> missing;                            // names that were skipped

    bool empty() const { return components.empty(); }
    std::string formula() const;
    std::string combined_description() const;
    std::string total_time_cost() const;
    std::string total_space_cost() const;
};

const std::vector<ClassicBinding>& default_classic_bindings();

// Never fails: names absent from the catalog are left out and reported in missing.
ResolvedClassic resolve(const component_catalog::ComponentCatalog& catalog, const ClassicBinding& binding);

} // namespace pipeline_generator

#endif // CLASSIC_ALGORITHMS_HPP
