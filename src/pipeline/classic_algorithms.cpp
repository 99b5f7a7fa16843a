#include "classic_algorithms.hpp"
#include "complexity.hpp"
#include <iostream>

namespace pipeline_generator {

const std::vector<ClassicBinding>& default_classic_bindings() {
    static const std::vector<ClassicBinding> bindings = {
        {"DEFLATE", {"LZ77 (Sliding Window)", "Canonical Huffman"}},
        {"bzip2", {"Burrows-Wheeler Transform", "Move-to-Front Transform", "Zero RLE", "Huffman Coding"}},
        {"LZMA/7z", {"Delta Encoding", "LZMA (Lempel-Ziv-Markov chain)"}},
        {"Zstandard", {"Zstandard (ZSTD)"}},
        {"PPMd", {"Prediction by Partial Matching (PPM)", "Range Coding"}},
        {"PAQ", {"Context Mixing (Logistic/PAQ)", "Arithmetic Coding"}},
        {"LZ4", {"LZ4 (Fast LZ)"}},
        {"FLAC", {"Linear Predictor", "Rice Code"}},
        {"PNG", {"PNG Predictors (Paeth)", "Delta Encoding", "LZ77 (Sliding Window)", "Canonical Huffman"}},
        {"CTW", {"Context Tree Weighting (CTW)", "Arithmetic Coding"}},
    };
    return bindings;
}

ResolvedClassic resolve(const component_catalog::ComponentCatalog& catalog, const ClassicBinding& binding) {
    ResolvedClassic resolved{&binding, {}, {}};
    for (const auto& name : binding.component_names) {
        if (const auto* comp = catalog.find(name)) {
            resolved.components.push_back(comp);
        } else {
            std::cerr << "[classic] " << binding.algorithm << ": component '" << name
                      << "' not in catalog, skipped" << std::endl;
            resolved.missing.push_back(name);
        }
    }
    return resolved;
}

std::string ResolvedClassic::formula() const {
    std::string joined;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) joined += " → ";
        joined += components[i]->formula_ascii;
    }
    return joined;
}

std::string ResolvedClassic::combined_description() const {
    std::string joined;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) joined += "; ";
        joined += components[i]->description;
    }
    return joined;
}

std::string ResolvedClassic::total_time_cost() const {
    std::vector<std::string> costs;
    for (const auto* comp : components) costs.push_back(comp->time_cost);
    return combine_complexity(costs);
}

std::string ResolvedClassic::total_space_cost() const {
    std::vector<std::string> costs;
    for (const auto* comp : components) costs.push_back(comp->space_cost);
    return combine_complexity(costs);
}

} // namespace pipeline_generator
