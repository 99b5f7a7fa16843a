#include "variation_expander.hpp"
#include <sstream>

namespace component_catalog {

VariationSequence::iterator::iterator(const Component* component, bool at_end)
    : component_(component), done_(at_end) {
    if (!done_) {
        odometer_.assign(component_->parameter_ranges.size(), 0);
        materialize();
    }
}

VariationSequence::iterator& VariationSequence::iterator::operator++() {
    if (done_) return *this;
    if (odometer_.empty()) {
        done_ = true;
        return *this;
    }
    size_t i = odometer_.size();
    while (i > 0) {
        --i;
        if (++odometer_[i] < component_->parameter_ranges[i].second.size()) {
            materialize();
            return *this;
        }
        odometer_[i] = 0;
    }
    done_ = true;
    return *this;
}

VariationSequence::iterator VariationSequence::iterator::operator++(int) {
    iterator previous = *this;
    ++(*this);
    return previous;
}

bool VariationSequence::iterator::operator==(const iterator& other) const {
    if (done_ || other.done_) return done_ == other.done_;
    return component_ == other.component_ && odometer_ == other.odometer_;
}

void VariationSequence::iterator::materialize() {
    current_.component = component_;
    current_.configuration.clear();
    for (size_t i = 0; i < odometer_.size(); ++i) {
        const auto& [param, values] = component_->parameter_ranges[i];
        current_.configuration.emplace_back(param, values[odometer_[i]]);
    }
}

VariationSequence::VariationSequence(const Component& component) : component_(&component) {
    for (const auto& [param, values] : component.parameter_ranges) {
        if (values.empty()) {
            throw CatalogError("Component '" + component.name + "' has an empty range for parameter '" + param + "'");
        }
    }
}

size_t VariationSequence::size() const {
    size_t total = 1;
    for (const auto& range : component_->parameter_ranges) {
        total *= range.second.size();
    }
    return total;
}

std::vector<Variation> VariationSequence::to_vector() const {
    std::vector<Variation> variations;
    variations.reserve(size());
    for (const auto& variation : *this) {
        variations.push_back(variation);
    }
    return variations;
}

VariationSequence expand(const Component& component) {
    return VariationSequence(component);
}

std::string describe(const Configuration& configuration) {
    if (configuration.empty()) return "(no parameters)";
    std::ostringstream ss;
    for (size_t i = 0; i < configuration.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << configuration[i].first << "=" << format_value(configuration[i].second);
    }
    return ss.str();
}

} // namespace component_catalog
