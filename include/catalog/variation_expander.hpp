#ifndef VARIATION_EXPANDER_HPP
#define VARIATION_EXPANDER_HPP

#include "component.hpp"
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace component_catalog {

using Configuration = std::vector<std::pair<std::string, ParamValue>>;

struct Variation {
    const Component* component;
    Configuration configuration;
};

// One pass over the Cartesian product of a component's parameter ranges, last
// declared parameter varying fastest. Iterators own their odometer, so the
// sequence can be walked any number of times.
class VariationSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Variation;
        using difference_type = std::ptrdiff_t;
        using pointer = const Variation*;
        using reference = const Variation&;

        iterator() = default;
        iterator(const Component* component, bool at_end);

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        iterator& operator++();
        iterator operator++(int);
        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        const Component* component_ = nullptr;
        std::vector<size_t> odometer_;
        bool done_ = true;
        Variation current_{nullptr, {}};

        void materialize();
    };

    explicit VariationSequence(const Component& component);

    iterator begin() const { return iterator(component_, false); }
    iterator end() const { return iterator(component_, true); }
    // Product of the range sizes; 1 for a component without ranges.
    size_t size() const;
    std::vector<Variation> to_vector() const;

private:
    const Component* component_;
};

VariationSequence expand(const Component& component);

std::string describe(const Configuration& configuration);

} // namespace component_catalog

#endif // VARIATION_EXPANDER_HPP
