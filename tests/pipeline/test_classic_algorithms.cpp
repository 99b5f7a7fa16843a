#include <catch2/catch.hpp>
#include "classic_algorithms.hpp"
#include "test_support.hpp"

using namespace pipeline_generator;
using component_catalog::Category;
using component_catalog::ComponentCatalog;
using component_catalog::Stage;

namespace {

const ClassicBinding& binding_named(const std::string& name) {
    for (const auto& binding : default_classic_bindings()) {
        if (binding.algorithm == name) return binding;
    }
    FAIL("No binding named " << name);
    throw std::logic_error("unreachable");
}

} // namespace

TEST_CASE("Well-known algorithm table", "[classic]") {
    const auto& bindings = default_classic_bindings();
    REQUIRE(bindings.size() == 10);
    REQUIRE(bindings.front().algorithm == "DEFLATE");
    REQUIRE(bindings.back().algorithm == "CTW");
    REQUIRE(binding_named("PNG").component_names.size() == 4);
}

TEST_CASE("Resolving against the built-in catalog", "[classic]") {
    ComponentCatalog catalog = component_catalog::default_catalog();

    SECTION("Every binding resolves fully") {
        for (const auto& binding : default_classic_bindings()) {
            auto resolved = resolve(catalog, binding);
            REQUIRE(resolved.missing.empty());
            REQUIRE(resolved.components.size() == binding.component_names.size());
        }
    }

    SECTION("bzip2") {
        auto resolved = resolve(catalog, binding_named("bzip2"));
        REQUIRE(resolved.components[0]->name == "Burrows-Wheeler Transform");
        REQUIRE(resolved.components[3]->name == "Huffman Coding");
        REQUIRE(resolved.total_time_cost() == "O(n log n)");
        REQUIRE(resolved.total_space_cost() == "O(n)");
        REQUIRE(resolved.formula().find(" → ") != std::string::npos);
    }

    SECTION("DEFLATE") {
        auto resolved = resolve(catalog, binding_named("DEFLATE"));
        REQUIRE(resolved.total_time_cost() == "O(n * window)");
        REQUIRE(resolved.combined_description() ==
                catalog.find("LZ77 (Sliding Window)")->description + "; " +
                    catalog.find("Canonical Huffman")->description);
    }
}

TEST_CASE("Names missing from the catalog are skipped", "[classic]") {
    ComponentCatalog catalog({make_component("Huffman Coding", Category::EntropyCoder, {Stage::EntropyCoding})});

    SECTION("Partial resolution") {
        auto resolved = resolve(catalog, binding_named("bzip2"));
        REQUIRE(resolved.components.size() == 1);
        REQUIRE(resolved.components[0]->name == "Huffman Coding");
        REQUIRE(resolved.missing == std::vector<std::string>{"Burrows-Wheeler Transform", "Move-to-Front Transform",
                                                              "Zero RLE"});
        REQUIRE_FALSE(resolved.empty());
    }

    SECTION("Nothing resolved") {
        auto resolved = resolve(catalog, binding_named("LZ4"));
        REQUIRE(resolved.empty());
        REQUIRE(resolved.missing.size() == 1);
        REQUIRE(resolved.formula().empty());
    }
}
