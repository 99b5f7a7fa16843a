#include <catch2/catch.hpp>
#include "pipeline_generator.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <limits>
#include <set>
#include <stdexcept>

using namespace pipeline_generator;
using component_catalog::Category;
using Names = std::vector<std::string>;

namespace {

std::vector<Names> names_of(const std::vector<Pipeline>& pipelines) {
    std::vector<Names> result;
    for (const auto& pipeline : pipelines) result.push_back(pipeline.names());
    return result;
}

bool contains_name(const Pipeline& pipeline, const std::string& name) {
    auto names = pipeline.names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Filter F (stage 0), transform T (stage 1), coder E (stage 3).
ComponentCatalog three_stage_catalog() {
    return ComponentCatalog({make_component("F", Category::Filter, {Stage::PreFilter}),
                             make_component("T", Category::Transform, {Stage::Transform}),
                             make_component("E", Category::EntropyCoder, {Stage::EntropyCoding})});
}

StageGrammar three_stage_grammar() {
    return StageGrammar(StageGrammar::Table{{Stage::PreFilter, {Stage::Transform, Stage::EntropyCoding}},
                                            {Stage::Transform, {Stage::EntropyCoding}}});
}

GeneratorOptions depth(size_t min_depth, size_t max_depth, bool terminal = true) {
    GeneratorOptions options;
    options.min_depth = min_depth;
    options.max_depth = max_depth;
    options.require_terminal_category = terminal;
    return options;
}

} // namespace

TEST_CASE("Three stage scenario", "[pipeline]") {
    ComponentCatalog catalog = three_stage_catalog();
    PipelineGenerator generator(catalog, three_stage_grammar());
    auto pipelines = generator.generate(depth(2, 3));

    SECTION("Exact output in depth-first order") {
        REQUIRE(names_of(pipelines) == std::vector<Names>{{"F", "T", "E"}, {"F", "E"}, {"T", "E"}});
    }

    SECTION("Stages recorded per entry") {
        REQUIRE(pipelines[0].entries[0].stage == Stage::PreFilter);
        REQUIRE(pipelines[0].entries[1].stage == Stage::Transform);
        REQUIRE(pipelines[0].entries[2].stage == Stage::EntropyCoding);
        REQUIRE(pipelines[2].entries[0].stage == Stage::Transform);
    }

    SECTION("Entries point into the catalog") {
        REQUIRE(pipelines[1].entries[0].component == catalog.find("F"));
        REQUIRE(pipelines[1].entries[1].component == catalog.find("E"));
    }

    SECTION("Pipeline accessors") {
        REQUIRE(pipelines[0].display_name() == "F → T → E");
        REQUIRE(pipelines[0].formula() == "F(x) → T(x) → E(x)");
        REQUIRE(pipelines[0].all_lossless());
        REQUIRE(pipelines[0].total_time_cost() == "O(n)");
        REQUIRE(pipelines[0].parameter_space() == 1);
    }

    SECTION("Open-ended pipelines") {
        auto open = generator.generate(depth(1, 2, false));
        REQUIRE(names_of(open) == std::vector<Names>{{"F"}, {"F", "T"}, {"F", "E"}, {"T"}, {"T", "E"}});
    }

    SECTION("Stream and count agree") {
        PipelineStream stream = generator.stream(depth(2, 3));
        Pipeline pipeline;
        size_t pulled = 0;
        while (stream.next(pipeline)) ++pulled;
        REQUIRE(pulled == 3);
        REQUIRE(stream.emitted() == 3);
        REQUIRE_FALSE(stream.next(pipeline));
        REQUIRE(generator.count(depth(2, 3)) == 3);
    }

    SECTION("Visitor can stop early") {
        size_t visited = 0;
        generator.for_each(depth(2, 3), [&visited](const Pipeline&) { return ++visited < 2; });
        REQUIRE(visited == 2);
    }
}

TEST_CASE("Incompatible components never share a pipeline", "[pipeline]") {
    auto a = make_component("A", Category::ContextModel, {Stage::Modeling});
    auto b = make_component("B", Category::ContextModel, {Stage::Modeling});
    b.incompatible_with = {"A"};
    auto e = make_component("E", Category::EntropyCoder, {Stage::EntropyCoding});
    ComponentCatalog catalog({a, b, e});
    PipelineGenerator generator(catalog);

    auto pipelines = generator.generate(depth(2, 3));
    bool saw_a_alone = false, saw_b_alone = false;
    for (const auto& pipeline : pipelines) {
        bool has_a = contains_name(pipeline, "A");
        bool has_b = contains_name(pipeline, "B");
        REQUIRE_FALSE((has_a && has_b));
        saw_a_alone = saw_a_alone || (has_a && !has_b);
        saw_b_alone = saw_b_alone || (has_b && !has_a);
    }
    REQUIRE(saw_a_alone);
    REQUIRE(saw_b_alone);
    REQUIRE(names_of(pipelines) ==
            std::vector<Names>{{"A", "A", "E"}, {"A", "E"}, {"B", "B", "E"}, {"B", "E"}});
}

TEST_CASE("Prerequisites must appear earlier", "[pipeline]") {
    auto bwt = make_component("BWT", Category::Transform, {Stage::Transform});
    auto mtf = make_component("MTF", Category::Transform, {Stage::Modeling});
    mtf.prerequisites = {"BWT"};
    auto coder = make_component("Huffman", Category::EntropyCoder, {Stage::EntropyCoding});
    ComponentCatalog catalog({bwt, mtf, coder});
    PipelineGenerator generator(catalog);

    auto pipelines = generator.generate(depth(2, 4));
    REQUIRE(names_of(pipelines) == std::vector<Names>{{"BWT", "MTF", "MTF", "Huffman"},
                                                      {"BWT", "MTF", "Huffman"},
                                                      {"BWT", "Huffman"}});
    for (const auto& pipeline : pipelines) {
        REQUIRE(pipeline.names().front() != "MTF");
    }
}

TEST_CASE("Built-in catalog enumeration", "[pipeline]") {
    ComponentCatalog catalog = component_catalog::default_catalog();
    PipelineGenerator generator(catalog);
    const StageGrammar& grammar = generator.grammar();

    SECTION("Depth two") {
        auto pipelines = generator.generate(depth(2, 2));
        REQUIRE(pipelines.size() == 315);
        REQUIRE(pipelines.front().names() == Names{"Shannon Entropy", "Huffman Coding"});
    }

    SECTION("Depth one, open-ended, lists every start component once") {
        REQUIRE(generator.count(depth(1, 1, false)) == 45);
    }

    SECTION("Invariants up to depth three") {
        auto pipelines = generator.generate(depth(2, 3));
        REQUIRE(pipelines.size() == 7672);
        for (const auto& pipeline : pipelines) {
            REQUIRE(pipeline.size() >= 2);
            REQUIRE(pipeline.size() <= 3);
            REQUIRE(pipeline.entries.back().component->category == Category::EntropyCoder);
            REQUIRE(pipeline.entries.front().stage != Stage::EntropyCoding);
            for (size_t i = 0; i < pipeline.size(); ++i) {
                const auto& entry = pipeline.entries[i];
                REQUIRE(entry.component->valid_at(entry.stage));
                if (i > 0) REQUIRE(grammar.allows(pipeline.entries[i - 1].stage, entry.stage));
                Names earlier;
                for (size_t j = 0; j < i; ++j) earlier.push_back(pipeline.entries[j].component->name);
                for (const auto& required : entry.component->prerequisites) {
                    REQUIRE(std::find(earlier.begin(), earlier.end(), required) != earlier.end());
                }
            }
        }
    }

    SECTION("Enumeration is deterministic") {
        auto first = names_of(generator.generate(depth(2, 3)));
        auto second = names_of(generator.generate(depth(2, 3)));
        REQUIRE(first == second);
    }

    SECTION("Independent streams do not interfere") {
        PipelineStream left = generator.stream(depth(2, 3));
        PipelineStream right = generator.stream(depth(2, 3));
        Pipeline a, b;
        for (int i = 0; i < 50; ++i) {
            REQUIRE(left.next(a));
        }
        REQUIRE(right.next(b));
        REQUIRE(b.names() == Names{"Shannon Entropy", "Burrows-Wheeler Transform", "Huffman Coding"});
    }
}

TEST_CASE("Generator options are checked", "[pipeline]") {
    ComponentCatalog catalog = three_stage_catalog();
    PipelineGenerator generator(catalog, three_stage_grammar());
    REQUIRE_THROWS_AS(generator.generate(depth(0, 3)), std::invalid_argument);
    REQUIRE_THROWS_AS(generator.generate(depth(3, 2)), std::invalid_argument);
    REQUIRE(generator.generate(depth(4, 6)).empty());
}

TEST_CASE("Depth bound far beyond the catalog", "[pipeline]") {
    SECTION("Search ends on the grammar, not the bound") {
        ComponentCatalog catalog = three_stage_catalog();
        PipelineGenerator generator(catalog, three_stage_grammar());
        PipelineStream stream = generator.stream(depth(2, std::numeric_limits<size_t>::max()));
        Pipeline pipeline;
        REQUIRE(stream.next(pipeline));
        REQUIRE(pipeline.names() == Names{"F", "T", "E"});
        REQUIRE(stream.next(pipeline));
        REQUIRE(stream.next(pipeline));
        REQUIRE_FALSE(stream.next(pipeline));
        REQUIRE(generator.count(depth(2, 2000000000)) == 3);
    }

    SECTION("Looping stage grows the stack past its initial capacity") {
        ComponentCatalog catalog({make_component("M", Category::ContextModel, {Stage::Modeling}),
                                  make_component("E", Category::EntropyCoder, {Stage::EntropyCoding})});
        PipelineGenerator generator(catalog);
        auto pipelines = generator.generate(depth(2, 40));
        REQUIRE(pipelines.size() == 39);
        REQUIRE(pipelines.front().entries.size() == 40);
        REQUIRE(pipelines.front().names().back() == "E");
        REQUIRE(pipelines.back().names() == Names{"M", "E"});
    }
}

TEST_CASE("Validating named pipelines", "[pipeline]") {
    ComponentCatalog catalog = component_catalog::default_catalog();
    PipelineGenerator generator(catalog);
    std::string error;

    SECTION("bzip2 chain") {
        Pipeline resolved;
        REQUIRE(generator.validate({"Burrows-Wheeler Transform", "Move-to-Front Transform", "Zero RLE",
                                    "Huffman Coding"},
                                   error, &resolved));
        REQUIRE(resolved.size() == 4);
        REQUIRE(resolved.entries[0].stage == Stage::Transform);
        REQUIRE(resolved.entries[1].stage == Stage::Modeling);
        REQUIRE(resolved.entries[2].stage == Stage::Modeling);
        REQUIRE(resolved.entries[3].stage == Stage::EntropyCoding);
    }

    SECTION("Stage choice depends on the successor") {
        Pipeline resolved;
        REQUIRE(generator.validate({"Delta Encoding", "LZ77 (Sliding Window)", "Huffman Coding"}, error, &resolved));
        REQUIRE(resolved.entries[1].stage == Stage::Modeling);
    }

    SECTION("Empty") {
        REQUIRE_FALSE(generator.validate({}, error));
        REQUIRE(error == "No components specified");
    }

    SECTION("Unknown name") {
        REQUIRE_FALSE(generator.validate({"Shannon Entropy", "Magic"}, error));
        REQUIRE(error == "Component Magic not found");
    }

    SECTION("Missing prerequisite") {
        REQUIRE_FALSE(generator.validate({"Delta Encoding", "Move-to-Front Transform", "Huffman Coding"}, error));
        REQUIRE(error == "Component Move-to-Front Transform requires Burrows-Wheeler Transform earlier in the pipeline");
    }

    SECTION("Cannot start") {
        REQUIRE_FALSE(generator.validate({"Huffman Coding", "Range Coding"}, error));
        REQUIRE(error == "Component Huffman Coding cannot start a pipeline");
    }

    SECTION("Grammar violation") {
        REQUIRE_FALSE(generator.validate({"Huffman Coding"}, error));
        REQUIRE_FALSE(generator.validate({"Order-N Markov Predictor", "Burrows-Wheeler Transform"}, error));
        REQUIRE(error == "Component Burrows-Wheeler Transform cannot follow Order-N Markov Predictor under the stage grammar");
    }
}

TEST_CASE("Validation honours incompatibility in both directions", "[pipeline]") {
    auto a = make_component("A", Category::ContextModel, {Stage::Modeling});
    auto b = make_component("B", Category::ContextModel, {Stage::Modeling});
    b.incompatible_with = {"A"};
    ComponentCatalog catalog({a, b});
    PipelineGenerator generator(catalog);
    std::string error;
    REQUIRE_FALSE(generator.validate({"A", "B"}, error));
    REQUIRE(error == "Component B is incompatible with A");
    REQUIRE_FALSE(generator.validate({"B", "A"}, error));
    REQUIRE(error == "Component A is incompatible with B");
}

TEST_CASE("Compatible neighbours", "[pipeline]") {
    ComponentCatalog catalog = component_catalog::default_catalog();
    PipelineGenerator generator(catalog);

    SECTION("Forward from a transform") {
        auto next = generator.compatible("Burrows-Wheeler Transform", true);
        REQUIRE(std::find(next.begin(), next.end(), catalog.find("Move-to-Front Transform")) != next.end());
        REQUIRE(std::find(next.begin(), next.end(), catalog.find("Huffman Coding")) != next.end());
        REQUIRE(std::find(next.begin(), next.end(), catalog.find("Delta Encoding")) == next.end());
    }

    SECTION("Backward from an entropy coder") {
        auto previous = generator.compatible("Huffman Coding", false);
        REQUIRE(std::find(previous.begin(), previous.end(), catalog.find("Shannon Entropy")) != previous.end());
        REQUIRE(std::find(previous.begin(), previous.end(), catalog.find("Range Coding")) == previous.end());
    }

    SECTION("Coders have no successors") {
        REQUIRE(generator.compatible("Range Coding", true).empty());
    }

    SECTION("Unknown name") {
        REQUIRE(generator.compatible("Magic", true).empty());
    }
}
