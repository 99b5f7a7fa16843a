#include <catch2/catch.hpp>
#include "stage_grammar.hpp"

using namespace pipeline_grammar;
using Stages = std::vector<Stage>;

TEST_CASE("Standard grammar", "[grammar]") {
    StageGrammar grammar = StageGrammar::standard();
    REQUIRE(grammar.successors(Stage::PreFilter) == Stages{Stage::Transform, Stage::Modeling, Stage::EntropyCoding});
    REQUIRE(grammar.successors(Stage::Transform) == Stages{Stage::Modeling, Stage::EntropyCoding});
    REQUIRE(grammar.successors(Stage::Modeling) == Stages{Stage::Modeling, Stage::EntropyCoding});
    REQUIRE(grammar.successors(Stage::EntropyCoding).empty());

    REQUIRE(grammar.allows(Stage::Modeling, Stage::Modeling));
    REQUIRE(grammar.allows(Stage::PreFilter, Stage::EntropyCoding));
    REQUIRE_FALSE(grammar.allows(Stage::Transform, Stage::Transform));
    REQUIRE_FALSE(grammar.allows(Stage::EntropyCoding, Stage::PreFilter));
    REQUIRE_FALSE(grammar.allows(Stage::Modeling, Stage::Transform));
}

TEST_CASE("Custom grammars", "[grammar]") {
    SECTION("Unlisted stages have no successors") {
        StageGrammar grammar(StageGrammar::Table{{Stage::PreFilter, {Stage::Transform, Stage::EntropyCoding}},
                                                 {Stage::Transform, {Stage::EntropyCoding}}});
        REQUIRE(grammar.successors(Stage::PreFilter) == Stages{Stage::Transform, Stage::EntropyCoding});
        REQUIRE(grammar.successors(Stage::Modeling).empty());
        REQUIRE_FALSE(grammar.allows(Stage::PreFilter, Stage::Modeling));
    }

    SECTION("Entropy coding stage is terminal") {
        REQUIRE_THROWS_AS(StageGrammar(StageGrammar::Table{{Stage::EntropyCoding, {Stage::Modeling}}}), GrammarError);
    }

    SECTION("Successor outside the stage domain") {
        REQUIRE_THROWS_AS(StageGrammar(StageGrammar::Table{{Stage::PreFilter, {static_cast<Stage>(9)}}}),
                          GrammarError);
    }

    SECTION("Transition declared twice") {
        REQUIRE_THROWS_AS(StageGrammar(StageGrammar::Table{{Stage::Transform, {Stage::Modeling, Stage::Modeling}}}),
                          GrammarError);
    }
}
