#include "stage_grammar.hpp"
#include <algorithm>

namespace pipeline_grammar {

namespace {

size_t slot(Stage stage) {
    int value = static_cast<int>(stage);
    if (value < 0 || value > 3) {
        throw GrammarError("Stage " + std::to_string(value) + " is outside the grammar");
    }
    return static_cast<size_t>(value);
}

} // namespace

StageGrammar::StageGrammar() : StageGrammar(Table{
    {Stage::PreFilter, {Stage::Transform, Stage::Modeling, Stage::EntropyCoding}},
    {Stage::Transform, {Stage::Modeling, Stage::EntropyCoding}},
    {Stage::Modeling, {Stage::Modeling, Stage::EntropyCoding}},
    {Stage::EntropyCoding, {}},
}) {}

StageGrammar::StageGrammar(const Table& table) {
    for (const auto& [from, targets] : table) {
        auto& successors = transitions_[slot(from)];
        for (Stage to : targets) {
            slot(to);
            if (std::find(successors.begin(), successors.end(), to) != successors.end()) {
                throw GrammarError("Transition " + std::to_string(static_cast<int>(from)) + " -> " +
                                   std::to_string(static_cast<int>(to)) + " declared twice");
            }
            successors.push_back(to);
        }
    }
    if (!transitions_[slot(Stage::EntropyCoding)].empty()) {
        throw GrammarError("The entropy-coding stage must not have successors");
    }
}

StageGrammar StageGrammar::standard() {
    return StageGrammar();
}

const std::vector<Stage>& StageGrammar::successors(Stage stage) const {
    return transitions_[slot(stage)];
}

bool StageGrammar::allows(Stage from, Stage to) const {
    const auto& next = successors(from);
    return std::find(next.begin(), next.end(), to) != next.end();
}

} // namespace pipeline_grammar
