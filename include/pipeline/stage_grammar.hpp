#ifndef STAGE_GRAMMAR_HPP
#define STAGE_GRAMMAR_HPP

#include "component.hpp"
#include <array>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace pipeline_grammar {

using component_catalog::Stage;

class GrammarError : public std::runtime_error {
public:
    explicit GrammarError(const std::string& what) : std::runtime_error(what) {}
};

// Stages a search may start from, tried in this order.
constexpr std::array<Stage, 3> kStartStages = {Stage::PreFilter, Stage::Transform, Stage::Modeling};

// Which stage may directly follow which. The entropy-coding stage is terminal.
class StageGrammar {
public:
    using Table = std::map<Stage, std::vector<Stage>>;

    StageGrammar();
    explicit StageGrammar(const Table& table);

    // 0 -> {1,2,3}, 1 -> {2,3}, 2 -> {2,3}, 3 -> {}
    static StageGrammar standard();

    const std::vector<Stage>& successors(Stage stage) const;
    bool allows(Stage from, Stage to) const;

private:
    std::array<std::vector<Stage>, 4> transitions_;
};

} // namespace pipeline_grammar

#endif // STAGE_GRAMMAR_HPP
