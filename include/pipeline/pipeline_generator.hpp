#ifndef PIPELINE_GENERATOR_HPP
#define PIPELINE_GENERATOR_HPP

#include "component_catalog.hpp"
#include "stage_grammar.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace pipeline_generator {

using component_catalog::Component;
using component_catalog::ComponentCatalog;
using component_catalog::Stage;
using pipeline_grammar::StageGrammar;

constexpr size_t kDefaultMinDepth = 2;
constexpr size_t kDefaultMaxDepth = 6;

struct GeneratorOptions {
    size_t min_depth = kDefaultMinDepth;   // inclusive
    size_t max_depth = kDefaultMaxDepth;   // inclusive
    bool require_terminal_category = true; // last entry must be an entropy coder
};

// Throws std::invalid_argument for min_depth < 1 or max_depth < min_depth.
void check_options(const GeneratorOptions& options);

struct PipelineEntry {
    const Component* component; // owned by the catalog
    Stage stage;                // stage the component was inserted under
};

struct Pipeline {
    std::vector<PipelineEntry> entries;

    size_t size() const { return entries.size(); }
    std::vector<std::string> names() const;
    std::vector<std::string> time_costs() const;
    std::vector<std::string> space_costs() const;
    std::string total_time_cost() const;
    std::string total_space_cost() const;
    bool all_lossless() const;
    std::string display_name() const; // "A → B → C"
    std::string formula() const;      // ASCII formulas joined the same way
    // Number of concrete parameterisations: product of each entry's variation count.
    size_t parameter_space() const;
};

// Pull-based depth-first enumeration. Each stream owns its backtracking
// stack; the catalog and grammar are only read and must outlive the stream.
class PipelineStream {
public:
    PipelineStream(const ComponentCatalog& catalog, const StageGrammar& grammar, const GeneratorOptions& options);

    // Writes the next complete pipeline into out; false once exhausted.
    bool next(Pipeline& out);
    size_t emitted() const { return emitted_; }

private:
    struct Frame {
        Stage stage;
        size_t successor = 0; // index into grammar successors of stage
        size_t candidate = 0; // index into catalog.by_stage(successor stage)
        bool visited = false; // completion check done for this node
    };

    const ComponentCatalog* catalog_;
    const StageGrammar* grammar_;
    GeneratorOptions options_;
    std::vector<PipelineEntry> partial_;
    std::vector<Frame> stack_;
    size_t root_stage_ = 0;
    size_t root_index_ = 0;
    size_t emitted_ = 0;

    bool admissible(const Component& candidate) const;
    bool is_complete() const;
    bool push_next_root();
    bool push_next_child(size_t frame_index);
};

class PipelineGenerator {
public:
    explicit PipelineGenerator(const ComponentCatalog& catalog, StageGrammar grammar = StageGrammar::standard());

    PipelineStream stream(const GeneratorOptions& options = {}) const;
    // Visits pipelines in emission order until visit returns false.
    void for_each(const GeneratorOptions& options, const std::function<bool(const Pipeline&)>& visit) const;
    std::vector<Pipeline> generate(const GeneratorOptions& options = {}) const;
    size_t count(const GeneratorOptions& options = {}) const;

    // Checks a named sequence against the grammar and the prerequisite and
    // incompatibility rules. On success the stage assignment is written to
    // resolved when given.
    bool validate(const std::vector<std::string>& names, std::string& error, Pipeline* resolved = nullptr) const;

    // Components that may directly follow (forward) or precede (backward) the
    // named one. Prerequisites are not considered: they can be met further upstream.
    std::vector<const Component*> compatible(const std::string& name, bool forward) const;

    const ComponentCatalog& catalog() const { return *catalog_; }
    const StageGrammar& grammar() const { return grammar_; }

private:
    const ComponentCatalog* catalog_;
    StageGrammar grammar_;
};

} // namespace pipeline_generator

#endif // PIPELINE_GENERATOR_HPP
