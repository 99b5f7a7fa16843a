#include "pipeline_generator.hpp"
#include "complexity.hpp"
#include "variation_expander.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace pipeline_generator {

using component_catalog::kTerminalCategory;
using pipeline_grammar::kStartStages;

namespace {

// Up-front capacity for the backtracking stack; deeper searches grow it on demand.
constexpr size_t kReservedDepth = 16;

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += separator;
        joined += parts[i];
    }
    return joined;
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Either side of the pair may carry the declaration.
bool excludes(const Component& a, const Component& b) {
    return contains(a.incompatible_with, b.name) || contains(b.incompatible_with, a.name);
}

// Insertion-time rule: every prerequisite already present and no entry of the
// prefix excluded by, or excluding, the candidate.
bool fits_after(const Component& candidate, const std::vector<const Component*>& prefix) {
    for (const auto& required : candidate.prerequisites) {
        bool found = std::any_of(prefix.begin(), prefix.end(),
                                 [&required](const Component* comp) { return comp->name == required; });
        if (!found) return false;
    }
    return std::none_of(prefix.begin(), prefix.end(),
                        [&candidate](const Component* comp) { return excludes(candidate, *comp); });
}

} // namespace

void check_options(const GeneratorOptions& options) {
    if (options.min_depth < 1) {
        throw std::invalid_argument("min_depth must be at least 1");
    }
    if (options.max_depth < options.min_depth) {
        throw std::invalid_argument("max_depth (" + std::to_string(options.max_depth) +
                                    ") must not be below min_depth (" + std::to_string(options.min_depth) + ")");
    }
}

std::vector<std::string> Pipeline::names() const {
    std::vector<std::string> result;
    for (const auto& entry : entries) result.push_back(entry.component->name);
    return result;
}

std::vector<std::string> Pipeline::time_costs() const {
    std::vector<std::string> result;
    for (const auto& entry : entries) result.push_back(entry.component->time_cost);
    return result;
}

std::vector<std::string> Pipeline::space_costs() const {
    std::vector<std::string> result;
    for (const auto& entry : entries) result.push_back(entry.component->space_cost);
    return result;
}

std::string Pipeline::total_time_cost() const {
    return combine_complexity(time_costs());
}

std::string Pipeline::total_space_cost() const {
    return combine_complexity(space_costs());
}

bool Pipeline::all_lossless() const {
    return std::all_of(entries.begin(), entries.end(),
                       [](const PipelineEntry& entry) { return entry.component->lossless; });
}

std::string Pipeline::display_name() const {
    return join(names(), " → ");
}

std::string Pipeline::formula() const {
    std::vector<std::string> formulas;
    for (const auto& entry : entries) formulas.push_back(entry.component->formula_ascii);
    return join(formulas, " → ");
}

size_t Pipeline::parameter_space() const {
    size_t total = 1;
    for (const auto& entry : entries) {
        total *= component_catalog::expand(*entry.component).size();
    }
    return total;
}

PipelineStream::PipelineStream(const ComponentCatalog& catalog, const StageGrammar& grammar,
                               const GeneratorOptions& options)
    : catalog_(&catalog), grammar_(&grammar), options_(options) {
    check_options(options_);
    partial_.reserve(std::min(options_.max_depth, kReservedDepth));
    stack_.reserve(std::min(options_.max_depth, kReservedDepth));
}

bool PipelineStream::admissible(const Component& candidate) const {
    std::vector<const Component*> prefix;
    prefix.reserve(partial_.size());
    for (const auto& entry : partial_) prefix.push_back(entry.component);
    return fits_after(candidate, prefix);
}

bool PipelineStream::is_complete() const {
    if (partial_.size() < options_.min_depth) return false;
    return !options_.require_terminal_category || partial_.back().component->category == kTerminalCategory;
}

bool PipelineStream::push_next_root() {
    while (root_stage_ < kStartStages.size()) {
        Stage stage = kStartStages[root_stage_];
        const auto& candidates = catalog_->by_stage(stage);
        while (root_index_ < candidates.size()) {
            const Component* candidate = candidates[root_index_++];
            if (admissible(*candidate)) {
                partial_.push_back({candidate, stage});
                stack_.push_back(Frame{stage});
                return true;
            }
        }
        ++root_stage_;
        root_index_ = 0;
    }
    return false;
}

// Frames are addressed by index: the push below may reallocate stack_.
bool PipelineStream::push_next_child(size_t frame_index) {
    const auto& next_stages = grammar_->successors(stack_[frame_index].stage);
    while (stack_[frame_index].successor < next_stages.size()) {
        Stage next_stage = next_stages[stack_[frame_index].successor];
        const auto& candidates = catalog_->by_stage(next_stage);
        while (stack_[frame_index].candidate < candidates.size()) {
            const Component* candidate = candidates[stack_[frame_index].candidate++];
            if (admissible(*candidate)) {
                partial_.push_back({candidate, next_stage});
                stack_.push_back(Frame{next_stage});
                return true;
            }
        }
        ++stack_[frame_index].successor;
        stack_[frame_index].candidate = 0;
    }
    return false;
}

bool PipelineStream::next(Pipeline& out) {
    while (true) {
        if (stack_.empty()) {
            if (!push_next_root()) return false;
            continue;
        }

        Frame& top = stack_.back();
        if (!top.visited) {
            top.visited = true;
            if (partial_.size() >= options_.max_depth) {
                top.successor = grammar_->successors(top.stage).size();
            }
            if (is_complete()) {
                out.entries = partial_;
                ++emitted_;
                return true;
            }
            continue;
        }

        if (!push_next_child(stack_.size() - 1)) {
            stack_.pop_back();
            partial_.pop_back();
        }
    }
}

PipelineGenerator::PipelineGenerator(const ComponentCatalog& catalog, StageGrammar grammar)
    : catalog_(&catalog), grammar_(std::move(grammar)) {}

PipelineStream PipelineGenerator::stream(const GeneratorOptions& options) const {
    return PipelineStream(*catalog_, grammar_, options);
}

void PipelineGenerator::for_each(const GeneratorOptions& options,
                                 const std::function<bool(const Pipeline&)>& visit) const {
    PipelineStream pipelines = stream(options);
    Pipeline pipeline;
    while (pipelines.next(pipeline)) {
        if (!visit(pipeline)) break;
    }
}

std::vector<Pipeline> PipelineGenerator::generate(const GeneratorOptions& options) const {
    std::vector<Pipeline> result;
    for_each(options, [&result](const Pipeline& pipeline) {
        result.push_back(pipeline);
        return true;
    });
    return result;
}

size_t PipelineGenerator::count(const GeneratorOptions& options) const {
    PipelineStream pipelines = stream(options);
    Pipeline pipeline;
    while (pipelines.next(pipeline)) {
    }
    return pipelines.emitted();
}

bool PipelineGenerator::validate(const std::vector<std::string>& names, std::string& error,
                                 Pipeline* resolved) const {
    if (names.empty()) {
        error = "No components specified";
        return false;
    }

    std::vector<const Component*> components;
    for (size_t i = 0; i < names.size(); ++i) {
        const Component* comp = catalog_->find(names[i]);
        if (!comp) {
            error = "Component " + names[i] + " not found";
            return false;
        }
        std::vector<std::string> prefix(names.begin(), names.begin() + static_cast<std::ptrdiff_t>(i));
        for (const auto& required : comp->prerequisites) {
            if (!contains(prefix, required)) {
                error = "Component " + comp->name + " requires " + required + " earlier in the pipeline";
                return false;
            }
        }
        for (const Component* earlier : components) {
            if (excludes(*comp, *earlier)) {
                error = "Component " + comp->name + " is incompatible with " + earlier->name;
                return false;
            }
        }
        components.push_back(comp);
    }

    // parent[i][s]: stage of entry i-1 that lets entry i sit at stage s;
    // -1 marks a valid start, -2 an unreachable stage.
    std::vector<std::array<int, 4>> parent(components.size());
    for (auto& row : parent) row.fill(-2);

    for (Stage stage : kStartStages) {
        if (components[0]->valid_at(stage)) parent[0][static_cast<int>(stage)] = -1;
    }
    if (std::all_of(parent[0].begin(), parent[0].end(), [](int p) { return p == -2; })) {
        error = "Component " + components[0]->name + " cannot start a pipeline";
        return false;
    }

    for (size_t i = 1; i < components.size(); ++i) {
        bool reachable = false;
        for (Stage from : component_catalog::kAllStages) {
            if (parent[i - 1][static_cast<int>(from)] == -2) continue;
            for (Stage to : grammar_.successors(from)) {
                if (components[i]->valid_at(to) && parent[i][static_cast<int>(to)] == -2) {
                    parent[i][static_cast<int>(to)] = static_cast<int>(from);
                    reachable = true;
                }
            }
        }
        if (!reachable) {
            error = "Component " + components[i]->name + " cannot follow " + components[i - 1]->name +
                    " under the stage grammar";
            return false;
        }
    }

    if (resolved) {
        resolved->entries.assign(components.size(), PipelineEntry{nullptr, Stage::PreFilter});
        int stage = 0;
        while (parent.back()[stage] == -2) ++stage;
        for (size_t i = components.size(); i-- > 0;) {
            resolved->entries[i] = {components[i], static_cast<Stage>(stage)};
            stage = parent[i][stage];
        }
    }
    return true;
}

std::vector<const Component*> PipelineGenerator::compatible(const std::string& name, bool forward) const {
    std::vector<const Component*> result;
    const Component* comp = catalog_->find(name);
    if (!comp) return result;

    auto add = [&result](const Component* other) {
        if (std::find(result.begin(), result.end(), other) == result.end()) result.push_back(other);
    };

    if (forward) {
        for (Stage stage : comp->valid_stages) {
            for (Stage next_stage : grammar_.successors(stage)) {
                for (const Component* other : catalog_->by_stage(next_stage)) {
                    if (!excludes(*comp, *other)) add(other);
                }
            }
        }
    } else {
        for (const auto& other : catalog_->components()) {
            if (excludes(*comp, other)) continue;
            bool adjacent = false;
            for (Stage from : other.valid_stages) {
                for (Stage to : comp->valid_stages) {
                    if (grammar_.allows(from, to)) adjacent = true;
                }
            }
            if (adjacent) add(&other);
        }
    }
    return result;
}

} // namespace pipeline_generator
