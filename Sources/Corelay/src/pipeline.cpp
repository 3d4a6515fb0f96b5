#include "corelay/pipeline.hpp"
#include "corelay/log.hpp"
#include <algorithm>
#include <sstream>

namespace corelay {

task_field::task_field(value default_value, validator_t validator, std::string constraint)
    : field(kind::stage, std::move(default_value), {}, std::move(validator), std::move(constraint)) {}

value task_field::coerce(const value& v) const {
    if (v.holds<callable>()) {
        return value(ensure_stage(v));
    }
    return v;
}

// ============================================================================
// pipeline
// ============================================================================

const registry& pipeline::declared() {
    static const registry reg = registry::derive("pipeline", stage::declared(), {});
    return reg;
}

std::vector<std::shared_ptr<stage>> pipeline::tasks() const {
    std::vector<std::shared_ptr<stage>> result;
    for (const auto& entry : collect<task_field>()) {
        result.push_back(get(entry.first).as_stage());
    }
    return result;
}

value pipeline::operation(const value& input) {
    value data = input;
    tuple_t outputs;
    for (const auto& task : tasks()) {
        data = (*task)(data);
        if (task->is_output()) {
            outputs.push_back(data);
        }
    }

    if (outputs.empty()) return data;
    if (outputs.size() == 1) return outputs.front();
    return value(std::move(outputs));
}

std::vector<std::shared_ptr<stage>> pipeline::checkpoint_stages() const {
    auto all = tasks();
    if (all.empty()) return {};

    std::vector<std::shared_ptr<stage>> found;
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
        found.push_back(*it);
        if ((*it)->is_checkpoint()) {
            std::reverse(found.begin(), found.end());
            return found;
        }
    }
    throw pipeline_error("No checkpoints were defined.");
}

value pipeline::resume_from_checkpoint() {
    auto stages = checkpoint_stages();
    if (stages.empty()) {
        throw pipeline_error("Pipeline " + fields().name() + " has no tasks to resume.");
    }

    value data = stages.front()->checkpoint_data();
    if (data.is_none()) {
        throw pipeline_error("No checkpoint data found, the whole pipeline must be run first "
                             "for a checkpoint to exist.");
    }

    LOG_DEBUG("pipeline", "%s: resuming %zu stages after checkpoint",
              fields().name().c_str(), stages.size() - 1);
    for (std::size_t i = 1; i < stages.size(); ++i) {
        data = (*stages[i])(data);
    }
    return data;
}

std::string pipeline::repr() const {
    std::ostringstream out;
    out << fields().name() << "(\n";
    for (const auto& entry : collect<task_field>()) {
        const value_cell& c = cell(entry.first);
        out << "    " << entry.first << ": "
            << (c.is_set() ? c.get().repr() : std::string("<unset>")) << "\n";
    }
    out << ")";
    return out.str();
}

} // namespace corelay
