#pragma once

#ifdef __cplusplus

#include "stage.hpp"
#include <concepts>
#include <memory>
#include <string>
#include <vector>

namespace corelay {

/// Field holding a stage of a given type. Callables assigned to it are
/// wrapped into function stages before validation.
class task_field : public field {
public:
    task_field(value default_value, validator_t validator, std::string constraint);

    value coerce(const value& v) const override;
};

/// Task constrained to stages of type T. The default (identity when absent)
/// goes through ensure_stage, with `defaults` applied to it.
template<typename T = stage>
    requires std::derived_from<T, stage>
std::shared_ptr<const task_field> make_task(const value& default_value = identity(),
                                            const kwargs_t& defaults = {}) {
    value stage_default;
    if (default_value.has_value()) {
        stage_default = ensure_stage(default_value, defaults);
    }
    auto validator = [](const value& v) {
        return v.holds<std::shared_ptr<stage>>() &&
               dynamic_cast<const T*>(v.as_stage().get()) != nullptr;
    };
    std::string constraint;
    if constexpr (!std::is_same_v<T, stage>) {
        constraint = T::declared().name();
    }
    return std::make_shared<const task_field>(std::move(stage_default), validator, std::move(constraint));
}

/// Stage running its task fields in declaration order.
///
/// The result aggregates the outputs of tasks flagged is_output: none flagged
/// returns the last output, one returns it unwrapped, several return a tuple.
class pipeline : public stage {
public:
    static const registry& declared();
    const registry& fields() const override { return declared(); }

    value operation(const value& input) override;

    /// Current stage of every task, in declaration order.
    std::vector<std::shared_ptr<stage>> tasks() const;

    /// Trailing tasks from the last checkpoint-flagged one to the end.
    std::vector<std::shared_ptr<stage>> checkpoint_stages() const;

    /// Reruns the tasks after the last checkpoint, starting from its data.
    value resume_from_checkpoint();

    std::string repr() const override;
};

} // namespace corelay

#endif // __cplusplus
