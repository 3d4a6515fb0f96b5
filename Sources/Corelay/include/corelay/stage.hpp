#pragma once

#ifdef __cplusplus

#include "field_container.hpp"
#include <memory>
#include <string>

namespace corelay {

class storage_backend;

/// One computation step. Invoking a stage consults its cache backend before
/// running `operation`, writes fresh results back, and keeps the result as
/// checkpoint data when flagged.
///
/// Fields: is_output (false), is_checkpoint (false), cache (null_storage).
class stage : public field_container {
public:
    static const registry& declared();
    const registry& fields() const override { return declared(); }

    value operator()(const value& input);
    value invoke(const value& input) { return (*this)(input); }

    virtual value operation(const value& input) = 0;

    /// {"name": type name} followed by every identifier param.
    mapping_t identifiers() const;
    mapping_t param_values() const;

    std::shared_ptr<stage> copy() const;
    std::shared_ptr<stage> at(const kwargs_t& overrides) const;

    /// e.g. "scale(is_output=false, is_checkpoint=false, cache=null_storage, factor=2)"
    virtual std::string repr() const;

    bool is_output() const { return get_as<bool>("is_output"); }
    bool is_checkpoint() const { return get_as<bool>("is_checkpoint"); }
    std::shared_ptr<storage_backend> cache() const;

    const value& checkpoint_data() const { return checkpoint_data_; }
    void set_checkpoint_data(value data) { checkpoint_data_ = std::move(data); }

private:
    value checkpoint_data_;
};

/// Stage delegating to a callable. With bind_self the callable receives the
/// stage as first argument.
class function_stage : public stage {
    CORELAY_FIELDS(function_stage, stage,
        {"function", make_param(kind::function, identity(), {.positional = true})},
        {"bind_self", make_param(kind::boolean, false)})

public:
    value operation(const value& input) override;
};

/// Stages pass through; callables are wrapped into a function_stage.
/// `defaults` are applied to the result's instance defaults.
std::shared_ptr<stage> ensure_stage(const value& v, const kwargs_t& defaults = {});

} // namespace corelay

#endif // __cplusplus
