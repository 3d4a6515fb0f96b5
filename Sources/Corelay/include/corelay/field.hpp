#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <functional>
#include <memory>
#include <string>

namespace corelay {

struct field_options {
    bool mandatory = false;    ///< no default; reading while unset throws
    bool positional = false;   ///< may be passed as a positional constructor argument
    bool identifier = false;   ///< part of a stage's identifying metadata
};

/// Typed, defaultable attribute specification. Descriptors are immutable once
/// constructed and are shared by every instance of the declaring type.
class field {
public:
    using validator_t = std::function<bool(const value&)>;

    field(type_set dtype, value default_value = {}, field_options options = {},
          validator_t validator = {}, std::string constraint = {});
    virtual ~field() = default;

    const type_set& dtype() const { return dtype_; }
    const value& default_value() const { return default_; }

    bool mandatory() const { return options_.mandatory; }
    bool positional() const { return options_.positional; }
    bool identifier() const { return options_.identifier; }

    /// True when `v` satisfies the dtype and the extra validator. Absent
    /// values are always accepted (they mean "not set").
    bool accepts(const value& v) const;

    /// Hook applied to every value before it is validated and stored.
    virtual value coerce(const value& v) const { return v; }

    /// Throws a descriptive type_error naming `name` if `v` is not accepted.
    void check(const std::string& name, const value& v) const;

    /// Accepted types, e.g. "integer" or "stage(my_stage)".
    std::string describe() const;

protected:
    void validate_default();

    type_set dtype_;
    value default_;
    field_options options_;
    validator_t validator_;
    std::string constraint_;
};

/// Plain configuration parameter.
class param : public field {
public:
    using field::field;
};

std::shared_ptr<const param> make_param(type_set dtype, value default_value = {}, field_options options = {});

// ============================================================================
// Value cell
// ============================================================================

/// Per-instance storage of one field. The effective value resolves as
/// explicit value, then instance default, then the field's default.
class value_cell {
public:
    value_cell(std::string name, std::shared_ptr<const field> spec);

    const std::string& name() const { return name_; }
    const field& spec() const { return *spec_; }

    /// Effective value. Throws unset_field_error when nothing is set.
    const value& get() const;
    bool is_set() const;

    const value& obj() const { return obj_; }
    void set_obj(value v);
    void reset_obj() { obj_ = value(); }

    /// Instance default, falling back to the field default.
    const value& default_value() const;
    void set_default(value v);
    void reset_default() { default_ = value(); }

    const value& fallback() const { return spec_->default_value(); }

private:
    value validated(value v) const;

    std::string name_;
    std::shared_ptr<const field> spec_;
    value obj_;
    value default_;
};

} // namespace corelay

#endif // __cplusplus
