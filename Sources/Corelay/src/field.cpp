#include "corelay/field.hpp"

namespace corelay {

field::field(type_set dtype, value default_value, field_options options,
             validator_t validator, std::string constraint)
    : dtype_(std::move(dtype)),
      default_(std::move(default_value)),
      options_(options),
      validator_(std::move(validator)),
      constraint_(std::move(constraint)) {
    if (dtype_.empty()) {
        throw type_error("A field needs at least one accepted type.");
    }
    if (options_.mandatory) {
        default_ = value();
    }
    validate_default();
}

void field::validate_default() {
    if (!accepts(default_)) {
        throw type_error("Default value " + default_.repr() + " does not match the field type " +
                         describe() + ".");
    }
}

bool field::accepts(const value& v) const {
    if (v.is_none()) return true;
    if (!dtype_.accepts(v)) return false;
    return !validator_ || validator_(v);
}

void field::check(const std::string& name, const value& v) const {
    if (!accepts(v)) {
        throw type_error("Field '" + name + "' expects " + describe() + ", got " +
                         kind_name(v.type()) + " " + v.repr() + ".");
    }
}

std::string field::describe() const {
    if (constraint_.empty()) return dtype_.to_string();
    return dtype_.to_string() + "(" + constraint_ + ")";
}

std::shared_ptr<const param> make_param(type_set dtype, value default_value, field_options options) {
    return std::make_shared<const param>(std::move(dtype), std::move(default_value), options);
}

// ============================================================================
// value_cell
// ============================================================================

value_cell::value_cell(std::string name, std::shared_ptr<const field> spec)
    : name_(std::move(name)), spec_(std::move(spec)) {}

const value& value_cell::get() const {
    if (obj_.has_value()) return obj_;
    const value& fallback_value = default_value();
    if (fallback_value.has_value()) return fallback_value;
    throw unset_field_error("Mandatory field '" + name_ + "' was accessed without being set.");
}

bool value_cell::is_set() const {
    return obj_.has_value() || default_value().has_value();
}

value value_cell::validated(value v) const {
    if (v.is_none()) return v;
    value coerced = spec_->coerce(v);
    spec_->check(name_, coerced);
    return coerced;
}

void value_cell::set_obj(value v) {
    // Only replaces the stored value once validation succeeded
    obj_ = validated(std::move(v));
}

const value& value_cell::default_value() const {
    return default_.has_value() ? default_ : spec_->default_value();
}

void value_cell::set_default(value v) {
    default_ = validated(std::move(v));
}

} // namespace corelay
