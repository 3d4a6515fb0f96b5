#pragma once

#ifdef __cplusplus

#include "registry.hpp"
#include <concepts>
#include <map>
#include <memory>
#include <string>

namespace corelay {

/// Base of every configurable type. Field values live in a per-instance side
/// table of value cells, created on first access.
class field_container {
public:
    field_container() = default;
    virtual ~field_container() = default;

    field_container(const field_container&) = default;
    field_container& operator=(const field_container&) = default;

    /// Root registry (no fields).
    static const registry& declared();
    virtual const registry& fields() const { return declared(); }

    /// Copy of the dynamic type, emitted by CORELAY_FIELDS.
    virtual std::shared_ptr<field_container> clone() const = 0;

    /// Wires constructor arguments to fields. Positional arguments bind, in
    /// declaration order, to fields flagged positional.
    void assign_arguments(const args_t& args, const kwargs_t& kwargs);

    const value& get(const std::string& name) const;
    void set(const std::string& name, value v);
    void reset(const std::string& name);

    template<typename T>
    T get_as(const std::string& name) const { return get(name).as<T>(); }

    value default_of(const std::string& name) const;
    void set_default(const std::string& name, value v);
    void reset_default(const std::string& name);

    /// Copy of this container with `overrides` applied at the default level.
    std::shared_ptr<field_container> at(const kwargs_t& overrides) const;

    template<typename Kind>
    std::vector<std::pair<std::string, std::shared_ptr<const Kind>>> collect() const {
        return fields().template collect<Kind>();
    }

    /// Current effective values of every field of `Kind`.
    template<typename Kind>
    mapping_t collect_values() const {
        mapping_t result;
        for (const auto& entry : collect<Kind>()) {
            result.emplace_back(entry.first, get(entry.first));
        }
        return result;
    }

    void reset_defaults();
    void update_defaults(const kwargs_t& defaults);

    value_cell& cell(const std::string& name) const;

private:
    mutable std::map<std::string, value_cell> cells_;
};

/// Builds a container and assigns keyword arguments.
template<typename T>
    requires std::derived_from<T, field_container>
std::shared_ptr<T> make(const kwargs_t& kwargs = {}) {
    auto obj = std::make_shared<T>();
    obj->assign_arguments({}, kwargs);
    return obj;
}

template<typename T>
    requires std::derived_from<T, field_container>
std::shared_ptr<T> make_positional(const args_t& args, const kwargs_t& kwargs = {}) {
    auto obj = std::make_shared<T>();
    obj->assign_arguments(args, kwargs);
    return obj;
}

} // namespace corelay

#endif // __cplusplus
