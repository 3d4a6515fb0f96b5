#include "corelay/field_container.hpp"
#include <algorithm>

namespace corelay {

const registry& field_container::declared() {
    static const registry reg("field_container");
    return reg;
}

value_cell& field_container::cell(const std::string& name) const {
    auto it = cells_.find(name);
    if (it == cells_.end()) {
        it = cells_.emplace(name, value_cell(name, fields().get(name))).first;
    }
    return it->second;
}

void field_container::assign_arguments(const args_t& args, const kwargs_t& kwargs) {
    const registry& reg = fields();

    std::vector<std::string> positional;
    for (const auto& [name, spec] : reg.entries()) {
        if (spec->positional()) positional.push_back(name);
    }
    if (args.size() > positional.size()) {
        throw type_error("Expected at most " + std::to_string(positional.size()) +
                         " positional arguments, got " + std::to_string(args.size()) + ".");
    }

    kwargs_t assigned;
    for (std::size_t i = 0; i < args.size(); ++i) {
        assigned.emplace_back(positional[i], args[i]);
    }
    for (const auto& [name, v] : kwargs) {
        // Each name is given once, positionally or by keyword
        if (std::any_of(assigned.begin(), assigned.end(), [&](const auto& entry) { return entry.first == name; })) {
            throw type_error(reg.name() + " got multiple values for argument '" + name + "'.");
        }
        if (!reg.contains(name)) {
            throw type_error(reg.name() + " got an unexpected keyword argument '" + name + "'.");
        }
        assigned.emplace_back(name, v);
    }

    for (const auto& [name, v] : assigned) {
        set(name, v);
    }
}

const value& field_container::get(const std::string& name) const {
    return cell(name).get();
}

void field_container::set(const std::string& name, value v) {
    cell(name).set_obj(std::move(v));
}

void field_container::reset(const std::string& name) {
    cell(name).reset_obj();
}

value field_container::default_of(const std::string& name) const {
    return cell(name).default_value();
}

void field_container::set_default(const std::string& name, value v) {
    cell(name).set_default(std::move(v));
}

void field_container::reset_default(const std::string& name) {
    cell(name).reset_default();
}

std::shared_ptr<field_container> field_container::at(const kwargs_t& overrides) const {
    auto result = clone();
    for (const auto& [name, v] : overrides) {
        if (!fields().contains(name)) {
            throw type_error("'" + name + "' is an invalid keyword argument for '" +
                             fields().name() + ".at'.");
        }
        result->set_default(name, v);
    }
    return result;
}

void field_container::reset_defaults() {
    for (const auto& entry : fields().entries()) {
        reset_default(entry.first);
    }
}

void field_container::update_defaults(const kwargs_t& defaults) {
    for (const auto& [name, v] : defaults) {
        set_default(name, v);
    }
}

} // namespace corelay
