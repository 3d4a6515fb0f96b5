#include "corelay/stage.hpp"
#include "corelay/log.hpp"
#include "corelay/storage.hpp"
#include <sstream>

namespace corelay {

const registry& stage::declared() {
    static const registry reg = registry::derive("stage", field_container::declared(), {
        {"is_output", make_param(kind::boolean, false)},
        {"is_checkpoint", make_param(kind::boolean, false)},
        {"cache", make_param(kind::storage, value(std::make_shared<null_storage>()))},
    });
    return reg;
}

std::shared_ptr<storage_backend> stage::cache() const {
    return get_as<std::shared_ptr<storage_backend>>("cache");
}

value stage::operator()(const value& input) {
    auto storage = cache();
    mapping_t meta = identifiers();

    value result;
    bool cached = false;
    try {
        result = storage->read(input, meta);
        cached = true;
    } catch (const no_data_source&) {
        cached = false;
    }

    if (cached) {
        LOG_DEBUG("stage", "%s: cache hit", fields().name().c_str());
    } else {
        result = operation(input);
        try {
            storage->write(result, input, meta);
        } catch (const no_data_target&) {
            LOG_DEBUG("stage", "%s: result not cached", fields().name().c_str());
        }
    }

    if (is_checkpoint()) {
        checkpoint_data_ = result;
    }
    return result;
}

mapping_t stage::identifiers() const {
    mapping_t result;
    result.emplace_back("name", value(fields().name()));
    for (const auto& [name, spec] : collect<param>()) {
        if (spec->identifier()) {
            result.emplace_back(name, get(name));
        }
    }
    return result;
}

mapping_t stage::param_values() const {
    return collect_values<param>();
}

std::shared_ptr<stage> stage::copy() const {
    return std::dynamic_pointer_cast<stage>(clone());
}

std::shared_ptr<stage> stage::at(const kwargs_t& overrides) const {
    return std::dynamic_pointer_cast<stage>(field_container::at(overrides));
}

std::string stage::repr() const {
    std::ostringstream out;
    out << fields().name() << '(';
    bool first = true;
    for (const auto& [name, spec] : fields().entries()) {
        if (!first) out << ", ";
        first = false;
        const value_cell& c = cell(name);
        out << name << '=' << (c.is_set() ? c.get().repr() : std::string("<unset>"));
    }
    out << ')';
    return out.str();
}

// ============================================================================
// function_stage
// ============================================================================

value function_stage::operation(const value& input) {
    const callable& fn = get("function").as_callable();
    if (get_as<bool>("bind_self")) {
        return fn(*this, input);
    }
    return fn(input);
}

std::shared_ptr<stage> ensure_stage(const value& v, const kwargs_t& defaults) {
    std::shared_ptr<stage> result;
    if (v.holds<std::shared_ptr<stage>>()) {
        result = v.as_stage();
    } else if (v.holds<callable>()) {
        result = make<function_stage>({{"function", v}});
    } else {
        throw type_error("Cannot use " + std::string(kind_name(v.type())) + " " + v.repr() +
                         " as a stage: it is neither a stage nor callable.");
    }
    if (!result) {
        throw type_error("Cannot use an empty stage pointer as a stage.");
    }
    result->update_defaults(defaults);
    return result;
}

} // namespace corelay
