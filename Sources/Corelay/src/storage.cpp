#include "corelay/storage.hpp"

namespace corelay {

open_mode parse_open_mode(const std::string& mode) {
    if (mode == "r") return open_mode::read;
    if (mode == "w") return open_mode::write;
    if (mode == "a") return open_mode::append;
    throw type_error("Mode should be set to \"w\", \"r\", or \"a\", got \"" + mode + "\".");
}

// ============================================================================
// keyed_storage
// ============================================================================

const registry& keyed_storage::declared() {
    static const registry reg = registry::derive("keyed_storage", field_container::declared(), {
        {"data_key", make_param(kind::string)},
    });
    return reg;
}

std::shared_ptr<keyed_storage> keyed_storage::at(const kwargs_t& overrides) const {
    return std::dynamic_pointer_cast<keyed_storage>(field_container::at(overrides));
}

bool keyed_storage::contains(const std::string& key) const {
    return at({{"data_key", key}})->exists();
}

value keyed_storage::load(const std::string& key) const {
    return at({{"data_key", key}})->read({}, {});
}

void keyed_storage::store(const std::string& key, const value& v) const {
    at({{"data_key", key}})->write(v, {}, {});
}

// ============================================================================
// null_storage
// ============================================================================

value null_storage::read(const value&, const mapping_t&) {
    throw no_data_source("No data source available.");
}

void null_storage::write(const value&, const value&, const mapping_t&) {
    throw no_data_target("No data target available.");
}

bool null_storage::exists() {
    throw no_data_source("No data source available.");
}

std::vector<std::string> null_storage::keys() {
    throw no_data_source("No data source available.");
}

} // namespace corelay
