#include "corelay/registry.hpp"

namespace corelay {

registry::registry(std::string name) : name_(std::move(name)) {}

registry registry::derive(std::string name, const registry& parent,
                          std::initializer_list<declaration> declarations) {
    registry result(std::move(name));
    result.entries_ = parent.entries_;
    result.index_ = parent.index_;
    for (const auto& decl : declarations) {
        result.declare(decl.name, decl.spec);
    }
    return result;
}

void registry::declare(const std::string& field_name, std::shared_ptr<const field> spec) {
    if (!spec) {
        throw type_error("Field '" + field_name + "' of " + name_ + " has no descriptor.");
    }
    auto it = index_.find(field_name);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(spec);
        return;
    }
    index_.emplace(field_name, entries_.size());
    entries_.emplace_back(field_name, std::move(spec));
}

bool registry::contains(const std::string& field_name) const {
    return index_.count(field_name) > 0;
}

const std::shared_ptr<const field>& registry::get(const std::string& field_name) const {
    auto it = index_.find(field_name);
    if (it == index_.end()) {
        throw unknown_field_error("'" + name_ + "' has no field '" + field_name + "'.");
    }
    return entries_[it->second].second;
}

std::vector<std::string> registry::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace corelay
