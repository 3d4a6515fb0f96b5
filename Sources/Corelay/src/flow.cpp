#include "corelay/flow.hpp"

namespace corelay {

namespace {

value extract_indices(const tuple_t& data, const tuple_t& indices) {
    tuple_t result;
    result.reserve(indices.size());
    for (const auto& index : indices) {
        if (index.holds<tuple_t>()) {
            result.push_back(extract_indices(data, index.as_tuple()));
            continue;
        }
        if (!index.holds<int64_t>()) {
            throw type_error("Shaper indices must be integers or tuples of integers, got " +
                             index.repr() + ".");
        }
        int64_t position = index.as_int();
        auto size = static_cast<int64_t>(data.size());
        if (position < 0) position += size;
        if (position < 0 || position >= size) {
            throw type_error("An invalid index was used to index the input data: " + index.repr() +
                             " for " + std::to_string(data.size()) + " elements.");
        }
        result.push_back(data[static_cast<std::size_t>(position)]);
    }
    return value(std::move(result));
}

bool holds_stages(const value& v) {
    if (!v.holds<tuple_t>()) return false;
    for (const auto& child : v.as_tuple()) {
        if (!child.holds<std::shared_ptr<stage>>() || !child.as_stage()) return false;
    }
    return true;
}

} // namespace

value shaper::operation(const value& input) {
    const tuple_t& indices = get("indices").as_tuple();
    if (input.holds<tuple_t>()) {
        return extract_indices(input.as_tuple(), indices);
    }
    return extract_indices(tuple_t{input}, indices);
}

// ============================================================================
// Stage groups
// ============================================================================

const registry& stage_group::declared() {
    static const registry reg = registry::derive("stage_group", stage::declared(), {
        {"children", std::make_shared<const param>(kind::tuple, value(),
                                                   field_options{.mandatory = true, .positional = true},
                                                   holds_stages, "stages")},
    });
    return reg;
}

std::vector<std::shared_ptr<stage>> stage_group::children() const {
    std::vector<std::shared_ptr<stage>> result;
    for (const auto& child : get("children").as_tuple()) {
        result.push_back(child.as_stage());
    }
    return result;
}

value parallel::operation(const value& input) {
    auto kids = children();

    tuple_t elements;
    if (!input.holds<tuple_t>() || get_as<bool>("broadcast")) {
        elements.assign(kids.size(), input);
    } else {
        elements = input.as_tuple();
    }
    if (elements.size() != kids.size()) {
        throw type_error("Number of data elements and children does not match.");
    }

    tuple_t results;
    results.reserve(kids.size());
    for (std::size_t i = 0; i < kids.size(); ++i) {
        results.push_back((*kids[i])(elements[i]));
    }
    return value(std::move(results));
}

value sequential::operation(const value& input) {
    value data = input;
    for (const auto& child : children()) {
        data = (*child)(data);
    }
    return data;
}

} // namespace corelay
