#pragma once

#ifdef __cplusplus

#include "stage.hpp"

namespace corelay {

/// Extracts or copies elements by index. `indices` is a tuple of integers and
/// nested tuples of integers; the output mirrors its shape. Non-tuple input
/// is treated as a one-element tuple. Negative indices count from the end.
class shaper : public stage {
    CORELAY_FIELDS(shaper, stage,
        {"indices", make_param(kind::tuple, {}, {.mandatory = true, .positional = true})})

public:
    value operation(const value& input) override;
};

/// Base of stage groups; `children` is a tuple of stages.
class stage_group : public stage {
public:
    static const registry& declared();
    const registry& fields() const override { return declared(); }

    std::vector<std::shared_ptr<stage>> children() const;
};

/// Calls child i with element i of the input and returns a tuple of the
/// outputs. Non-tuple input, or any input with broadcast set, is handed to
/// every child.
class parallel : public stage_group {
    CORELAY_FIELDS(parallel, stage_group,
        {"broadcast", make_param(kind::boolean, false)})

public:
    value operation(const value& input) override;
};

/// Feeds the input through every child in order.
class sequential : public stage_group {
    CORELAY_FIELDS(sequential, stage_group)

public:
    value operation(const value& input) override;
};

} // namespace corelay

#endif // __cplusplus
