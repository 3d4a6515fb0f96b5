#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <vector>

namespace corelay::codec {

/// Persistable form of a value.
///
/// none, booleans, numbers and strings map to their JSON counterparts, tuples
/// to arrays and mappings to objects. Arrays become
/// {"__ndarray__": {"dtype", "shape", "data"}} with the elements packed as
/// little-endian doubles in a binary value. Callables, stages and storages
/// cannot be persisted and throw type_error.
nlohmann::ordered_json encode(const value& v);
value decode(const nlohmann::ordered_json& doc);

std::vector<uint8_t> to_msgpack(const value& v);
value from_msgpack(const std::vector<uint8_t>& bytes);

} // namespace corelay::codec

#endif // __cplusplus
