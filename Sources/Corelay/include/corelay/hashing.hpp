#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace corelay {

struct hash_policy {
    /// Decimal digits kept of each array element's frexp mantissa, 0 to 18.
    int mantissa_decimals = 2;
};

/// Structural encoding of a value graph used as hash input.
///
/// Arrays are identified by element type name, shape, and every element
/// split with frexp into a mantissa rounded (half to even) to
/// `mantissa_decimals` digits and a binary exponent. Stages encode as their
/// identifying metadata, callables by name, storages by type name.
nlohmann::ordered_json hash_document(const value& v, const hash_policy& policy = {});

/// 128-bit FNV-1a of `data`, as 32 lowercase hex digits.
std::string fnv1a_128(const uint8_t* data, std::size_t size);

/// Digest of the msgpack form of hash_document(v).
std::string content_hash(const value& v, const hash_policy& policy = {});

/// Cache key of an (input, identifying metadata) pair.
std::string content_hash(const value& input, const mapping_t& meta, const hash_policy& policy = {});

/// Digest per tuple element, recursively: a nested JSON array of digests
/// mirroring the tuple shape, or a single digest string.
nlohmann::ordered_json structure_hash(const value& v, const hash_policy& policy = {});

} // namespace corelay

#endif // __cplusplus
