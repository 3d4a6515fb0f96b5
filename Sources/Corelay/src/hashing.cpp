#include "corelay/hashing.hpp"
#include "corelay/stage.hpp"
#include "corelay/storage.hpp"
#include <cinttypes>
#include <cmath>
#include <cstdio>

namespace corelay {

using json = nlohmann::ordered_json;

namespace {

// FNV-1a, 128-bit variant
constexpr unsigned __int128 fnv128_prime =
    (static_cast<unsigned __int128>(1) << 88) + (static_cast<unsigned __int128>(1) << 8) + 0x3b;
constexpr unsigned __int128 fnv128_offset =
    (static_cast<unsigned __int128>(0x6c62272e07bb0142ULL) << 64) | 0x62b821756295c58dULL;

// |mantissa| < 1, so 18 digits still fit an int64_t after scaling
constexpr int max_mantissa_decimals = 18;

json array_identity(const ndarray& array, const hash_policy& policy) {
    if (policy.mantissa_decimals < 0 || policy.mantissa_decimals > max_mantissa_decimals) {
        throw type_error("mantissa_decimals must be between 0 and " +
                         std::to_string(max_mantissa_decimals) + ", got " +
                         std::to_string(policy.mantissa_decimals) + ".");
    }
    const double scale = std::pow(10.0, policy.mantissa_decimals);

    json mantissas = json::array();
    json exponents = json::array();
    for (double element : array.data) {
        if (!std::isfinite(element)) {
            // frexp leaves non-finite values untouched
            mantissas.push_back(std::isnan(element) ? "nan" : (element > 0 ? "inf" : "-inf"));
            exponents.push_back(0);
            continue;
        }
        int exponent = 0;
        double mantissa = std::frexp(element, &exponent);
        // nearbyint rounds half to even under the default rounding mode
        mantissas.push_back(static_cast<int64_t>(std::nearbyint(mantissa * scale)));
        exponents.push_back(static_cast<int32_t>(exponent));
    }

    json identity = json::object();
    identity["dtype"] = element_type_name(array.dtype);
    identity["shape"] = array.shape;
    identity["mantissa"] = std::move(mantissas);
    identity["exponent"] = std::move(exponents);
    return json{{"__array__", std::move(identity)}};
}

} // namespace

json hash_document(const value& v, const hash_policy& policy) {
    return std::visit([&](auto&& x) -> json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, ndarray>) {
            return array_identity(x, policy);
        } else if constexpr (std::is_same_v<T, tuple_t>) {
            json items = json::array();
            for (const auto& item : x) {
                items.push_back(hash_document(item, policy));
            }
            return items;
        } else if constexpr (std::is_same_v<T, mapping_t>) {
            json items = json::object();
            for (const auto& [key, item] : x) {
                items[key] = hash_document(item, policy);
            }
            return items;
        } else if constexpr (std::is_same_v<T, callable>) {
            return json{{"__callable__", x.name()}};
        } else if constexpr (std::is_same_v<T, std::shared_ptr<stage>>) {
            if (!x) return nullptr;
            return json{{"__stage__", hash_document(value(x->identifiers()), policy)}};
        } else {
            if (!x) return nullptr;
            return json{{"__storage__", x->type_name()}};
        }
    }, v.variant());
}

std::string fnv1a_128(const uint8_t* data, std::size_t size) {
    unsigned __int128 hash = fnv128_offset;
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= data[i];
        hash *= fnv128_prime;
    }

    char out[33];
    std::snprintf(out, sizeof(out), "%016" PRIx64 "%016" PRIx64,
                  static_cast<uint64_t>(hash >> 64), static_cast<uint64_t>(hash));
    return std::string(out, 32);
}

std::string content_hash(const value& v, const hash_policy& policy) {
    std::vector<uint8_t> bytes = json::to_msgpack(hash_document(v, policy));
    return fnv1a_128(bytes.data(), bytes.size());
}

std::string content_hash(const value& input, const mapping_t& meta, const hash_policy& policy) {
    return content_hash(value(tuple_t{input, value(meta)}), policy);
}

json structure_hash(const value& v, const hash_policy& policy) {
    if (v.holds<tuple_t>()) {
        json items = json::array();
        for (const auto& item : v.as_tuple()) {
            items.push_back(structure_hash(item, policy));
        }
        return items;
    }
    return content_hash(v, policy);
}

} // namespace corelay
