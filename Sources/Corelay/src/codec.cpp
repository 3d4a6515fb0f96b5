#include "corelay/codec.hpp"
#include <bit>

namespace corelay::codec {

using json = nlohmann::ordered_json;

namespace {

constexpr const char* array_tag = "__ndarray__";

std::vector<uint8_t> pack_elements(const std::vector<double>& elements) {
    std::vector<uint8_t> bytes(elements.size() * sizeof(double));
    for (std::size_t i = 0; i < elements.size(); ++i) {
        uint64_t bits = std::bit_cast<uint64_t>(elements[i]);
        for (std::size_t b = 0; b < sizeof(double); ++b) {
            bytes[i * sizeof(double) + b] = static_cast<uint8_t>(bits >> (8 * b));
        }
    }
    return bytes;
}

std::vector<double> unpack_elements(const std::vector<uint8_t>& bytes) {
    if (bytes.size() % sizeof(double) != 0) {
        throw type_error("Corrupt array payload of " + std::to_string(bytes.size()) + " bytes.");
    }
    std::vector<double> elements(bytes.size() / sizeof(double));
    for (std::size_t i = 0; i < elements.size(); ++i) {
        uint64_t bits = 0;
        for (std::size_t b = 0; b < sizeof(double); ++b) {
            bits |= static_cast<uint64_t>(bytes[i * sizeof(double) + b]) << (8 * b);
        }
        elements[i] = std::bit_cast<double>(bits);
    }
    return elements;
}

bool is_array_document(const json& doc) {
    return doc.is_object() && doc.size() == 1 && doc.contains(array_tag);
}

} // namespace

json encode(const value& v) {
    return std::visit([&](auto&& x) -> json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, ndarray>) {
            json body = json::object();
            body["dtype"] = element_type_name(x.dtype);
            body["shape"] = x.shape;
            body["data"] = json::binary(pack_elements(x.data));
            return json{{array_tag, std::move(body)}};
        } else if constexpr (std::is_same_v<T, tuple_t>) {
            json items = json::array();
            for (const auto& item : x) {
                items.push_back(encode(item));
            }
            return items;
        } else if constexpr (std::is_same_v<T, mapping_t>) {
            json items = json::object();
            for (const auto& [key, item] : x) {
                items[key] = encode(item);
            }
            return items;
        } else {
            throw type_error("Values of kind '" + std::string(kind_name(v.type())) +
                             "' cannot be persisted.");
        }
    }, v.variant());
}

value decode(const json& doc) {
    switch (doc.type()) {
        case json::value_t::null:
            return value();
        case json::value_t::boolean:
            return value(doc.get<bool>());
        case json::value_t::number_integer:
            return value(doc.get<int64_t>());
        case json::value_t::number_unsigned:
            return value(static_cast<int64_t>(doc.get<uint64_t>()));
        case json::value_t::number_float:
            return value(doc.get<double>());
        case json::value_t::string:
            return value(doc.get<std::string>());
        case json::value_t::array: {
            tuple_t items;
            items.reserve(doc.size());
            for (const auto& item : doc) {
                items.push_back(decode(item));
            }
            return value(std::move(items));
        }
        case json::value_t::object: {
            if (is_array_document(doc)) {
                const json& body = doc.at(array_tag);
                return value(ndarray(element_type_from_name(body.at("dtype").get<std::string>()),
                                     body.at("shape").get<std::vector<std::size_t>>(),
                                     unpack_elements(body.at("data").get_binary())));
            }
            mapping_t items;
            for (const auto& [key, item] : doc.items()) {
                items.emplace_back(key, decode(item));
            }
            return value(std::move(items));
        }
        default:
            throw type_error("Cannot decode a JSON value of type '" + std::string(doc.type_name()) + "'.");
    }
}

std::vector<uint8_t> to_msgpack(const value& v) {
    return json::to_msgpack(encode(v));
}

value from_msgpack(const std::vector<uint8_t>& bytes) {
    return decode(json::from_msgpack(bytes));
}

} // namespace corelay::codec
