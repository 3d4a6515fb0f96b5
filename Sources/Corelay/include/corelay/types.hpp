#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace corelay {

// Forward declarations
class stage;
class storage_backend;
class value;

// Ordered containers of dynamic values
using tuple_t = std::vector<value>;
using mapping_t = std::vector<std::pair<std::string, value>>;

// Constructor arguments: positional values and keyword pairs
using args_t = std::vector<value>;
using kwargs_t = mapping_t;

// Value kinds, used as the dtype vocabulary of fields
enum class kind : int {
    none,
    boolean,
    integer,
    real,
    string,
    array,
    tuple,
    mapping,
    function,
    method,
    builtin,
    stage,
    storage,
    any
};

const char* kind_name(kind k);

// ============================================================================
// Numeric arrays
// ============================================================================

enum class element_type : int {
    float32,
    float64,
    int32,
    int64
};

/// numpy-style name: "float32", "float64", "int32", "int64".
const char* element_type_name(element_type type);
element_type element_type_from_name(const std::string& name);

/// Dense row-major array. Elements are held as doubles whatever the
/// element type; the element type takes part in identity and hashing.
struct ndarray {
    element_type dtype = element_type::float64;
    std::vector<std::size_t> shape;
    std::vector<double> data;

    ndarray() = default;
    ndarray(element_type type, std::vector<std::size_t> shape, std::vector<double> data);

    // One-dimensional array over the given values
    static ndarray from_values(std::vector<double> values, element_type type = element_type::float64);

    std::size_t size() const;

    bool operator==(const ndarray&) const = default;
};

// ============================================================================
// Callables
// ============================================================================

enum class callable_kind : int {
    function,   ///< plain unary callable
    method,     ///< receives the owning stage as first argument
    builtin     ///< library-provided callable
};

/// Shared, named wrapper around a std::function. Two callables compare equal
/// only when they share the same underlying target.
class callable {
public:
    using function_t = std::function<value(const value&)>;
    using method_t = std::function<value(stage&, const value&)>;

    callable(std::string name, function_t fn);

    static callable method(std::string name, method_t fn);
    static callable builtin(std::string name, function_t fn);

    const std::string& name() const;
    callable_kind type() const;

    value operator()(const value& input) const;
    value operator()(stage& self, const value& input) const;

    bool operator==(const callable& other) const { return impl_ == other.impl_; }

private:
    struct impl {
        std::string name;
        callable_kind type;
        function_t fn;
        method_t method;
    };

    explicit callable(std::shared_ptr<const impl> i) : impl_(std::move(i)) {}

    std::shared_ptr<const impl> impl_;
};

/// Returns its input unchanged. Default operation of every task.
const callable& identity();

// ============================================================================
// Dynamic value
// ============================================================================

namespace detail {
[[noreturn]] void throw_kind_mismatch(kind expected, kind actual);
}

class value {
public:
    using variant_t = std::variant<std::monostate,
                                   bool,
                                   int64_t,
                                   double,
                                   std::string,
                                   ndarray,
                                   tuple_t,
                                   mapping_t,
                                   callable,
                                   std::shared_ptr<stage>,
                                   std::shared_ptr<storage_backend>>;

    value() = default;
    value(std::nullptr_t) {}
    value(bool v) : v_(v) {}
    value(int v) : v_(static_cast<int64_t>(v)) {}
    value(int64_t v) : v_(v) {}
    value(double v) : v_(v) {}
    value(const char* v) : v_(std::string(v)) {}
    value(std::string v) : v_(std::move(v)) {}
    value(ndarray v) : v_(std::move(v)) {}
    value(tuple_t v) : v_(std::move(v)) {}
    value(mapping_t v) : v_(std::move(v)) {}
    value(callable v) : v_(std::move(v)) {}
    // Empty stage and storage pointers are none
    value(std::shared_ptr<stage> v) { if (v) v_ = std::move(v); }
    value(std::shared_ptr<storage_backend> v) { if (v) v_ = std::move(v); }

    template<typename T>
        requires (std::is_base_of_v<stage, T> && !std::is_same_v<T, stage>)
    value(std::shared_ptr<T> v) : value(std::shared_ptr<stage>(std::move(v))) {}

    template<typename T>
        requires (std::is_base_of_v<storage_backend, T> && !std::is_same_v<T, storage_backend>)
    value(std::shared_ptr<T> v) : value(std::shared_ptr<storage_backend>(std::move(v))) {}

    kind type() const;

    bool is_none() const { return std::holds_alternative<std::monostate>(v_); }
    bool has_value() const { return !is_none(); }

    template<typename T>
    bool holds() const { return std::holds_alternative<T>(v_); }

    // Checked accessors; throw type_error on a kind mismatch
    bool as_bool() const;
    int64_t as_int() const;
    double as_real() const;   // integers widen
    const std::string& as_string() const;
    const ndarray& as_array() const;
    const tuple_t& as_tuple() const;
    const mapping_t& as_mapping() const;
    const callable& as_callable() const;
    std::shared_ptr<stage> as_stage() const;
    std::shared_ptr<storage_backend> as_storage() const;

    template<typename T>
    T as() const;

    bool operator==(const value& other) const;

    std::string repr() const;

    const variant_t& variant() const { return v_; }

private:
    variant_t v_;
};

template<typename T>
T value::as() const {
    if constexpr (std::is_same_v<T, value>) {
        return *this;
    } else if constexpr (std::is_same_v<T, bool>) {
        return as_bool();
    } else if constexpr (std::is_integral_v<T>) {
        return static_cast<T>(as_int());
    } else if constexpr (std::is_floating_point_v<T>) {
        return static_cast<T>(as_real());
    } else if constexpr (std::is_same_v<T, std::string>) {
        return as_string();
    } else if constexpr (std::is_same_v<T, ndarray>) {
        return as_array();
    } else if constexpr (std::is_same_v<T, tuple_t>) {
        return as_tuple();
    } else if constexpr (std::is_same_v<T, mapping_t>) {
        return as_mapping();
    } else if constexpr (std::is_same_v<T, callable>) {
        return as_callable();
    } else if constexpr (std::is_same_v<T, std::shared_ptr<stage>>) {
        return as_stage();
    } else if constexpr (std::is_same_v<T, std::shared_ptr<storage_backend>>) {
        return as_storage();
    } else {
        // Downcast to a concrete stage or storage type
        using element = typename T::element_type;
        if constexpr (std::is_base_of_v<stage, element>) {
            auto ptr = std::dynamic_pointer_cast<element>(as_stage());
            if (!ptr) detail::throw_kind_mismatch(kind::stage, type());
            return ptr;
        } else {
            auto ptr = std::dynamic_pointer_cast<element>(as_storage());
            if (!ptr) detail::throw_kind_mismatch(kind::storage, type());
            return ptr;
        }
    }
}

// ============================================================================
// Type sets (field dtypes)
// ============================================================================

/// One or more accepted kinds. A set containing kind::function also accepts
/// method and builtin callables.
class type_set {
public:
    type_set(kind k) : kinds_{k} {}
    type_set(std::initializer_list<kind> kinds) : kinds_(kinds) {}

    bool empty() const { return kinds_.empty(); }
    bool contains(kind k) const;
    bool accepts(const value& v) const;

    std::string to_string() const;

private:
    std::vector<kind> kinds_;
};

} // namespace corelay

#endif // __cplusplus
