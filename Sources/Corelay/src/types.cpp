#include "corelay/types.hpp"
#include "corelay/stage.hpp"
#include "corelay/storage.hpp"
#include <algorithm>
#include <numeric>
#include <sstream>

namespace corelay {

const char* kind_name(kind k) {
    switch (k) {
        case kind::none: return "none";
        case kind::boolean: return "boolean";
        case kind::integer: return "integer";
        case kind::real: return "real";
        case kind::string: return "string";
        case kind::array: return "array";
        case kind::tuple: return "tuple";
        case kind::mapping: return "mapping";
        case kind::function: return "function";
        case kind::method: return "method";
        case kind::builtin: return "builtin";
        case kind::stage: return "stage";
        case kind::storage: return "storage";
        case kind::any: return "any";
    }
    return "unknown";
}

const char* element_type_name(element_type type) {
    switch (type) {
        case element_type::float32: return "float32";
        case element_type::float64: return "float64";
        case element_type::int32: return "int32";
        case element_type::int64: return "int64";
    }
    return "unknown";
}

element_type element_type_from_name(const std::string& name) {
    if (name == "float32") return element_type::float32;
    if (name == "float64") return element_type::float64;
    if (name == "int32") return element_type::int32;
    if (name == "int64") return element_type::int64;
    throw type_error("Unknown element type '" + name + "'.");
}

// ============================================================================
// ndarray
// ============================================================================

ndarray::ndarray(element_type type, std::vector<std::size_t> shape, std::vector<double> data)
    : dtype(type), shape(std::move(shape)), data(std::move(data)) {
    if (this->data.size() != size()) {
        throw type_error("Array of shape with " + std::to_string(size()) + " elements got " +
                         std::to_string(this->data.size()) + " values.");
    }
}

ndarray ndarray::from_values(std::vector<double> values, element_type type) {
    std::vector<std::size_t> shape{values.size()};
    return ndarray(type, std::move(shape), std::move(values));
}

std::size_t ndarray::size() const {
    return std::accumulate(shape.begin(), shape.end(), std::size_t{1}, std::multiplies<>());
}

// ============================================================================
// callable
// ============================================================================

callable::callable(std::string name, function_t fn)
    : impl_(std::make_shared<const impl>(impl{std::move(name), callable_kind::function, std::move(fn), {}})) {}

callable callable::method(std::string name, method_t fn) {
    return callable(std::make_shared<const impl>(impl{std::move(name), callable_kind::method, {}, std::move(fn)}));
}

callable callable::builtin(std::string name, function_t fn) {
    return callable(std::make_shared<const impl>(impl{std::move(name), callable_kind::builtin, std::move(fn), {}}));
}

const std::string& callable::name() const {
    return impl_->name;
}

callable_kind callable::type() const {
    return impl_->type;
}

value callable::operator()(const value& input) const {
    if (!impl_->fn) {
        throw type_error("Method '" + impl_->name + "' must be bound to a stage.");
    }
    return impl_->fn(input);
}

value callable::operator()(stage& self, const value& input) const {
    if (!impl_->method) {
        throw type_error("Callable '" + impl_->name + "' cannot be bound to a stage.");
    }
    return impl_->method(self, input);
}

const callable& identity() {
    static const callable fn("identity", [](const value& input) { return input; });
    return fn;
}

// ============================================================================
// value
// ============================================================================

namespace detail {

void throw_kind_mismatch(kind expected, kind actual) {
    throw type_error(std::string("Expected a value of kind '") + kind_name(expected) +
                     "', got '" + kind_name(actual) + "'.");
}

} // namespace detail

kind value::type() const {
    return std::visit([](auto&& v) -> kind {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) return kind::none;
        else if constexpr (std::is_same_v<T, bool>) return kind::boolean;
        else if constexpr (std::is_same_v<T, int64_t>) return kind::integer;
        else if constexpr (std::is_same_v<T, double>) return kind::real;
        else if constexpr (std::is_same_v<T, std::string>) return kind::string;
        else if constexpr (std::is_same_v<T, ndarray>) return kind::array;
        else if constexpr (std::is_same_v<T, tuple_t>) return kind::tuple;
        else if constexpr (std::is_same_v<T, mapping_t>) return kind::mapping;
        else if constexpr (std::is_same_v<T, callable>) {
            switch (v.type()) {
                case callable_kind::method: return kind::method;
                case callable_kind::builtin: return kind::builtin;
                case callable_kind::function: break;
            }
            return kind::function;
        }
        else if constexpr (std::is_same_v<T, std::shared_ptr<stage>>) return kind::stage;
        else return kind::storage;
    }, v_);
}

bool value::as_bool() const {
    if (auto* v = std::get_if<bool>(&v_)) return *v;
    detail::throw_kind_mismatch(kind::boolean, type());
}

int64_t value::as_int() const {
    if (auto* v = std::get_if<int64_t>(&v_)) return *v;
    detail::throw_kind_mismatch(kind::integer, type());
}

double value::as_real() const {
    if (auto* v = std::get_if<double>(&v_)) return *v;
    if (auto* v = std::get_if<int64_t>(&v_)) return static_cast<double>(*v);
    detail::throw_kind_mismatch(kind::real, type());
}

const std::string& value::as_string() const {
    if (auto* v = std::get_if<std::string>(&v_)) return *v;
    detail::throw_kind_mismatch(kind::string, type());
}

const ndarray& value::as_array() const {
    if (auto* v = std::get_if<ndarray>(&v_)) return *v;
    detail::throw_kind_mismatch(kind::array, type());
}

const tuple_t& value::as_tuple() const {
    if (auto* v = std::get_if<tuple_t>(&v_)) return *v;
    detail::throw_kind_mismatch(kind::tuple, type());
}

const mapping_t& value::as_mapping() const {
    if (auto* v = std::get_if<mapping_t>(&v_)) return *v;
    detail::throw_kind_mismatch(kind::mapping, type());
}

const callable& value::as_callable() const {
    if (auto* v = std::get_if<callable>(&v_)) return *v;
    detail::throw_kind_mismatch(kind::function, type());
}

std::shared_ptr<stage> value::as_stage() const {
    if (auto* v = std::get_if<std::shared_ptr<stage>>(&v_)) return *v;
    detail::throw_kind_mismatch(kind::stage, type());
}

std::shared_ptr<storage_backend> value::as_storage() const {
    if (auto* v = std::get_if<std::shared_ptr<storage_backend>>(&v_)) return *v;
    detail::throw_kind_mismatch(kind::storage, type());
}

bool value::operator==(const value& other) const {
    return v_ == other.v_;
}

std::string value::repr() const {
    std::ostringstream out;
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out << "none";
        } else if constexpr (std::is_same_v<T, bool>) {
            out << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            out << v;
        } else if constexpr (std::is_same_v<T, std::string>) {
            out << '\'' << v << '\'';
        } else if constexpr (std::is_same_v<T, ndarray>) {
            out << "ndarray(" << element_type_name(v.dtype) << ", [";
            for (std::size_t i = 0; i < v.shape.size(); ++i) {
                out << (i ? ", " : "") << v.shape[i];
            }
            out << "])";
        } else if constexpr (std::is_same_v<T, tuple_t>) {
            out << '(';
            for (std::size_t i = 0; i < v.size(); ++i) {
                out << (i ? ", " : "") << v[i].repr();
            }
            out << ')';
        } else if constexpr (std::is_same_v<T, mapping_t>) {
            out << '{';
            for (std::size_t i = 0; i < v.size(); ++i) {
                out << (i ? ", " : "") << v[i].first << ": " << v[i].second.repr();
            }
            out << '}';
        } else if constexpr (std::is_same_v<T, callable>) {
            out << v.name();
        } else if constexpr (std::is_same_v<T, std::shared_ptr<stage>>) {
            out << (v ? v->repr() : std::string("none"));
        } else {
            out << (v ? v->type_name() : std::string("none"));
        }
    }, v_);
    return out.str();
}

// ============================================================================
// type_set
// ============================================================================

bool type_set::contains(kind k) const {
    return std::find(kinds_.begin(), kinds_.end(), k) != kinds_.end();
}

bool type_set::accepts(const value& v) const {
    kind k = v.type();
    if (k == kind::none) return false;
    if (contains(kind::any) || contains(k)) return true;
    // Function-family widening
    return (k == kind::method || k == kind::builtin) && contains(kind::function);
}

std::string type_set::to_string() const {
    if (kinds_.size() == 1) return kind_name(kinds_.front());
    std::string result = "(";
    for (std::size_t i = 0; i < kinds_.size(); ++i) {
        if (i) result += ", ";
        result += kind_name(kinds_[i]);
    }
    return result + ")";
}

} // namespace corelay
