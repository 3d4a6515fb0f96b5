#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace corelay {

class error : public std::runtime_error {
public:
    explicit error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Configuration errors: dtype mismatch, unknown or duplicated arguments,
/// values a backend or codec cannot handle.
class type_error : public error {
public:
    explicit type_error(const std::string& msg) : error(msg) {}
};

/// A field was read while explicit value, instance default and field default
/// were all absent.
class unset_field_error : public type_error {
public:
    explicit unset_field_error(const std::string& msg) : type_error(msg) {}
};

class unknown_field_error : public type_error {
public:
    explicit unknown_field_error(const std::string& msg) : type_error(msg) {}
};

// Cache control flow: a miss on read, or a backend that cannot be written.
class no_data_source : public error {
public:
    explicit no_data_source(const std::string& msg) : error(msg) {}
};

class no_data_target : public error {
public:
    explicit no_data_target(const std::string& msg) : error(msg) {}
};

class pipeline_error : public error {
public:
    explicit pipeline_error(const std::string& msg) : error(msg) {}
};

/// SQLite or file I/O failure inside a storage backend.
class storage_error : public error {
public:
    explicit storage_error(const std::string& msg) : error(msg) {}
};

} // namespace corelay

#endif // __cplusplus
