#pragma once

#ifdef __cplusplus

#include "field_container.hpp"
#include "hashing.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace corelay {

class database;

/// File open mode of storage backends.
enum class open_mode {
    read,    ///< "r": the file must exist; writes are refused
    write,   ///< "w": created, existing content discarded
    append   ///< "a": created if missing, existing content kept
};

/// Parses "r", "w" or "a". Throws type_error otherwise.
open_mode parse_open_mode(const std::string& mode);

// ============================================================================
// Backend interface
// ============================================================================

/// Cache interface consulted by stages.
class storage_backend {
public:
    virtual ~storage_backend() = default;

    /// Stored output for (input, meta). Throws no_data_source on a miss.
    virtual value read(const value& input, const mapping_t& meta) = 0;

    /// Throws no_data_target when the backend cannot be written.
    virtual void write(const value& output, const value& input, const mapping_t& meta) = 0;

    virtual bool exists() = 0;
    virtual std::vector<std::string> keys() = 0;
    virtual void close() = 0;

    virtual bool is_open() const = 0;
    virtual std::string type_name() const = 0;

    /// True when backed by a live store.
    explicit operator bool() const { return is_open(); }
};

/// Backend addressed by a logical `data_key` field. at() rebinds a copy that
/// shares the underlying store, which gives dictionary-style access.
class keyed_storage : public storage_backend, public field_container {
public:
    static const registry& declared();
    const registry& fields() const override { return declared(); }

    std::string type_name() const override { return fields().name(); }

    std::shared_ptr<keyed_storage> at(const kwargs_t& overrides) const;

    bool contains(const std::string& key) const;
    value load(const std::string& key) const;
    void store(const std::string& key, const value& v) const;
    value operator[](const std::string& key) const { return load(key); }
};

/// Disabled backend. Reads throw no_data_source, writes no_data_target.
class null_storage : public keyed_storage {
    CORELAY_FIELDS(null_storage, keyed_storage)

public:
    value read(const value& input, const mapping_t& meta) override;
    void write(const value& output, const value& input, const mapping_t& meta) override;
    bool exists() override;
    std::vector<std::string> keys() override;
    void close() override {}
    bool is_open() const override { return false; }
};

// ============================================================================
// Append log
// ============================================================================

/// Append-only log of length-prefixed msgpack {"key", "data"} records.
/// The whole log is read into memory on the first query; later records win.
class append_log_storage : public keyed_storage {
    CORELAY_FIELDS(append_log_storage, keyed_storage,
        {"data_key", make_param(kind::string, {}, {.mandatory = true})})

public:
    explicit append_log_storage(const std::string& path, open_mode mode = open_mode::read,
                                const kwargs_t& kwargs = {});

    value read(const value& input, const mapping_t& meta) override;
    void write(const value& output, const value& input, const mapping_t& meta) override;
    bool exists() override;
    std::vector<std::string> keys() override;
    void close() override;
    bool is_open() const override;

private:
    struct log_file;

    log_file& log() const;

    std::shared_ptr<log_file> log_;
};

// ============================================================================
// Hierarchical stores
// ============================================================================

/// Slash-separated hierarchy of groups and datasets kept in one SQLite
/// table. Dataset payloads are codec msgpack.
class node_store {
public:
    node_store(const std::string& path, open_mode mode);
    ~node_store();

    node_store(const node_store&) = delete;
    node_store& operator=(const node_store&) = delete;

    bool contains(const std::string& path);
    bool is_group(const std::string& path);

    /// Child names of a group, sorted. "" is the root.
    std::vector<std::string> children(const std::string& path);

    /// Creates the group and its parents. Datasets in the way are replaced.
    void require_group(const std::string& path);

    /// Stores `v` at `path`, replacing whatever was there.
    void put(const std::string& path, const value& v);
    value get(const std::string& path);

    /// Removes the node and everything below it.
    void remove(const std::string& path);

    /// Runs `fn` in one transaction, rolled back if it throws. Calls made
    /// while a transaction is open join it.
    void atomically(const std::function<void()>& fn);

    void close();
    bool is_open() const { return db_ != nullptr; }
    bool is_read_only() const { return mode_ == open_mode::read; }

private:
    database& db();
    void insert_node(const std::string& path, int type, const std::vector<uint8_t>& payload);

    std::unique_ptr<database> db_;
    open_mode mode_;
};

/// Keyed hierarchical backend. Mappings and tuples become groups, recursively:
/// a mapping as `<name>` children, a tuple as `<index>` children. Anything
/// else is a dataset.
/// Reading a group whose child names are all numeric yields a tuple ordered
/// by index, otherwise a mapping.
class tree_storage : public keyed_storage {
    CORELAY_FIELDS(tree_storage, keyed_storage,
        {"data_key", make_param(kind::string, {}, {.mandatory = true})})

public:
    explicit tree_storage(const std::string& path, open_mode mode = open_mode::read,
                          const kwargs_t& kwargs = {});

    value read(const value& input, const mapping_t& meta) override;
    void write(const value& output, const value& input, const mapping_t& meta) override;
    bool exists() override;
    std::vector<std::string> keys() override;
    void close() override;
    bool is_open() const override;

    const std::shared_ptr<node_store>& nodes() const { return nodes_; }

private:
    void pack(const std::string& path, const value& v);
    value unpack(const std::string& path);

    std::shared_ptr<node_store> nodes_;
};

/// Content-addressed cache inside one group of a node store.
///
/// Each entry lives under `<group>/<hash of (input, meta)>`, or under
/// `data_key` when set: `data` mirrors the result (tuples become groups with
/// zero-padded three-digit keys, arrays become datasets), and `meta`, `input`
/// and `output` hold serialized metadata and per-element digests.
class hashed_tree_storage : public keyed_storage {
    CORELAY_FIELDS(hashed_tree_storage, keyed_storage)

public:
    hashed_tree_storage(std::shared_ptr<node_store> nodes, std::string group,
                        hash_policy policy = {}, const kwargs_t& kwargs = {});

    value read(const value& input, const mapping_t& meta) override;
    void write(const value& output, const value& input, const mapping_t& meta) override;
    bool exists() override;
    std::vector<std::string> keys() override;
    void close() override;
    bool is_open() const override;

    /// Node path of the entry for (input, meta).
    std::string entry_path(const value& input, const mapping_t& meta) const;

private:
    value read_data(const std::string& path);
    void write_data(const value& data, const std::string& path);

    std::shared_ptr<node_store> nodes_;
    std::string group_;
    hash_policy policy_;
};

} // namespace corelay

#endif // __cplusplus
