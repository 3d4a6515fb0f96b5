#include "corelay/storage.hpp"
#include "corelay/codec.hpp"
#include "corelay/db.hpp"
#include "corelay/log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace corelay {

namespace {

enum node_type : int64_t {
    group_node = 0,
    dataset_node = 1
};

std::string parent_of(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? std::string() : path.substr(0, pos);
}

std::string join(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

bool is_index(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

// ============================================================================
// node_store
// ============================================================================

node_store::node_store(const std::string& path, open_mode mode) : mode_(mode) {
    if (mode == open_mode::write) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            throw storage_error("Failed to truncate " + path + ": " + ec.message());
        }
    }

    auto access = mode == open_mode::read ? database::access::read_only
                                         : database::access::read_write;
    db_ = std::make_unique<database>(path, access);

    if (mode == open_mode::read) {
        if (!db_->table_exists("nodes")) {
            throw storage_error(path + " is not a tree store.");
        }
    } else {
        db_->execute("CREATE TABLE IF NOT EXISTS nodes ("
                     "path TEXT PRIMARY KEY, "
                     "parent TEXT NOT NULL, "
                     "kind INTEGER NOT NULL, "
                     "payload BLOB)");
        db_->execute("CREATE INDEX IF NOT EXISTS nodes_parent ON nodes(parent)");
    }
    LOG_INFO("tree", "opened %s", path.c_str());
}

node_store::~node_store() = default;

database& node_store::db() {
    if (!db_) {
        throw storage_error("Tree store is closed.");
    }
    return *db_;
}

bool node_store::contains(const std::string& path) {
    return !db().query("SELECT 1 FROM nodes WHERE path = ?", {path}).empty();
}

bool node_store::is_group(const std::string& path) {
    auto rows = db().query("SELECT kind FROM nodes WHERE path = ?", {path});
    return !rows.empty() && std::get<int64_t>(rows.front().at("kind")) == group_node;
}

std::vector<std::string> node_store::children(const std::string& path) {
    auto rows = db().query("SELECT path FROM nodes WHERE parent = ? ORDER BY path", {path});
    std::size_t prefix = path.empty() ? 0 : path.size() + 1;

    std::vector<std::string> names;
    names.reserve(rows.size());
    for (const auto& row : rows) {
        names.push_back(std::get<std::string>(row.at("path")).substr(prefix));
    }
    return names;
}

void node_store::insert_node(const std::string& path, int type, const std::vector<uint8_t>& payload) {
    column_value_t blob = payload.empty() ? column_value_t(nullptr) : column_value_t(payload);
    db().execute("INSERT INTO nodes (path, parent, kind, payload) VALUES (?, ?, ?, ?)",
                 {path, parent_of(path), static_cast<int64_t>(type), blob});
}

void node_store::require_group(const std::string& path) {
    if (path.empty()) return;

    atomically([&] {
        std::size_t start = 0;
        while (start <= path.size()) {
            auto end = path.find('/', start);
            if (end == std::string::npos) end = path.size();
            std::string prefix = path.substr(0, end);
            start = end + 1;

            auto rows = db().query("SELECT kind FROM nodes WHERE path = ?", {prefix});
            if (!rows.empty() && std::get<int64_t>(rows.front().at("kind")) == group_node) {
                continue;
            }
            if (!rows.empty()) {
                remove(prefix);
            }
            insert_node(prefix, group_node, {});
        }
    });
}

void node_store::put(const std::string& path, const value& v) {
    if (path.empty()) {
        throw type_error("Cannot store a dataset at the root of a tree store.");
    }
    std::vector<uint8_t> payload = codec::to_msgpack(v);

    atomically([&] {
        remove(path);
        require_group(parent_of(path));
        insert_node(path, dataset_node, payload);
    });
}

value node_store::get(const std::string& path) {
    auto rows = db().query("SELECT kind, payload FROM nodes WHERE path = ?", {path});
    if (rows.empty()) {
        throw no_data_source("Key: '" + path + "' does not exist.");
    }
    const auto& row = rows.front();
    if (std::get<int64_t>(row.at("kind")) != dataset_node) {
        throw type_error("'" + path + "' is a group, not a dataset.");
    }
    const auto* payload = std::get_if<std::vector<uint8_t>>(&row.at("payload"));
    if (!payload) {
        throw storage_error("Dataset '" + path + "' has no payload.");
    }
    try {
        return codec::from_msgpack(*payload);
    } catch (const nlohmann::json::exception& e) {
        throw storage_error("Corrupt dataset '" + path + "': " + e.what());
    }
}

void node_store::remove(const std::string& path) {
    // Descendants sort between "path/" and "path0" ('0' follows '/')
    db().execute("DELETE FROM nodes WHERE path = ? OR (path >= ? AND path < ?)",
                 {path, path + "/", path + "0"});
}

void node_store::atomically(const std::function<void()>& fn) {
    if (db().in_transaction()) {
        fn();
        return;
    }
    transaction txn(db());
    fn();
    txn.commit();
}

void node_store::close() {
    if (db_) {
        LOG_INFO("tree", "closed %s", db_->path().c_str());
        db_.reset();
    }
}

// ============================================================================
// tree_storage
// ============================================================================

tree_storage::tree_storage(const std::string& path, open_mode mode, const kwargs_t& kwargs)
    : nodes_(std::make_shared<node_store>(path, mode)) {
    assign_arguments({}, kwargs);
}

value tree_storage::read(const value&, const mapping_t&) {
    std::string key = get_as<std::string>("data_key");
    if (!nodes_->contains(key)) {
        throw no_data_source("Key: '" + key + "' does not exist.");
    }
    return unpack(key);
}

value tree_storage::unpack(const std::string& path) {
    if (!nodes_->is_group(path)) {
        return nodes_->get(path);
    }

    auto names = nodes_->children(path);
    if (std::all_of(names.begin(), names.end(), is_index)) {
        std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
            return std::stoull(a) < std::stoull(b);
        });
        tuple_t items;
        for (const auto& name : names) {
            items.push_back(unpack(join(path, name)));
        }
        return value(std::move(items));
    }

    mapping_t items;
    for (const auto& name : names) {
        items.emplace_back(name, unpack(join(path, name)));
    }
    return value(std::move(items));
}

void tree_storage::write(const value& output, const value&, const mapping_t&) {
    if (nodes_->is_read_only()) {
        throw no_data_target("Tree store is opened read-only.");
    }

    std::string key = get_as<std::string>("data_key");
    nodes_->atomically([&] {
        nodes_->remove(key);
        pack(key, output);
    });
}

void tree_storage::pack(const std::string& path, const value& v) {
    if (v.holds<mapping_t>()) {
        nodes_->require_group(path);
        for (const auto& [name, item] : v.as_mapping()) {
            pack(join(path, name), item);
        }
    } else if (v.holds<tuple_t>()) {
        nodes_->require_group(path);
        const tuple_t& items = v.as_tuple();
        for (std::size_t i = 0; i < items.size(); ++i) {
            pack(join(path, std::to_string(i)), items[i]);
        }
    } else {
        nodes_->put(path, v);
    }
}

bool tree_storage::exists() {
    return nodes_->contains(get_as<std::string>("data_key"));
}

std::vector<std::string> tree_storage::keys() {
    return nodes_->children("");
}

void tree_storage::close() {
    nodes_->close();
}

bool tree_storage::is_open() const {
    return nodes_ && nodes_->is_open();
}

} // namespace corelay
