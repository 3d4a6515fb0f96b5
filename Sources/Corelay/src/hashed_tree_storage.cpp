#include "corelay/storage.hpp"
#include "corelay/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace corelay {

namespace {

std::string join(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

bool is_index(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Results are arrays or tuples of them, nested arbitrarily
bool is_cacheable(const value& v) {
    if (v.holds<ndarray>()) return true;
    if (!v.holds<tuple_t>()) return false;
    const tuple_t& items = v.as_tuple();
    return std::all_of(items.begin(), items.end(), is_cacheable);
}

std::string dump(const nlohmann::ordered_json& doc) {
    return doc.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string index_key(std::size_t i) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%03zu", i);
    return buf;
}

} // namespace

hashed_tree_storage::hashed_tree_storage(std::shared_ptr<node_store> nodes, std::string group,
                                         hash_policy policy, const kwargs_t& kwargs)
    : nodes_(std::move(nodes)), group_(std::move(group)), policy_(policy) {
    if (!nodes_) {
        throw type_error("hashed_tree_storage requires a node store.");
    }
    assign_arguments({}, kwargs);
}

std::string hashed_tree_storage::entry_path(const value& input, const mapping_t& meta) const {
    std::string key = cell("data_key").is_set() ? get_as<std::string>("data_key")
                                                : content_hash(input, meta, policy_);
    return join(group_, key);
}

value hashed_tree_storage::read(const value& input, const mapping_t& meta) {
    std::string path = entry_path(input, meta);
    if (!nodes_->contains(path + "/data")) {
        throw no_data_source("No data source available.");
    }
    LOG_DEBUG("hashed_tree", "hit %s", path.c_str());
    return read_data(path + "/data");
}

value hashed_tree_storage::read_data(const std::string& path) {
    if (!nodes_->is_group(path)) {
        return nodes_->get(path);
    }

    auto names = nodes_->children(path);
    if (!std::all_of(names.begin(), names.end(), is_index)) {
        throw storage_error("Cache entry '" + path + "' has non-index children.");
    }
    std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
        return std::stoull(a) < std::stoull(b);
    });

    tuple_t items;
    items.reserve(names.size());
    for (const auto& name : names) {
        items.push_back(read_data(join(path, name)));
    }
    return value(std::move(items));
}

void hashed_tree_storage::write(const value& output, const value& input, const mapping_t& meta) {
    if (nodes_->is_read_only()) {
        throw no_data_target("Tree store is opened read-only.");
    }
    if (!is_cacheable(output)) {
        throw type_error("The data type of the output data (" + std::string(kind_name(output.type())) +
                         ") is not supported. It must either be an array or a hierarchy of "
                         "tuples containing arrays.");
    }

    std::string path = entry_path(input, meta);

    // Serialized before anything is touched; invalid UTF-8 is replaced
    std::string meta_text, input_text, output_text;
    try {
        meta_text = dump(hash_document(value(meta), policy_));
        input_text = dump(structure_hash(input, policy_));
        output_text = dump(structure_hash(output, policy_));
    } catch (const nlohmann::json::exception& e) {
        throw storage_error("Cannot serialize cache entry " + path + ": " + e.what());
    }

    // An entry is stored whole or not at all
    nodes_->atomically([&] {
        nodes_->remove(path);
        write_data(output, path + "/data");
        nodes_->put(path + "/meta", value(meta_text));
        nodes_->put(path + "/input", value(input_text));
        nodes_->put(path + "/output", value(output_text));
    });
    LOG_DEBUG("hashed_tree", "stored %s", path.c_str());
}

void hashed_tree_storage::write_data(const value& data, const std::string& path) {
    if (data.holds<tuple_t>()) {
        nodes_->require_group(path);
        const tuple_t& items = data.as_tuple();
        for (std::size_t i = 0; i < items.size(); ++i) {
            write_data(items[i], join(path, index_key(i)));
        }
        return;
    }
    nodes_->put(path, data);
}

bool hashed_tree_storage::exists() {
    if (!cell("data_key").is_set()) {
        return false;
    }
    return nodes_->contains(join(group_, get_as<std::string>("data_key")));
}

std::vector<std::string> hashed_tree_storage::keys() {
    if (!group_.empty() && !nodes_->contains(group_)) {
        return {};
    }
    return nodes_->children(group_);
}

void hashed_tree_storage::close() {
    nodes_->close();
}

bool hashed_tree_storage::is_open() const {
    return nodes_->is_open();
}

} // namespace corelay
