#pragma once

#include "TestStages.hpp"
#include <cassert>
#include <fstream>
#include <iostream>

namespace storage_tests {

using namespace corelay;
using namespace test_types;

// ============================================================================
// Test: Open modes and the null backend
// ============================================================================

void test_open_modes() {
    std::cout << "Testing open modes..." << std::endl;

    assert(parse_open_mode("r") == open_mode::read);
    assert(parse_open_mode("w") == open_mode::write);
    assert(parse_open_mode("a") == open_mode::append);

    bool threw = false;
    try {
        parse_open_mode("rw");
    } catch (const type_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Open modes test passed!" << std::endl;
}

void test_null_storage() {
    std::cout << "Testing null storage..." << std::endl;

    auto none = make<null_storage>();
    assert(!*none);
    assert(none->type_name() == "null_storage");

    bool threw = false;
    try {
        none->read(value(1), {});
    } catch (const no_data_source&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        none->write(value(1), value(1), {});
    } catch (const no_data_target&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        none->keys();
    } catch (const no_data_source&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        none->load("anything");
    } catch (const no_data_source&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Null storage test passed!" << std::endl;
}

// ============================================================================
// Test: Append log
// ============================================================================

void test_append_log() {
    std::cout << "Testing append log storage..." << std::endl;

    auto dir = scratch_dir("append_log");
    std::string path = (dir / "records.log").string();

    {
        auto writer = std::make_shared<append_log_storage>(path, open_mode::write);
        assert(*writer);
        writer->store("alpha", value(1));
        writer->store("beta", value(tuple_t{"b", 2.5, ndarray::from_values({1.0, 2.0})}));
        writer->store("alpha", value(2));

        // Readable in the same session
        assert(writer->load("alpha") == value(2));
        assert(writer->contains("beta"));
        assert(!writer->contains("gamma"));
        assert((writer->keys() == std::vector<std::string>{"alpha", "beta"}));
        writer->close();
        assert(!*writer);
    }

    // Reload from disk; later records win
    auto reader = std::make_shared<append_log_storage>(path, open_mode::read);
    assert(reader->load("alpha") == value(2));
    assert((*reader)["beta"] == value(tuple_t{"b", 2.5, ndarray::from_values({1.0, 2.0})}));

    // Keyed through data_key
    auto bound = reader->at({{"data_key", "beta"}});
    assert(bound->exists());
    assert(bound->read(value(), {}).as_tuple().size() == 3);

    bool threw = false;
    try {
        reader->load("gamma");
    } catch (const no_data_source& e) {
        threw = std::string(e.what()).find("gamma") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        reader->store("gamma", value(3));
    } catch (const no_data_target&) {
        threw = true;
    }
    assert(threw);

    // data_key is mandatory
    threw = false;
    try {
        reader->exists();
    } catch (const unset_field_error&) {
        threw = true;
    }
    assert(threw);
    reader->close();

    // Append keeps what is there
    {
        append_log_storage appender(path, open_mode::append, {{"data_key", "gamma"}});
        appender.write(value(3), value(), {});
        assert(appender.keys().size() == 3);
    }
    append_log_storage final_reader(path);
    assert(final_reader.load("gamma") == value(3));
    assert(final_reader.load("alpha") == value(2));

    threw = false;
    try {
        append_log_storage missing((dir / "absent.log").string(), open_mode::read);
    } catch (const storage_error&) {
        threw = true;
    }
    assert(threw);

    std::filesystem::remove_all(dir);

    std::cout << "  Append log test passed!" << std::endl;
}

void test_append_log_truncated() {
    std::cout << "Testing append log with a truncated tail..." << std::endl;

    auto dir = scratch_dir("append_log_truncated");
    std::string path = (dir / "records.log").string();
    {
        append_log_storage writer(path, open_mode::write);
        writer.store("kept", value("yes"));
    }
    {
        // Half a length header
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out.put('\0');
        out.put('\0');
    }

    {
        append_log_storage reader(path);
        assert((reader.keys() == std::vector<std::string>{"kept"}));
        assert(reader.load("kept") == value("yes"));
    }

    // Appending drops the torn tail first, so later records stay readable
    {
        append_log_storage appender(path, open_mode::append);
        appender.store("fresh", value(7));
        assert(appender.contains("fresh"));
    }
    append_log_storage reopened(path);
    assert((reopened.keys() == std::vector<std::string>{"fresh", "kept"}));
    assert(reopened.load("fresh") == value(7));
    assert(reopened.load("kept") == value("yes"));

    std::filesystem::remove_all(dir);

    std::cout << "  Truncated append log test passed!" << std::endl;
}

// ============================================================================
// Test: Tree storage
// ============================================================================

void test_tree_storage() {
    std::cout << "Testing tree storage..." << std::endl;

    auto dir = scratch_dir("tree");
    std::string path = (dir / "tree.db").string();

    value record(mapping_t{
        {"labels", tuple_t{"a", "b"}},
        {"points", ndarray(element_type::float64, {2, 2}, {0.0, 1.0, 2.0, 3.0})},
        {"scale", 1.5},
    });

    {
        auto tree = std::make_shared<tree_storage>(path, open_mode::write);
        tree->store("record", record);
        assert(tree->load("record") == record);
        assert(tree->nodes()->is_group("record"));
        assert(tree->nodes()->contains("record/labels/1"));

        // Tuples with more than ten elements come back in index order
        tuple_t many;
        for (int i = 0; i < 12; ++i) many.push_back(value(i));
        tree->store("many", value(many));
        assert(tree->load("many") == value(many));

        // Writes replace the whole entry
        tree->store("many", value("flat"));
        assert(tree->load("many") == value("flat"));
        assert(!tree->nodes()->contains("many/0"));

        assert((tree->keys() == std::vector<std::string>{"many", "record"}));
        tree->close();
        assert(!*tree);
    }

    auto reader = std::make_shared<tree_storage>(path, open_mode::read);
    assert(reader->load("record") == record);
    assert(reader->contains("many"));
    assert(!reader->contains("other"));

    bool threw = false;
    try {
        reader->load("other");
    } catch (const no_data_source&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        reader->store("other", value(1));
    } catch (const no_data_target&) {
        threw = true;
    }
    assert(threw);
    reader->close();

    threw = false;
    try {
        tree_storage missing((dir / "absent.db").string(), open_mode::read);
    } catch (const storage_error&) {
        threw = true;
    }
    assert(threw);

    std::filesystem::remove_all(dir);

    std::cout << "  Tree storage test passed!" << std::endl;
}

void test_node_store_atomically() {
    std::cout << "Testing node store transactions..." << std::endl;

    auto dir = scratch_dir("node_store_atomic");
    node_store nodes((dir / "nodes.db").string(), open_mode::write);
    nodes.put("kept/value", value(1));

    // A failure inside the block leaves no partial writes behind
    bool threw = false;
    try {
        nodes.atomically([&] {
            nodes.put("partial/first", value(1));
            nodes.require_group("partial/group");
            throw storage_error("interrupted");
        });
    } catch (const storage_error&) {
        threw = true;
    }
    assert(threw);
    assert(!nodes.contains("partial"));
    assert(!nodes.contains("partial/first"));
    assert(nodes.get("kept/value") == value(1));

    // Nested blocks join the outer transaction
    nodes.atomically([&] {
        nodes.atomically([&] { nodes.put("outer/inner", value(2)); });
        nodes.put("outer/second", value(3));
    });
    assert((nodes.children("outer") == std::vector<std::string>{"inner", "second"}));

    nodes.close();
    std::filesystem::remove_all(dir);

    std::cout << "  Node store transaction test passed!" << std::endl;
}

// ============================================================================
// Test: Hashed tree storage
// ============================================================================

void test_hashed_tree_layout() {
    std::cout << "Testing hashed tree layout..." << std::endl;

    auto dir = scratch_dir("hashed_tree");
    auto nodes = std::make_shared<node_store>((dir / "cache.db").string(), open_mode::write);
    auto cache = std::make_shared<hashed_tree_storage>(nodes, "split_stage");

    value input(ndarray::from_values({1.0, 2.0}));
    auto s = make<split_stage>({{"cache", cache}});
    value output = (*s)(input);
    mapping_t meta = s->identifiers();

    std::string entry = cache->entry_path(input, meta);
    assert(entry == "split_stage/" + content_hash(input, meta));
    assert(nodes->is_group(entry + "/data"));
    assert(nodes->contains(entry + "/data/000"));
    assert(nodes->contains(entry + "/data/001/000"));
    assert(nodes->contains(entry + "/data/001/001"));
    assert(nodes->contains(entry + "/meta"));
    assert(nodes->contains(entry + "/input"));
    assert(nodes->contains(entry + "/output"));

    // Digests mirror the tuple shape
    auto digests = nlohmann::ordered_json::parse(nodes->get(entry + "/output").as_string());
    assert(digests.is_array() && digests.size() == 2 && digests.at(1).size() == 2);
    auto input_digest = nlohmann::ordered_json::parse(nodes->get(entry + "/input").as_string());
    assert(input_digest.get<std::string>() == content_hash(input));

    assert(cache->read(input, meta) == output);
    assert(cache->keys().size() == 1);

    // Unknown (input, meta) pairs miss
    bool threw = false;
    try {
        cache->read(input, {{"name", "other_stage"}});
    } catch (const no_data_source&) {
        threw = true;
    }
    assert(threw);

    // Only arrays and tuples of arrays are stored
    threw = false;
    try {
        cache->write(value(3), input, meta);
    } catch (const type_error& e) {
        threw = std::string(e.what()).find("not supported") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        cache->write(value(tuple_t{input, "label"}), input, meta);
    } catch (const type_error&) {
        threw = true;
    }
    assert(threw);

    // data_key replaces the hash
    auto fixed = cache->at({{"data_key", "fixed"}});
    assert(!fixed->exists());
    fixed->write(input, value(), {});
    assert(fixed->exists());
    assert(nodes->contains("split_stage/fixed/data"));
    assert(fixed->read(value(), {}) == input);
    assert(cache->keys().size() == 2);
    assert(!cache->exists());

    // Groups are independent
    auto other = std::make_shared<hashed_tree_storage>(nodes, "other_group");
    assert(other->keys().empty());

    nodes->close();
    assert(!*cache);
    std::filesystem::remove_all(dir);

    std::cout << "  Hashed tree layout test passed!" << std::endl;
}

} // namespace storage_tests
