/**
 * @file test_directory_tree.cpp
 * @brief Unit tests for building the tree from flat records and flattening it back.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/test_utils.hpp"
#include "vfs/directory_tree.hpp"

using namespace debopak;
using namespace debopak::vfs;
using test_helpers::pak_error_kind;

namespace {

IndexRecord dir_record(const std::string& name, std::uint64_t children) {
    IndexRecord rec;
    rec.name = name;
    rec.attributes = PAK_ATTR_DIRECTORY;
    rec.size = children;
    return rec;
}

IndexRecord file_record(const std::string& name, std::uint64_t offset, std::uint64_t size) {
    IndexRecord rec;
    rec.name = name;
    rec.offset = offset;
    rec.size = size;
    rec.storedSize = size;
    return rec;
}

} // namespace

TEST_CASE("Root with one file and one empty directory", "[vfs][tree]") {
    Entry root = Entry::make_directory("");
    Entry a = Entry::make_file("a.bin", 4);
    root.add_child(a);
    root.add_child(Entry::make_directory("sub"));

    const auto records = flatten_tree(root);
    REQUIRE(records.size() == 3);
    REQUIRE(records[0].is_directory());
    REQUIRE(records[0].size == 2);
    REQUIRE(records[1].name == "a.bin");
    REQUIRE(records[1].size == 4);
    REQUIRE(records[1].offset == 0);
    REQUIRE(records[2].name == "sub");
    REQUIRE(records[2].is_directory());
    REQUIRE(records[2].size == 0);

    const Entry rebuilt = build_tree(records);
    REQUIRE(rebuilt == root);
    REQUIRE(rebuilt.children().size() == 2);
    REQUIRE(rebuilt.children()[1].children().empty());
}

TEST_CASE("build_tree inverts flatten_tree", "[vfs][tree]") {
    Entry root = test_helpers::make_sample_tree();
    root.find("a.bin")->file() = FileData{0, 4, 4};
    root.find("sub/c.bin")->file() = FileData{4, 300, 300};
    root.find("sub/deeper/d.txt")->file() = FileData{304, 500, 12};
    root.find("b.bin")->file() = FileData{316, 14, 14};

    const auto records = flatten_tree(root);
    REQUIRE(records.size() == 7);

    const Entry rebuilt = build_tree(records);
    REQUIRE(rebuilt == root);
    REQUIRE(flatten_tree(rebuilt).size() == records.size());
}

TEST_CASE("walk_tree yields depth-first order with paths", "[vfs][tree]") {
    const Entry root = test_helpers::make_sample_tree();
    const auto flat = walk_tree(root);

    REQUIRE(flat.size() == 7);
    REQUIRE(flat[0].path.empty());
    REQUIRE(flat[0].entry == &root);
    REQUIRE(flat[1].path == "a.bin");
    REQUIRE(flat[2].path == "sub");
    REQUIRE(flat[3].path == "sub/c.bin");
    REQUIRE(flat[4].path == "sub/deeper");
    REQUIRE(flat[5].path == "sub/deeper/d.txt");
    REQUIRE(flat[5].depth == 3);
    REQUIRE(flat[6].path == "b.bin");
}

TEST_CASE("build_tree enforces directory child counts", "[vfs][tree]") {
    SECTION("count larger than the remaining records") {
        const std::vector<IndexRecord> records{
            dir_record("", 2),
            file_record("a", 0, 1),
        };
        REQUIRE(pak_error_kind([&] { (void)build_tree(records); }) == ErrorKind::CorruptIndex);
    }

    SECTION("nested count larger than its subtree") {
        const std::vector<IndexRecord> records{
            dir_record("", 2),
            dir_record("sub", 3),
            file_record("a", 0, 1),
            file_record("b", 1, 1),
        };
        REQUIRE(pak_error_kind([&] { (void)build_tree(records); }) == ErrorKind::CorruptIndex);
    }

    SECTION("count smaller than the sequence leaves trailing records") {
        const std::vector<IndexRecord> records{
            dir_record("", 1),
            file_record("a", 0, 1),
            file_record("b", 1, 1),
        };
        REQUIRE(pak_error_kind([&] { (void)build_tree(records); }) == ErrorKind::CorruptIndex);
    }

    SECTION("root must be a directory") {
        const std::vector<IndexRecord> records{file_record("a", 0, 1)};
        REQUIRE(pak_error_kind([&] { (void)build_tree(records); }) == ErrorKind::CorruptIndex);
    }

    SECTION("empty sequence") {
        REQUIRE(pak_error_kind([] { (void)build_tree({}); }) == ErrorKind::CorruptIndex);
    }

    SECTION("duplicate sibling names") {
        const std::vector<IndexRecord> records{
            dir_record("", 2),
            file_record("a", 0, 1),
            file_record("a", 1, 1),
        };
        REQUIRE(pak_error_kind([&] { (void)build_tree(records); }) == ErrorKind::CorruptIndex);
    }

    SECTION("absurd child count does not over-allocate") {
        const std::vector<IndexRecord> records{
            dir_record("", 0xFFFFFFFFFFFFull),
            file_record("a", 0, 1),
        };
        REQUIRE(pak_error_kind([&] { (void)build_tree(records); }) == ErrorKind::CorruptIndex);
    }
}

TEST_CASE("build_tree rejects pathological nesting", "[vfs][tree]") {
    SECTION("custom limit") {
        std::vector<IndexRecord> records;
        for (int i = 0; i < 20; ++i) {
            records.push_back(dir_record("d" + std::to_string(i), i + 1 < 20 ? 1 : 0));
        }
        REQUIRE(pak_error_kind([&] { (void)build_tree(records, 10); }) == ErrorKind::CorruptIndex);
        REQUIRE_NOTHROW(build_tree(records, 20));
    }

    SECTION("default limit") {
        const std::size_t depth = PAK_MAX_TREE_DEPTH + 1;
        std::vector<IndexRecord> records;
        records.reserve(depth);
        for (std::size_t i = 0; i < depth; ++i) {
            records.push_back(dir_record("d", i + 1 < depth ? 1 : 0));
        }
        REQUIRE(pak_error_kind([&] { (void)build_tree(records); }) == ErrorKind::CorruptIndex);
    }
}
