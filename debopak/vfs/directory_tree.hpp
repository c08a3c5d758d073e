#pragma once

#include "entry.hpp"
#include "index_record.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace debopak::vfs {

// Rebuilds the tree from depth-first records. The first record must be the
// root directory; every directory record owns exactly `size` following
// children (with their subtrees). Throws CorruptIndex when the counts do
// not consume the sequence exactly, when siblings share a name, or when
// nesting exceeds `maxDepth`.
Entry build_tree(const std::vector<IndexRecord>& records,
                 std::size_t maxDepth = PAK_MAX_TREE_DEPTH);

// Inverse of build_tree: each node's record followed by its children's.
std::vector<IndexRecord> flatten_tree(const Entry& root);

// The record describing a single entry (directories carry their child count).
IndexRecord make_record(const Entry& entry);

// Entry in depth-first on-disk order, with its path relative to the root.
struct FlatEntry {
    const Entry* entry{nullptr};
    std::string path;
    std::size_t depth{0};
};

// Depth-first walk in on-disk order. The root itself comes first with an
// empty path.
std::vector<FlatEntry> walk_tree(const Entry& root);

} // namespace debopak::vfs
