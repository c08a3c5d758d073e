#include "directory_tree.hpp"

#include "../core/error.hpp"
#include "../core/log.hpp"

#include <algorithm>
#include <unordered_set>

namespace debopak::vfs {

namespace {

Entry entry_from_record(const IndexRecord& rec) {
    Entry e = rec.is_directory() ? Entry::make_directory(rec.name) : Entry::make_file(rec.name);
    e.set_attributes(rec.attributes);
    e.set_timestamp(rec.timestamp);
    if (e.is_file()) {
        FileData& f = e.file();
        f.offset = rec.offset;
        f.size = rec.size;
        f.storedSize = rec.storedSize;
    }
    return e;
}

// Open directory on the build stack.
struct Frame {
    Entry* dir;
    std::uint64_t remaining;
    std::unordered_set<std::string> names;
};

} // namespace

Entry build_tree(const std::vector<IndexRecord>& records, std::size_t maxDepth) {
    if (records.empty()) {
        throw PakError(ErrorKind::CorruptIndex, "index holds no records");
    }
    if (!records.front().is_directory()) {
        throw PakError(ErrorKind::CorruptIndex, "first index record is not a directory", 0,
                       records.front().name);
    }

    Entry root = entry_from_record(records.front());

    std::vector<Frame> stack;
    stack.push_back({&root, records.front().size, {}});

    std::size_t next = 1;
    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.remaining == 0) {
            stack.pop_back();
            continue;
        }

        if (next >= records.size()) {
            throw PakError(ErrorKind::CorruptIndex,
                           "directory declares more children than the index holds",
                           next, top.dir->name());
        }

        const IndexRecord& rec = records[next];
        if (!top.names.insert(rec.name).second) {
            throw PakError(ErrorKind::CorruptIndex, "duplicate name within a directory", next, rec.name);
        }

        auto& siblings = top.dir->mutable_children();
        if (siblings.empty()) {
            const std::size_t left = records.size() - next;
            siblings.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(top.remaining, left)));
        }

        --top.remaining;
        ++next;

        // `siblings` only grows while this frame is on top, so the address
        // stays valid for the child's frame.
        Entry& child = siblings.emplace_back(entry_from_record(rec));
        if (rec.is_directory()) {
            if (stack.size() >= maxDepth) {
                throw PakError(ErrorKind::CorruptIndex, "directory nesting is too deep", next - 1, rec.name);
            }
            stack.push_back({&child, rec.size, {}});
        }
    }

    if (next != records.size()) {
        throw PakError(ErrorKind::CorruptIndex, "records remain after the root directory is complete", next);
    }

    logf(LogLevel::Debug, "index", "built tree from %zu records", records.size());
    return root;
}

IndexRecord make_record(const Entry& entry) {
    IndexRecord rec;
    rec.name = entry.name();
    rec.attributes = entry.attributes();
    rec.timestamp = entry.timestamp();
    if (entry.is_directory()) {
        rec.size = entry.children().size();
    } else {
        const FileData& f = entry.file();
        rec.offset = f.offset;
        rec.size = f.size;
        rec.storedSize = f.storedSize;
    }
    return rec;
}

std::vector<FlatEntry> walk_tree(const Entry& root) {
    std::vector<FlatEntry> out;

    // Children are pushed in reverse so they pop in on-disk order.
    std::vector<FlatEntry> stack;
    stack.push_back({&root, std::string{}, 0});

    while (!stack.empty()) {
        FlatEntry item = std::move(stack.back());
        stack.pop_back();

        const auto& children = item.entry->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            std::string path = item.path.empty() ? it->name() : item.path + "/" + it->name();
            stack.push_back({&*it, std::move(path), item.depth + 1});
        }

        out.push_back(std::move(item));
    }

    return out;
}

std::vector<IndexRecord> flatten_tree(const Entry& root) {
    const auto flat = walk_tree(root);

    std::vector<IndexRecord> records;
    records.reserve(flat.size());
    for (const auto& item : flat) {
        records.push_back(make_record(*item.entry));
    }
    return records;
}

} // namespace debopak::vfs
