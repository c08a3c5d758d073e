#pragma once

#include "pak_format.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace debopak::vfs {

class Entry;

struct FileData {
    std::uint64_t offset{0};      // relative to the data region
    std::uint64_t size{0};        // logical (uncompressed) length
    std::uint64_t storedSize{0};  // bytes in the data region
};

struct DirectoryData {
    std::vector<Entry> children;  // on-disk order
};

// A node of the archive tree: a File or a Directory.
//
// The record field that holds a file's size holds a directory's child count
// on disk; here the two cases are separate alternatives, so the child count
// is always children().size().
class Entry {
public:
    static Entry make_file(std::string name, std::uint64_t size = 0);
    static Entry make_directory(std::string name);

    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    // The directory bit always follows the entry kind.
    std::uint32_t attributes() const { return attributes_; }
    void set_attributes(std::uint32_t attributes);

    const Timestamp& timestamp() const { return timestamp_; }
    void set_timestamp(const Timestamp& timestamp) { timestamp_ = timestamp; }

    bool is_directory() const { return std::holds_alternative<DirectoryData>(data_); }
    bool is_file() const { return std::holds_alternative<FileData>(data_); }

    // Throws NotAFile for directories.
    const FileData& file() const;
    FileData& file();

    // Empty for files.
    const std::vector<Entry>& children() const;

    // Direct child access without the sibling-name check. Throws NotADirectory.
    std::vector<Entry>& mutable_children();

    // --- Builder operations (directories only, else NotADirectory) ---

    // Appends a child. Throws InvalidName if a sibling already has its name.
    Entry& add_child(Entry child);

    // @return false if no child has this name.
    bool remove_child(std::string_view name);

    // Replaces the named child in place, keeping its position.
    // @return false if no child has this name.
    bool replace_child(std::string_view name, Entry child);

    const Entry* find_child(std::string_view name) const;
    Entry* find_child(std::string_view name);

    // Resolves a '/'-separated path below this entry ("" is this entry).
    const Entry* find(std::string_view path) const;
    Entry* find(std::string_view path);

    // Replaces the payload the writer will store for this file.
    // Throws NotAFile for directories.
    void set_payload(Bytes data);
    void clear_payload();
    const std::shared_ptr<const Bytes>& replacement_payload() const { return replacement_; }

    // Compares name, attributes, timestamp, file fields and children in
    // order. Replacement payloads are not part of the comparison.
    bool operator==(const Entry& other) const;
    bool operator!=(const Entry& other) const { return !(*this == other); }

private:
    std::string name_;
    std::uint32_t attributes_{0};
    Timestamp timestamp_{};
    std::variant<FileData, DirectoryData> data_;
    std::shared_ptr<const Bytes> replacement_;
};

} // namespace debopak::vfs
