#pragma once

#include "entry.hpp"
#include "pak_format.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <string>

namespace debopak::vfs {

// Produces the logical bytes to store for a File entry.
using PayloadSource = std::function<Bytes(const Entry&)>;

struct ReaderOptions {
    std::size_t maxTreeDepth{PAK_MAX_TREE_DEPTH};
};

// PAK archive reader.
// Opens a .pak file, decodes its index into an Entry tree and provides
// random access to file payloads. Errors are thrown as PakError.
class ArchiveReader {
public:
    explicit ArchiveReader(ReaderOptions options = {});
    ~ArchiveReader();

    // Non-copyable, movable.
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;
    ArchiveReader(ArchiveReader&& other) noexcept;
    ArchiveReader& operator=(ArchiveReader&& other) noexcept;

    // Open a PAK archive file. On failure nothing stays open.
    void open(const std::filesystem::path& archivePath);

    // Close the archive and release resources.
    void close();

    bool is_open() const { return file_ != nullptr; }

    const std::filesystem::path& path() const { return archivePath_; }
    const ArchiveHeader& header() const { return header_; }
    std::uint64_t file_size() const { return fileSize_; }
    std::uint64_t data_region_size() const { return fileSize_ - header_.dataOffset; }

    // Root directory of the archive.
    const Entry& tree() const { return root_; }

    // Number of records in the index (root included).
    std::size_t record_count() const { return recordCount_; }

    // Bytes exactly as stored in the data region.
    // Throws NotAFile or PayloadOutOfRange.
    Bytes read_stored_payload(const Entry& entry);

    // Logical file contents, inflated when the entry is stored compressed.
    // Throws NotAFile, PayloadOutOfRange or PayloadDecompressionError.
    Bytes read_payload(const Entry& entry);

    // Source yielding an entry's replacement payload when set, otherwise
    // its bytes from this archive.
    PayloadSource payload_source();

private:
    void read_header();
    void read_index();
    void read_at(std::uint64_t offset, std::uint8_t* out, std::size_t size);

    ReaderOptions options_;
    std::filesystem::path archivePath_;
    ArchiveHeader header_;
    Entry root_;
    std::size_t recordCount_{0};
    std::uint64_t fileSize_{0};

    FILE* file_{nullptr};
};

// Convenience: construct a reader and open `archivePath`.
ArchiveReader open_archive(const std::filesystem::path& archivePath, ReaderOptions options = {});

} // namespace debopak::vfs
