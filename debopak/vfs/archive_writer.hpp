#pragma once

#include "archive_reader.hpp"
#include "entry.hpp"
#include "pak_format.hpp"

#include <zlib.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>

namespace debopak::vfs {

struct WriterOptions {
    int compressionLevel{Z_BEST_COMPRESSION};

    // Store payloads as raw DEFLATE when that makes them smaller.
    bool compressPayloads{true};

    // Version and opaque fields copied into the new header; offsets and
    // sizes are always recomputed.
    ArchiveHeader header{};
};

// PAK archive writer.
// Lays out every File of a tree in depth-first order, recomputing offsets
// and sizes from the bytes actually written, then emits header, compressed
// index and data region. Output goes to "<path>.tmp" and is renamed into
// place only once complete.
class ArchiveWriter {
public:
    explicit ArchiveWriter(WriterOptions options = {});
    ~ArchiveWriter();

    // Non-copyable.
    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // Writes `root` to `archivePath`. A File's replacement payload is used
    // when set, otherwise `source` provides its bytes.
    // @return The tree as written, with the new offsets and sizes.
    Entry write(const std::filesystem::path& archivePath, const Entry& root, const PayloadSource& source);

    // Header of the last successful write.
    const ArchiveHeader& written_header() const { return header_; }

private:
    void begin(const std::filesystem::path& archivePath);
    void append_data(const Bytes& data);
    void finalize(const Bytes& compressedIndex);
    void cancel();

    WriterOptions options_;
    std::filesystem::path outputPath_;
    std::filesystem::path tempPath_;
    ArchiveHeader header_;
    FILE* file_{nullptr};
    FILE* spill_{nullptr};  // data region staged until the index size is known
    std::uint64_t dataSize_{0};
};

// Convenience wrapper around ArchiveWriter::write.
Entry write_archive(const std::filesystem::path& archivePath, const Entry& root,
                    const PayloadSource& source, WriterOptions options = {});

} // namespace debopak::vfs
