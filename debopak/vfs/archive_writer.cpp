#include "archive_writer.hpp"

#include "directory_tree.hpp"
#include "index_record.hpp"
#include "index_transport.hpp"

#include "../core/error.hpp"
#include "../core/log.hpp"
#include "../core/text_encoding.hpp"

#include <algorithm>
#include <limits>
#include <vector>

namespace debopak::vfs {

namespace {

constexpr std::size_t kCopyChunkSize = 64 * 1024;

void write_all(FILE* file, const std::uint8_t* data, std::size_t size, const std::filesystem::path& path) {
    if (size > 0 && std::fwrite(data, 1, size, file) != size) {
        throw PakError(ErrorKind::IoError, "write failed", std::nullopt, path.string());
    }
}

} // namespace

ArchiveWriter::ArchiveWriter(WriterOptions options)
    : options_(std::move(options)) {}

ArchiveWriter::~ArchiveWriter() {
    cancel();
}

Entry ArchiveWriter::write(const std::filesystem::path& archivePath, const Entry& root,
                           const PayloadSource& source) {
    if (!root.is_directory()) {
        throw PakError(ErrorKind::NotADirectory, "archive root must be a directory", std::nullopt, root.name());
    }

    begin(archivePath);

    try {
        const std::vector<FlatEntry> flat = walk_tree(root);

        std::vector<IndexRecord> records;
        records.reserve(flat.size());

        std::size_t fileCount = 0;
        for (const FlatEntry& item : flat) {
            const Entry& entry = *item.entry;
            IndexRecord rec = make_record(entry);

            if (entry.is_file()) {
                Bytes payload;
                if (entry.replacement_payload()) {
                    payload = *entry.replacement_payload();
                } else if (source) {
                    payload = source(entry);
                } else {
                    throw PakError(ErrorKind::IoError, "no payload available", std::nullopt, item.path);
                }

                rec.offset = dataSize_;
                rec.size = payload.size();

                if (options_.compressPayloads && !payload.empty()) {
                    Bytes packed = deflate_raw(payload, options_.compressionLevel);
                    // Equal sizes would read back as "stored", so only
                    // strictly smaller output is kept.
                    if (packed.size() < payload.size()) {
                        payload = std::move(packed);
                    }
                }

                rec.storedSize = payload.size();
                append_data(payload);
                ++fileCount;

                logf(LogLevel::Debug, "write", "%s: %llu -> %llu bytes at 0x%llX", item.path.c_str(),
                     static_cast<unsigned long long>(rec.size),
                     static_cast<unsigned long long>(rec.storedSize),
                     static_cast<unsigned long long>(rec.offset));
            }

            records.push_back(std::move(rec));
        }

        NameCodec codec;
        const Bytes rawIndex = encode_records(records, codec);
        const Bytes compressedIndex = compress_index(rawIndex, options_.compressionLevel);

        if (rawIndex.size() > std::numeric_limits<std::uint32_t>::max() ||
            compressedIndex.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw PakError(ErrorKind::IoError, "index does not fit the 32-bit header fields");
        }

        header_ = options_.header;
        header_.headerOffset = static_cast<std::uint32_t>(PAK_GLOBAL_HEADER_SIZE);
        header_.rootCount = 1;
        header_.indexUncompressed = static_cast<std::uint32_t>(rawIndex.size());
        header_.indexCompressed = static_cast<std::uint32_t>(compressedIndex.size());
        header_.indexOffset = PAK_GLOBAL_HEADER_SIZE + PAK_EXT_HEADER_SIZE;
        header_.dataOffset = header_.indexOffset + compressedIndex.size();

        // Validates the layout the reader will see before anything is
        // moved into place.
        Entry written = build_tree(records);

        finalize(compressedIndex);

        logf(LogLevel::Info, "write", "wrote %s: %zu files, %zu records, index %u -> %u bytes, data %llu bytes",
             archivePath.string().c_str(), fileCount, records.size(), header_.indexUncompressed,
             header_.indexCompressed, static_cast<unsigned long long>(dataSize_));

        return written;
    } catch (...) {
        cancel();
        throw;
    }
}

void ArchiveWriter::begin(const std::filesystem::path& archivePath) {
    cancel();

    outputPath_ = archivePath;
    tempPath_ = archivePath;
    tempPath_ += ".tmp";
    dataSize_ = 0;

    const std::string pathStr = tempPath_.string();
    file_ = std::fopen(pathStr.c_str(), "wb");
    if (!file_) {
        throw PakError(ErrorKind::IoError, "cannot create output file", std::nullopt, pathStr);
    }

    spill_ = std::tmpfile();
    if (!spill_) {
        cancel();
        throw PakError(ErrorKind::IoError, "cannot create temporary data file");
    }
}

void ArchiveWriter::append_data(const Bytes& data) {
    write_all(spill_, data.data(), data.size(), tempPath_);
    dataSize_ += data.size();
}

void ArchiveWriter::finalize(const Bytes& compressedIndex) {
    const Bytes head = encode_archive_header(header_);
    write_all(file_, head.data(), head.size(), tempPath_);
    write_all(file_, compressedIndex.data(), compressedIndex.size(), tempPath_);

    // Stream the staged data region in fixed-size chunks.
    if (std::fflush(spill_) != 0 || std::fseek(spill_, 0, SEEK_SET) != 0) {
        throw PakError(ErrorKind::IoError, "cannot rewind temporary data file");
    }

    std::vector<std::uint8_t> chunk(kCopyChunkSize);
    std::uint64_t copied = 0;
    while (copied < dataSize_) {
        const std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(chunk.size(), dataSize_ - copied));
        if (std::fread(chunk.data(), 1, want, spill_) != want) {
            throw PakError(ErrorKind::IoError, "short read from temporary data file");
        }
        write_all(file_, chunk.data(), want, tempPath_);
        copied += want;
    }

    std::fclose(spill_);
    spill_ = nullptr;

    const int closeResult = std::fclose(file_);
    file_ = nullptr;
    if (closeResult != 0) {
        throw PakError(ErrorKind::IoError, "cannot flush output file", std::nullopt, tempPath_.string());
    }

    std::error_code ec;
    std::filesystem::rename(tempPath_, outputPath_, ec);
    if (ec) {
        throw PakError(ErrorKind::IoError, "cannot move archive into place: " + ec.message(),
                       std::nullopt, outputPath_.string());
    }

    tempPath_.clear();
    outputPath_.clear();
}

void ArchiveWriter::cancel() {
    if (spill_) {
        std::fclose(spill_);
        spill_ = nullptr;
    }
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }

    if (!tempPath_.empty()) {
        std::error_code ec;
        std::filesystem::remove(tempPath_, ec);
        tempPath_.clear();
    }
    outputPath_.clear();
    dataSize_ = 0;
}

Entry write_archive(const std::filesystem::path& archivePath, const Entry& root,
                    const PayloadSource& source, WriterOptions options) {
    ArchiveWriter writer(std::move(options));
    return writer.write(archivePath, root, source);
}

} // namespace debopak::vfs
