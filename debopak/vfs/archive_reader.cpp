#include "archive_reader.hpp"

#include "directory_tree.hpp"
#include "index_record.hpp"
#include "index_transport.hpp"

#include "../core/error.hpp"
#include "../core/log.hpp"
#include "../core/text_encoding.hpp"

#include <array>
#include <utility>
#include <vector>

namespace debopak::vfs {

ArchiveReader::ArchiveReader(ReaderOptions options)
    : options_(options) {}

ArchiveReader::~ArchiveReader() {
    close();
}

ArchiveReader::ArchiveReader(ArchiveReader&& other) noexcept
    : options_(other.options_)
    , archivePath_(std::move(other.archivePath_))
    , header_(other.header_)
    , root_(std::move(other.root_))
    , recordCount_(other.recordCount_)
    , fileSize_(other.fileSize_)
    , file_(other.file_) {
    other.file_ = nullptr;
}

ArchiveReader& ArchiveReader::operator=(ArchiveReader&& other) noexcept {
    if (this != &other) {
        close();
        options_ = other.options_;
        archivePath_ = std::move(other.archivePath_);
        header_ = other.header_;
        root_ = std::move(other.root_);
        recordCount_ = other.recordCount_;
        fileSize_ = other.fileSize_;
        file_ = other.file_;
        other.file_ = nullptr;
    }
    return *this;
}

void ArchiveReader::open(const std::filesystem::path& archivePath) {
    close();

    std::error_code ec;
    const auto size = std::filesystem::file_size(archivePath, ec);
    if (ec) {
        throw PakError(ErrorKind::IoError, "cannot stat archive: " + ec.message(), std::nullopt,
                       archivePath.string());
    }

    const std::string pathStr = archivePath.string();
    file_ = std::fopen(pathStr.c_str(), "rb");
    if (!file_) {
        throw PakError(ErrorKind::IoError, "cannot open archive", std::nullopt, pathStr);
    }

    archivePath_ = archivePath;
    fileSize_ = size;

    try {
        read_header();
        read_index();
    } catch (const PakError& e) {
        close();
        throw PakError(e.kind(), e.what(), e.offset(), e.path().empty() ? pathStr : e.path());
    } catch (...) {
        close();
        throw;
    }

    logf(LogLevel::Info, "read", "opened %s: %zu records, index %u -> %u bytes, data region %llu bytes",
         pathStr.c_str(), recordCount_, header_.indexCompressed, header_.indexUncompressed,
         static_cast<unsigned long long>(data_region_size()));
}

void ArchiveReader::close() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    root_ = Entry{};
    header_ = ArchiveHeader{};
    recordCount_ = 0;
    fileSize_ = 0;
    archivePath_.clear();
}

void ArchiveReader::read_at(std::uint64_t offset, std::uint8_t* out, std::size_t size) {
    if (offset > fileSize_ || size > fileSize_ - offset) {
        throw PakError(ErrorKind::TruncatedArchive, "read past the end of the archive", offset);
    }
    if (size == 0) {
        return;
    }
    if (std::fseek(file_, static_cast<long>(offset), SEEK_SET) != 0) {
        throw PakError(ErrorKind::IoError, "seek failed", offset);
    }
    if (std::fread(out, 1, size, file_) != size) {
        throw PakError(ErrorKind::TruncatedArchive, "short read", offset);
    }
}

void ArchiveReader::read_header() {
    if (fileSize_ < PAK_GLOBAL_HEADER_SIZE) {
        throw PakError(ErrorKind::TruncatedArchive, "file is shorter than the PAK header", fileSize_);
    }

    std::array<std::uint8_t, PAK_GLOBAL_HEADER_SIZE> head{};
    read_at(0, head.data(), head.size());
    const PakGlobalHeader global = decode_global_header(head);

    // The low 16 bits locate the extended header; some archives carry
    // extra bits above them, so the full value is the fallback.
    std::vector<std::uint64_t> candidates{global.headerOffset & 0xFFFFu};
    if (global.headerOffset != candidates.front()) {
        candidates.push_back(global.headerOffset);
    }

    for (const std::uint64_t candidate : candidates) {
        if (candidate < PAK_GLOBAL_HEADER_SIZE || candidate + PAK_EXT_HEADER_SIZE > fileSize_) {
            continue;
        }

        std::array<std::uint8_t, PAK_EXT_HEADER_SIZE> extBytes{};
        read_at(candidate, extBytes.data(), extBytes.size());
        const PakExtHeader ext = decode_ext_header(extBytes, candidate);

        const std::uint64_t indexOffset = candidate + ext.indexRel;
        const std::uint64_t dataOffset = indexOffset + ext.indexCompressed;
        if (ext.indexUncompressed == 0 || ext.indexCompressed == 0 || dataOffset > fileSize_) {
            continue;
        }

        header_.headerOffset = static_cast<std::uint32_t>(candidate);
        header_.version = global.version;
        header_.unknown1 = ext.unknown1;
        header_.unknown2 = ext.unknown2;
        header_.rootCount = ext.rootCount;
        header_.indexUncompressed = ext.indexUncompressed;
        header_.indexCompressed = ext.indexCompressed;
        header_.indexOffset = indexOffset;
        header_.dataOffset = dataOffset;

        logf(LogLevel::Debug, "read", "extended header at 0x%llX, index at 0x%llX, data at 0x%llX",
             static_cast<unsigned long long>(candidate),
             static_cast<unsigned long long>(indexOffset),
             static_cast<unsigned long long>(dataOffset));
        return;
    }

    throw PakError(ErrorKind::TruncatedArchive, "no extended header fits within the archive",
                   global.headerOffset);
}

void ArchiveReader::read_index() {
    if (header_.rootCount != 1) {
        throw PakError(ErrorKind::CorruptIndex,
                       "archive declares " + std::to_string(header_.rootCount) + " root records",
                       header_.headerOffset + 8);
    }

    Bytes compressed(header_.indexCompressed);
    read_at(header_.indexOffset, compressed.data(), compressed.size());

    Bytes raw;
    try {
        raw = decompress_index(compressed, header_.indexUncompressed);
    } catch (const PakError& e) {
        // Report the position within the file rather than within the block.
        throw PakError(e.kind(), e.what(), header_.indexOffset + e.offset().value_or(0));
    }

    NameCodec codec;
    const std::vector<IndexRecord> records = decode_records(raw, codec);
    root_ = build_tree(records, options_.maxTreeDepth);
    recordCount_ = records.size();
}

Bytes ArchiveReader::read_stored_payload(const Entry& entry) {
    const FileData& f = entry.file();

    if (!is_open()) {
        throw PakError(ErrorKind::IoError, "archive is not open", std::nullopt, entry.name());
    }

    const std::uint64_t region = data_region_size();
    if (f.offset > region || f.storedSize > region - f.offset) {
        throw PakError(ErrorKind::PayloadOutOfRange, "payload lies outside the data region",
                       header_.dataOffset + f.offset, entry.name());
    }

    Bytes data(static_cast<std::size_t>(f.storedSize));
    read_at(header_.dataOffset + f.offset, data.data(), data.size());
    return data;
}

Bytes ArchiveReader::read_payload(const Entry& entry) {
    Bytes stored = read_stored_payload(entry);

    const FileData& f = entry.file();
    if (f.storedSize == f.size) {
        return stored;
    }

    try {
        return inflate_raw(stored, static_cast<std::size_t>(f.size), ErrorKind::PayloadDecompressionError);
    } catch (const PakError& e) {
        throw PakError(e.kind(), e.what(), header_.dataOffset + f.offset, entry.name());
    }
}

PayloadSource ArchiveReader::payload_source() {
    return [this](const Entry& entry) {
        if (const auto& replacement = entry.replacement_payload()) {
            return *replacement;
        }
        return read_payload(entry);
    };
}

ArchiveReader open_archive(const std::filesystem::path& archivePath, ReaderOptions options) {
    ArchiveReader reader(options);
    reader.open(archivePath);
    return reader;
}

} // namespace debopak::vfs
