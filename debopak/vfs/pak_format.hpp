#pragma once

// Debonosu PAK Archive Format
//
// Compressed-index archive used for game assets and script bytecode.
// All integers are little-endian.
//
// Layout:
// ┌─────────────────────────────────────┐
// │ Global Header (16 bytes)            │
// │   magic[4]      = "PAK\0"           │
// │   header_offset : u32               │
// │   version       : u32 = 0x00060010  │
// │   reserved      : u32               │
// ├─────────────────────────────────────┤
// │ Extended Header (24 bytes)          │
// │   index_rel     : u32               │
// │   unknown1      : u32               │
// │   root_count    : u32               │
// │   index_usize   : u32               │
// │   index_csize   : u32               │
// │   unknown2      : u32               │
// ├─────────────────────────────────────┤
// │ Index (index_csize bytes)           │
// │   Raw DEFLATE stream of records:    │
// │     offset      : u64               │
// │     size        : u64  (file size,  │
// │                   or child count)   │
// │     stored_size : u64               │
// │     attributes  : u32               │
// │     timestamp   : u8[24]            │
// │     name        : CP932, '\0'       │
// ├─────────────────────────────────────┤
// │ Data Region (variable)              │
// │   Concatenated file payloads, raw   │
// │   DEFLATE when stored_size != size  │
// └─────────────────────────────────────┘
//
// The index lists records depth-first; a directory record is followed by
// exactly `size` direct children, each with its own subtree.

#include "../core/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace debopak::vfs {

constexpr std::array<std::uint8_t, 4> PAK_MAGIC{{'P', 'A', 'K', '\0'}};

// Version written by the original packer. Only the high half is checked.
constexpr std::uint32_t PAK_VERSION = 0x00060010;
constexpr std::uint32_t PAK_VERSION_MAJOR = PAK_VERSION >> 16;

constexpr std::size_t PAK_GLOBAL_HEADER_SIZE = 16;
constexpr std::size_t PAK_EXT_HEADER_SIZE = 24;
constexpr std::size_t PAK_RECORD_HEADER_SIZE = 52;
constexpr std::size_t PAK_TIMESTAMP_SIZE = 24;

constexpr std::uint32_t PAK_ATTR_DIRECTORY = 0x10;

// Limits against malicious files.
constexpr std::size_t PAK_MAX_NAME_LENGTH = 4096;
constexpr std::size_t PAK_MAX_TREE_DEPTH = 10000;

using Timestamp = std::array<std::uint8_t, PAK_TIMESTAMP_SIZE>;

struct PakGlobalHeader {
    std::uint32_t headerOffset{static_cast<std::uint32_t>(PAK_GLOBAL_HEADER_SIZE)};
    std::uint32_t version{PAK_VERSION};
    std::uint32_t reserved{0};
};

struct PakExtHeader {
    std::uint32_t indexRel{static_cast<std::uint32_t>(PAK_EXT_HEADER_SIZE)};
    std::uint32_t unknown1{0};
    std::uint32_t rootCount{1};
    std::uint32_t indexUncompressed{0};
    std::uint32_t indexCompressed{0};
    std::uint32_t unknown2{0};
};

// Resolved view of both headers.
struct ArchiveHeader {
    std::uint32_t headerOffset{static_cast<std::uint32_t>(PAK_GLOBAL_HEADER_SIZE)};
    std::uint32_t version{PAK_VERSION};
    std::uint32_t unknown1{0};
    std::uint32_t unknown2{0};
    std::uint32_t rootCount{1};
    std::uint32_t indexUncompressed{0};
    std::uint32_t indexCompressed{0};
    std::uint64_t indexOffset{0};   // absolute
    std::uint64_t dataOffset{0};    // absolute start of the data region
};

// Decodes the 16-byte global header.
// Throws TruncatedArchive, BadMagic or UnsupportedVersion.
PakGlobalHeader decode_global_header(ByteSpan bytes);

// Decodes the 24-byte extended header. Throws TruncatedArchive.
PakExtHeader decode_ext_header(ByteSpan bytes, std::uint64_t at);

// Serializes global + extended header for a fresh archive whose index
// immediately follows the extended header.
Bytes encode_archive_header(const ArchiveHeader& header);

} // namespace debopak::vfs
