#include "pak_format.hpp"

#include "../core/byte_buffer.hpp"
#include "../core/error.hpp"

#include <algorithm>
#include <cstdio>

namespace debopak::vfs {

PakGlobalHeader decode_global_header(ByteSpan bytes) {
    if (bytes.size() < PAK_GLOBAL_HEADER_SIZE) {
        throw PakError(ErrorKind::TruncatedArchive, "file is shorter than the PAK header", bytes.size());
    }

    if (!std::equal(PAK_MAGIC.begin(), PAK_MAGIC.end(), bytes.begin())) {
        throw PakError(ErrorKind::BadMagic, "missing PAK signature", 0);
    }

    ByteReader in(bytes, PAK_MAGIC.size());
    PakGlobalHeader header;
    header.headerOffset = in.read_u32();
    header.version = in.read_u32();
    header.reserved = in.read_u32();

    if ((header.version >> 16) != PAK_VERSION_MAJOR) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "unsupported PAK version 0x%08X", header.version);
        throw PakError(ErrorKind::UnsupportedVersion, buf, 8);
    }

    return header;
}

PakExtHeader decode_ext_header(ByteSpan bytes, std::uint64_t at) {
    if (bytes.size() < PAK_EXT_HEADER_SIZE) {
        throw PakError(ErrorKind::TruncatedArchive, "extended header is truncated", at);
    }

    ByteReader in(bytes);
    PakExtHeader ext;
    ext.indexRel = in.read_u32();
    ext.unknown1 = in.read_u32();
    ext.rootCount = in.read_u32();
    ext.indexUncompressed = in.read_u32();
    ext.indexCompressed = in.read_u32();
    ext.unknown2 = in.read_u32();
    return ext;
}

Bytes encode_archive_header(const ArchiveHeader& header) {
    ByteWriter out(PAK_GLOBAL_HEADER_SIZE + PAK_EXT_HEADER_SIZE);

    out.write_bytes(PAK_MAGIC);
    out.write_u32(static_cast<std::uint32_t>(PAK_GLOBAL_HEADER_SIZE));
    out.write_u32(header.version);
    out.write_u32(0);

    out.write_u32(static_cast<std::uint32_t>(PAK_EXT_HEADER_SIZE));
    out.write_u32(header.unknown1);
    out.write_u32(header.rootCount);
    out.write_u32(header.indexUncompressed);
    out.write_u32(header.indexCompressed);
    out.write_u32(header.unknown2);

    return out.take();
}

} // namespace debopak::vfs
