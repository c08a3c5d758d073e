#pragma once

#include "pak_format.hpp"

#include "../core/byte_buffer.hpp"
#include "../core/text_encoding.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace debopak::vfs {

// One index record: the 52-byte fixed header plus its name.
struct IndexRecord {
    std::uint64_t offset{0};
    std::uint64_t size{0};        // File: uncompressed length. Directory: child count.
    std::uint64_t storedSize{0};  // File: bytes in the data region.
    std::uint32_t attributes{0};
    Timestamp timestamp{};        // Opaque, kept verbatim.
    std::string name;             // UTF-8

    bool is_directory() const { return (attributes & PAK_ATTR_DIRECTORY) != 0; }
};

struct DecodedRecord {
    IndexRecord record;
    std::size_t consumed{0};  // header + name + terminator
};

// Decodes the record starting at `pos` in `data`.
// Throws MalformedRecord on a short header or an unterminated name, and
// InvalidName when the name bytes are not valid CP932.
DecodedRecord decode_record(ByteSpan data, std::size_t pos, NameCodec& codec);

// Appends the encoded record to `out`. Throws InvalidName for names with
// embedded zero bytes or characters CP932 cannot represent.
void encode_record(const IndexRecord& record, NameCodec& codec, ByteWriter& out);

// Decodes back-to-back records until `data` is exhausted.
std::vector<IndexRecord> decode_records(ByteSpan data, NameCodec& codec);

Bytes encode_records(const std::vector<IndexRecord>& records, NameCodec& codec);

} // namespace debopak::vfs
