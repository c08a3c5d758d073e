#include "index_record.hpp"

#include "../core/error.hpp"

#include <algorithm>

namespace debopak::vfs {

DecodedRecord decode_record(ByteSpan data, std::size_t pos, NameCodec& codec) {
    if (pos > data.size() || data.size() - pos < PAK_RECORD_HEADER_SIZE) {
        throw PakError(ErrorKind::MalformedRecord, "record header is truncated", pos);
    }

    ByteReader in(data, pos);
    DecodedRecord out;
    IndexRecord& rec = out.record;
    rec.offset = in.read_u64();
    rec.size = in.read_u64();
    rec.storedSize = in.read_u64();
    rec.attributes = in.read_u32();
    const auto ts = in.read_bytes(PAK_TIMESTAMP_SIZE);
    std::copy(ts.begin(), ts.end(), rec.timestamp.begin());

    const std::size_t nameStart = in.position();
    const std::size_t searchLen = std::min(data.size() - nameStart, PAK_MAX_NAME_LENGTH + 1);
    const auto window = data.subspan(nameStart, searchLen);
    const auto terminator = std::find(window.begin(), window.end(), std::uint8_t{0});
    if (terminator == window.end()) {
        throw PakError(ErrorKind::MalformedRecord,
                       searchLen > PAK_MAX_NAME_LENGTH ? "record name is too long"
                                                       : "record name is not terminated",
                       nameStart);
    }

    const auto nameLen = static_cast<std::size_t>(terminator - window.begin());
    try {
        rec.name = codec.decode(window.first(nameLen));
    } catch (const PakError& e) {
        throw PakError(e.kind(), e.what(), nameStart + e.offset().value_or(0));
    }

    out.consumed = PAK_RECORD_HEADER_SIZE + nameLen + 1;
    return out;
}

void encode_record(const IndexRecord& record, NameCodec& codec, ByteWriter& out) {
    const Bytes name = codec.encode(record.name);
    if (name.size() > PAK_MAX_NAME_LENGTH) {
        throw PakError(ErrorKind::InvalidName, "entry name is too long", std::nullopt, record.name);
    }

    out.write_u64(record.offset);
    out.write_u64(record.size);
    out.write_u64(record.storedSize);
    out.write_u32(record.attributes);
    out.write_bytes(record.timestamp);
    out.write_bytes(name);
    out.write_u8(0);
}

std::vector<IndexRecord> decode_records(ByteSpan data, NameCodec& codec) {
    std::vector<IndexRecord> records;
    // Cheap upper bound: every record is at least header + terminator.
    records.reserve(data.size() / (PAK_RECORD_HEADER_SIZE + 1));

    std::size_t pos = 0;
    while (pos < data.size()) {
        DecodedRecord decoded = decode_record(data, pos, codec);
        pos += decoded.consumed;
        records.push_back(std::move(decoded.record));
    }
    return records;
}

Bytes encode_records(const std::vector<IndexRecord>& records, NameCodec& codec) {
    ByteWriter out(records.size() * (PAK_RECORD_HEADER_SIZE + 16));
    for (const auto& record : records) {
        encode_record(record, codec, out);
    }
    return out.take();
}

} // namespace debopak::vfs
