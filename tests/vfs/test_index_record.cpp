/**
 * @file test_index_record.cpp
 * @brief Unit tests for the 52-byte index record codec.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/test_utils.hpp"
#include "vfs/index_record.hpp"

using namespace debopak;
using namespace debopak::vfs;
using test_helpers::make_timestamp;
using test_helpers::pak_error_kind;

namespace {

IndexRecord sample_file_record() {
    IndexRecord rec;
    rec.offset = 0x1122334455667788ull;
    rec.size = 4;
    rec.storedSize = 3;
    rec.attributes = 0x20;
    rec.timestamp = make_timestamp(9);
    rec.name = "a.bin";
    return rec;
}

} // namespace

TEST_CASE("encode_record lays out the fixed header", "[vfs][record]") {
    NameCodec codec;
    ByteWriter out;
    encode_record(sample_file_record(), codec, out);

    const auto data = out.data();
    REQUIRE(data.size() == PAK_RECORD_HEADER_SIZE + 5 + 1);

    ByteReader r(data);
    REQUIRE(r.read_u64() == 0x1122334455667788ull);  // offset
    REQUIRE(r.read_u64() == 4);                      // size
    REQUIRE(r.read_u64() == 3);                      // stored size
    REQUIRE(r.read_u32() == 0x20);                   // attributes
    const auto ts = r.read_bytes(PAK_TIMESTAMP_SIZE);
    REQUIRE(ts[0] == 9);
    REQUIRE(ts[23] == 9 + 23);
    REQUIRE(r.position() == PAK_RECORD_HEADER_SIZE);

    const auto name = r.read_bytes(6);
    REQUIRE(name[0] == 'a');
    REQUIRE(name[5] == 0);
}

TEST_CASE("decode_record inverts encode_record", "[vfs][record]") {
    NameCodec codec;
    const IndexRecord original = sample_file_record();
    const Bytes bytes = encode_records({original}, codec);

    const DecodedRecord decoded = decode_record(bytes, 0, codec);
    REQUIRE(decoded.consumed == bytes.size());
    REQUIRE(decoded.record.offset == original.offset);
    REQUIRE(decoded.record.size == original.size);
    REQUIRE(decoded.record.storedSize == original.storedSize);
    REQUIRE(decoded.record.attributes == original.attributes);
    REQUIRE(decoded.record.timestamp == original.timestamp);
    REQUIRE(decoded.record.name == original.name);
    REQUIRE_FALSE(decoded.record.is_directory());
}

TEST_CASE("decode_records walks back-to-back records", "[vfs][record]") {
    NameCodec codec;

    IndexRecord dir;
    dir.attributes = PAK_ATTR_DIRECTORY;
    dir.size = 1;
    dir.name = "";

    IndexRecord file = sample_file_record();
    file.name = "\xE3\x83\x86\xE3\x82\xB9\xE3\x83\x88.scb";  // テスト.scb

    const Bytes bytes = encode_records({dir, file}, codec);
    REQUIRE(bytes.size() == 2 * PAK_RECORD_HEADER_SIZE + 1 + (6 + 4) + 1);

    const auto records = decode_records(bytes, codec);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].is_directory());
    REQUIRE(records[0].name.empty());
    REQUIRE(records[1].name == file.name);
}

TEST_CASE("decode_record rejects malformed input", "[vfs][record]") {
    NameCodec codec;
    const Bytes good = encode_records({sample_file_record()}, codec);

    SECTION("truncated fixed header") {
        const Bytes shortHeader(good.begin(), good.begin() + 40);
        REQUIRE(pak_error_kind([&] { (void)decode_record(shortHeader, 0, codec); }) ==
                ErrorKind::MalformedRecord);
    }

    SECTION("name without terminator") {
        const Bytes unterminated(good.begin(), good.end() - 1);
        REQUIRE(pak_error_kind([&] { (void)decode_record(unterminated, 0, codec); }) ==
                ErrorKind::MalformedRecord);
    }

    SECTION("header only, no name bytes at all") {
        const Bytes headerOnly(good.begin(), good.begin() + PAK_RECORD_HEADER_SIZE);
        REQUIRE(pak_error_kind([&] { (void)decode_record(headerOnly, 0, codec); }) ==
                ErrorKind::MalformedRecord);
    }

    SECTION("trailing garbage after the last record") {
        Bytes withTail = good;
        withTail.push_back(0x01);
        REQUIRE(pak_error_kind([&] { (void)decode_records(withTail, codec); }) ==
                ErrorKind::MalformedRecord);
    }

    SECTION("name bytes that are not CP932") {
        Bytes badName(good.begin(), good.begin() + PAK_RECORD_HEADER_SIZE);
        badName.push_back(0x83);  // lead byte followed by the terminator
        badName.push_back(0x00);
        REQUIRE(pak_error_kind([&] { (void)decode_record(badName, 0, codec); }) == ErrorKind::InvalidName);
    }
}

TEST_CASE("encode_record rejects names with zero bytes", "[vfs][record]") {
    NameCodec codec;
    IndexRecord rec = sample_file_record();
    rec.name = std::string("a\0b", 3);

    ByteWriter out;
    REQUIRE(pak_error_kind([&] { encode_record(rec, codec, out); }) == ErrorKind::InvalidName);
    REQUIRE(out.size() == 0);
}
