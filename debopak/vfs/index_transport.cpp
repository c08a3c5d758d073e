#include "index_transport.hpp"

#include <limits>
#include <string>

namespace debopak::vfs {

namespace {

constexpr std::size_t kMaxZlibChunk = std::numeric_limits<uInt>::max();

// DEFLATE cannot expand input by more than 1032:1 (258-byte matches coded
// in 2 bits), plus slack for a tiny stream.
constexpr std::size_t kMaxInflateRatio = 1032;
constexpr std::size_t kInflateSlack = 1024;

std::string zlib_message(const z_stream& zs, int ret) {
    if (zs.msg) {
        return zs.msg;
    }
    return "zlib error " + std::to_string(ret);
}

} // namespace

Bytes inflate_raw(ByteSpan compressed, std::size_t expectedSize, ErrorKind failure) {
    if (compressed.size() > kMaxZlibChunk || expectedSize >= kMaxZlibChunk) {
        throw PakError(failure, "compressed stream is too large");
    }
    if (expectedSize > compressed.size() * kMaxInflateRatio + kInflateSlack) {
        throw PakError(failure,
                       "declared size " + std::to_string(expectedSize) + " cannot come from " +
                           std::to_string(compressed.size()) + " compressed bytes");
    }

    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
        throw PakError(failure, "inflateInit2 failed");
    }

    // One spare byte so an over-long stream shows up as a size mismatch
    // instead of an ambiguous buffer error.
    Bytes out(expectedSize + 1);

    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(compressed.data()));
    zs.avail_in = static_cast<uInt>(compressed.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());

    const int ret = inflate(&zs, Z_FINISH);
    const std::size_t produced = static_cast<std::size_t>(zs.total_out);
    const std::size_t consumed = static_cast<std::size_t>(zs.total_in);
    const std::string msg = zlib_message(zs, ret);
    inflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw PakError(failure, "raw inflate failed: " + msg, consumed);
    }
    if (produced != expectedSize) {
        throw PakError(failure,
                       "inflated size " + std::to_string(produced) + " does not match expected " +
                           std::to_string(expectedSize),
                       consumed);
    }
    if (consumed != compressed.size()) {
        throw PakError(failure, "trailing bytes after the deflate stream", consumed);
    }

    out.resize(expectedSize);
    return out;
}

Bytes deflate_raw(ByteSpan raw, int level) {
    if (raw.size() > kMaxZlibChunk) {
        throw PakError(ErrorKind::IoError, "payload is too large to compress");
    }

    z_stream zs{};
    if (deflateInit2(&zs, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw PakError(ErrorKind::IoError, "deflateInit2 failed");
    }

    Bytes out(deflateBound(&zs, static_cast<uLong>(raw.size())));

    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(raw.data()));
    zs.avail_in = static_cast<uInt>(raw.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());

    const int ret = deflate(&zs, Z_FINISH);
    const std::size_t produced = static_cast<std::size_t>(zs.total_out);
    const std::string msg = zlib_message(zs, ret);
    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw PakError(ErrorKind::IoError, "deflate failed: " + msg);
    }

    out.resize(produced);
    return out;
}

Bytes decompress_index(ByteSpan compressed, std::size_t expectedSize) {
    return inflate_raw(compressed, expectedSize, ErrorKind::IndexDecompressionError);
}

Bytes compress_index(ByteSpan raw, int level) {
    return deflate_raw(raw, level);
}

} // namespace debopak::vfs
