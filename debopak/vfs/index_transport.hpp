#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"

#include <zlib.h>

#include <cstddef>

namespace debopak::vfs {

// Headerless (raw) DEFLATE helpers shared by the index and the payloads.

// Inflates `compressed` and requires the stream to end exactly at
// `expectedSize` output bytes with no input left over. Any failure raises
// PakError(`failure`).
Bytes inflate_raw(ByteSpan compressed, std::size_t expectedSize, ErrorKind failure);

// Raw DEFLATE at the given zlib level.
Bytes deflate_raw(ByteSpan raw, int level = Z_BEST_COMPRESSION);

// Index block transport. Failures raise IndexDecompressionError.
Bytes decompress_index(ByteSpan compressed, std::size_t expectedSize);
Bytes compress_index(ByteSpan raw, int level = Z_BEST_COMPRESSION);

} // namespace debopak::vfs
