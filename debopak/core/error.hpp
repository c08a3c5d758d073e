#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace debopak {

// Failure categories for archive operations. All of them are terminal for
// the operation that raised them; nothing is retried.
enum class ErrorKind : std::uint8_t {
    BadMagic,
    UnsupportedVersion,
    TruncatedArchive,
    IndexDecompressionError,
    MalformedRecord,
    InvalidName,
    CorruptIndex,
    NotAFile,
    NotADirectory,
    PayloadOutOfRange,
    PayloadDecompressionError,
    ManifestError,
    IoError,
};

const char* to_string(ErrorKind kind);

class PakError : public std::runtime_error {
public:
    PakError(ErrorKind kind, const std::string& message,
             std::optional<std::uint64_t> offset = std::nullopt,
             std::string path = {});

    ErrorKind kind() const { return kind_; }

    // Byte offset the failure was detected at, when one applies.
    const std::optional<std::uint64_t>& offset() const { return offset_; }

    // Entry or file path the failure relates to (may be empty).
    const std::string& path() const { return path_; }

private:
    ErrorKind kind_;
    std::optional<std::uint64_t> offset_;
    std::string path_;
};

} // namespace debopak
