#include "error.hpp"

#include <utility>

namespace debopak {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadMagic:                  return "BadMagic";
        case ErrorKind::UnsupportedVersion:        return "UnsupportedVersion";
        case ErrorKind::TruncatedArchive:          return "TruncatedArchive";
        case ErrorKind::IndexDecompressionError:   return "IndexDecompressionError";
        case ErrorKind::MalformedRecord:           return "MalformedRecord";
        case ErrorKind::InvalidName:               return "InvalidName";
        case ErrorKind::CorruptIndex:              return "CorruptIndex";
        case ErrorKind::NotAFile:                  return "NotAFile";
        case ErrorKind::NotADirectory:             return "NotADirectory";
        case ErrorKind::PayloadOutOfRange:         return "PayloadOutOfRange";
        case ErrorKind::PayloadDecompressionError: return "PayloadDecompressionError";
        case ErrorKind::ManifestError:             return "ManifestError";
        case ErrorKind::IoError:                   return "IoError";
    }
    return "Unknown";
}

PakError::PakError(ErrorKind kind, const std::string& message,
                   std::optional<std::uint64_t> offset, std::string path)
    : std::runtime_error(message)
    , kind_(kind)
    , offset_(offset)
    , path_(std::move(path)) {}

} // namespace debopak
