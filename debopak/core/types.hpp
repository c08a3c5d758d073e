#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace debopak {

// ============================================================================
// Core Types
// ============================================================================

using Bytes = std::vector<std::uint8_t>;
using ByteSpan = std::span<const std::uint8_t>;

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

} // namespace debopak
