#pragma once

#include "types.hpp"

#include <iconv.h>

#include <string>
#include <string_view>

namespace debopak {

// Converts entry names between the archive's CP932 (Shift-JIS) bytes and
// UTF-8. Holds iconv conversion state, so one instance must not be shared
// between threads.
class NameCodec {
public:
    NameCodec();
    ~NameCodec();

    NameCodec(const NameCodec&) = delete;
    NameCodec& operator=(const NameCodec&) = delete;

    // CP932 -> UTF-8. Invalid or incomplete sequences raise InvalidName.
    std::string decode(ByteSpan cp932);

    // UTF-8 -> CP932. Embedded zero bytes or characters without a CP932
    // mapping raise InvalidName.
    Bytes encode(std::string_view utf8);

private:
    iconv_t toUtf8_;
    iconv_t fromUtf8_;
};

} // namespace debopak
