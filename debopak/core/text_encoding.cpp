#include "text_encoding.hpp"

#include "error.hpp"

#include <cerrno>

namespace debopak {

namespace {

constexpr const char* kArchiveCharset = "CP932";
constexpr const char* kUtf8Charset = "UTF-8";

iconv_t open_converter(const char* to, const char* from) {
    iconv_t cd = iconv_open(to, from);
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        throw PakError(ErrorKind::IoError,
                       std::string("iconv cannot convert ") + from + " to " + to);
    }
    return cd;
}

// Runs one complete conversion. The output grows on E2BIG; any other
// failure is reported as InvalidName with the input position.
std::string convert(iconv_t cd, const char* data, std::size_t size, const char* what) {
    // Reset shift state left over from a previous failed call.
    iconv(cd, nullptr, nullptr, nullptr, nullptr);

    std::string out;
    out.resize(size * 3 + 8);

    char* in = const_cast<char*>(data);
    std::size_t inLeft = size;
    std::size_t written = 0;

    while (true) {
        char* outPtr = out.data() + written;
        std::size_t outLeft = out.size() - written;

        const std::size_t rc = iconv(cd, &in, &inLeft, &outPtr, &outLeft);
        written = static_cast<std::size_t>(outPtr - out.data());

        if (rc != static_cast<std::size_t>(-1)) {
            break;
        }
        if (errno == E2BIG) {
            out.resize(out.size() * 2);
            continue;
        }
        throw PakError(ErrorKind::InvalidName,
                       std::string("cannot ") + what + " entry name",
                       static_cast<std::uint64_t>(size - inLeft));
    }

    // Flush any pending shift sequence.
    while (true) {
        char* outPtr = out.data() + written;
        std::size_t outLeft = out.size() - written;
        const std::size_t rc = iconv(cd, nullptr, nullptr, &outPtr, &outLeft);
        written = static_cast<std::size_t>(outPtr - out.data());
        if (rc != static_cast<std::size_t>(-1)) {
            break;
        }
        if (errno != E2BIG) {
            throw PakError(ErrorKind::InvalidName, std::string("cannot ") + what + " entry name");
        }
        out.resize(out.size() * 2);
    }

    out.resize(written);
    return out;
}

} // namespace

NameCodec::NameCodec()
    : toUtf8_(open_converter(kUtf8Charset, kArchiveCharset))
    , fromUtf8_(reinterpret_cast<iconv_t>(-1)) {
    try {
        fromUtf8_ = open_converter(kArchiveCharset, kUtf8Charset);
    } catch (const PakError&) {
        iconv_close(toUtf8_);
        throw;
    }
}

NameCodec::~NameCodec() {
    iconv_close(toUtf8_);
    iconv_close(fromUtf8_);
}

std::string NameCodec::decode(ByteSpan cp932) {
    if (cp932.empty()) {
        return {};
    }
    return convert(toUtf8_, reinterpret_cast<const char*>(cp932.data()), cp932.size(), "decode");
}

Bytes NameCodec::encode(std::string_view utf8) {
    if (const auto zero = utf8.find('\0'); zero != std::string_view::npos) {
        throw PakError(ErrorKind::InvalidName, "entry name contains a zero byte",
                       static_cast<std::uint64_t>(zero));
    }
    if (utf8.empty()) {
        return {};
    }

    const std::string out = convert(fromUtf8_, utf8.data(), utf8.size(), "encode");
    return Bytes(out.begin(), out.end());
}

} // namespace debopak
