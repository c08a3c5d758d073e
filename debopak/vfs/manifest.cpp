#include "manifest.hpp"

#include "directory_tree.hpp"

#include "../core/error.hpp"

#include <tinyxml2.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>

namespace debopak::vfs {

namespace {

constexpr int kManifestFormat = 1;

// tinyxml2 refuses documents nested deeper than 500 elements; <PakManifest>
// takes one level and every directory another.
constexpr std::size_t kMaxManifestDepth = 400;
constexpr const char* kHexDigits = "0123456789abcdef";

std::string to_hex(const Timestamp& ts) {
    std::string out;
    out.reserve(ts.size() * 2);
    for (const std::uint8_t b : ts) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Timestamp from_hex(std::string_view hex, const char* name) {
    if (hex.size() != PAK_TIMESTAMP_SIZE * 2) {
        throw PakError(ErrorKind::ManifestError, "time attribute must hold 48 hex digits", std::nullopt, name);
    }
    Timestamp ts{};
    for (std::size_t i = 0; i < ts.size(); ++i) {
        const int hi = hex_value(hex[i * 2]);
        const int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw PakError(ErrorKind::ManifestError, "time attribute is not hex", std::nullopt, name);
        }
        ts[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return ts;
}

void reject_sign(const char* text, const char* what) {
    if (std::strchr(text, '-') || std::strchr(text, '+')) {
        throw PakError(ErrorKind::ManifestError, std::string("bad numeric value for ") + what);
    }
}

std::uint32_t parse_u32(const char* text, const char* what) {
    reject_sign(text, what);
    char* end = nullptr;
    const unsigned long v = std::strtoul(text, &end, 0);
    if (end == text || *end != '\0' || v > 0xFFFFFFFFul) {
        throw PakError(ErrorKind::ManifestError, std::string("bad numeric value for ") + what);
    }
    return static_cast<std::uint32_t>(v);
}

std::uint64_t parse_u64(const char* text, const char* what) {
    reject_sign(text, what);
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text, &end, 0);
    if (end == text || *end != '\0') {
        throw PakError(ErrorKind::ManifestError, std::string("bad numeric value for ") + what);
    }
    return static_cast<std::uint64_t>(v);
}

std::string hex_u32(std::uint32_t v) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08X", v);
    return buf;
}

void print_entry_rec(tinyxml2::XMLPrinter& printer, const Entry& e) {
    printer.OpenElement(e.is_directory() ? "Dir" : "File");
    printer.PushAttribute("name", e.name().c_str());
    printer.PushAttribute("attributes", e.attributes());
    printer.PushAttribute("time", to_hex(e.timestamp()).c_str());
    if (e.is_file()) {
        printer.PushAttribute("size", std::to_string(e.file().size).c_str());
    }
    for (const auto& child : e.children()) {
        print_entry_rec(printer, child);
    }
    printer.CloseElement();
}

Entry parse_entry_rec(const tinyxml2::XMLElement* el) {
    const char* tag = el->Name() ? el->Name() : "";
    const bool isDir = std::string_view(tag) == "Dir";
    if (!isDir && std::string_view(tag) != "File") {
        throw PakError(ErrorKind::ManifestError, std::string("unexpected element <") + tag + ">");
    }

    const char* name = el->Attribute("name");
    if (!name) {
        throw PakError(ErrorKind::ManifestError, std::string("<") + tag + "> without a name attribute");
    }

    Entry e = isDir ? Entry::make_directory(name) : Entry::make_file(name);

    if (const char* attrs = el->Attribute("attributes")) {
        e.set_attributes(parse_u32(attrs, "attributes"));
    }
    if (const char* time = el->Attribute("time")) {
        e.set_timestamp(from_hex(time, name));
    }
    if (const char* size = el->Attribute("size"); size && !isDir) {
        const std::uint64_t n = parse_u64(size, "size");
        e.file().size = n;
        e.file().storedSize = n;
    }

    for (auto* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (!isDir) {
            throw PakError(ErrorKind::ManifestError, "<File> cannot have children", std::nullopt, name);
        }
        e.add_child(parse_entry_rec(child));
    }

    return e;
}

} // namespace

std::string manifest_to_string(const ArchiveHeader& header, const Entry& root) {
    for (const FlatEntry& item : walk_tree(root)) {
        if (item.depth >= kMaxManifestDepth) {
            throw PakError(ErrorKind::ManifestError,
                           "tree is nested too deeply for a manifest (limit " +
                               std::to_string(kMaxManifestDepth) + " levels)",
                           std::nullopt, item.path);
        }
    }

    tinyxml2::XMLPrinter printer;
    printer.PushHeader(false, true);

    printer.OpenElement("PakManifest");
    printer.PushAttribute("format", kManifestFormat);

    printer.OpenElement("Header");
    printer.PushAttribute("version", hex_u32(header.version).c_str());
    printer.PushAttribute("unknown1", hex_u32(header.unknown1).c_str());
    printer.PushAttribute("unknown2", hex_u32(header.unknown2).c_str());
    printer.CloseElement();

    print_entry_rec(printer, root);

    printer.CloseElement();
    return std::string(printer.CStr());
}

Manifest parse_manifest(std::string_view xml) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        throw PakError(ErrorKind::ManifestError, std::string("XML parse error: ") + doc.ErrorStr());
    }

    const auto* rootEl = doc.FirstChildElement("PakManifest");
    if (!rootEl) {
        throw PakError(ErrorKind::ManifestError, "document has no <PakManifest> root element");
    }

    Manifest out;
    if (const auto* headerEl = rootEl->FirstChildElement("Header")) {
        if (const char* v = headerEl->Attribute("version")) out.header.version = parse_u32(v, "version");
        if (const char* v = headerEl->Attribute("unknown1")) out.header.unknown1 = parse_u32(v, "unknown1");
        if (const char* v = headerEl->Attribute("unknown2")) out.header.unknown2 = parse_u32(v, "unknown2");
    }

    const auto* treeEl = rootEl->FirstChildElement("Dir");
    if (!treeEl) {
        throw PakError(ErrorKind::ManifestError, "manifest has no root <Dir>");
    }
    if (treeEl->NextSiblingElement("Dir") || rootEl->FirstChildElement("File")) {
        throw PakError(ErrorKind::ManifestError, "manifest must have exactly one root <Dir>");
    }

    out.root = parse_entry_rec(treeEl);
    return out;
}

void save_manifest(const std::filesystem::path& path, const ArchiveHeader& header, const Entry& root) {
    const std::string text = manifest_to_string(header, root);

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        throw PakError(ErrorKind::IoError, "cannot create manifest", std::nullopt, path.string());
    }
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!ofs) {
        throw PakError(ErrorKind::IoError, "cannot write manifest", std::nullopt, path.string());
    }
}

Manifest load_manifest(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw PakError(ErrorKind::IoError, "cannot open manifest", std::nullopt, path.string());
    }
    const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

    try {
        return parse_manifest(text);
    } catch (const PakError& e) {
        throw PakError(e.kind(), e.what(), e.offset(), e.path().empty() ? path.string() : e.path());
    }
}

} // namespace debopak::vfs
