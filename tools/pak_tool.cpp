// pak_tool - CLI tool for listing, extracting and repacking .pak archives.
//
// Usage:
//   pak_tool list <archive.pak>
//   pak_tool extract <archive.pak> --output <dir> [--manifest <file.xml>]
//   pak_tool pack <manifest.xml> <dir> --output <archive.pak> [--level <0-9>] [--store]
//
// Options:
//   --output, -o <path>   Output directory (extract) or archive (pack).
//   --manifest, -m <file> Also export the index manifest (extract).
//   --level <n>           Compression level for pack (default 9).
//   --store               Store payloads without compression (pack).
//   --verbose, -v         Debug logging.
//   --quiet, -q           Errors only.
//   --help, -h            Show this help message.

#include "pak_tool_args.hpp"

#include "core/error.hpp"
#include "core/log.hpp"
#include "vfs/archive_reader.hpp"
#include "vfs/archive_writer.hpp"
#include "vfs/directory_tree.hpp"
#include "vfs/manifest.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;
using namespace debopak;
using namespace debopak::vfs;
using pak_tool::Options;

namespace {

// Archive names are untrusted; refuse anything that could leave the
// output directory.
fs::path safe_relative_path(const std::string& archivePath) {
    fs::path out;
    std::size_t start = 0;
    while (start <= archivePath.size()) {
        const auto slash = archivePath.find('/', start);
        const std::string part = archivePath.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (part.empty() || part == "." || part == ".." || part.find('\\') != std::string::npos ||
            part.find(':') != std::string::npos) {
            throw PakError(ErrorKind::InvalidName, "unsafe entry path", std::nullopt, archivePath);
        }
        out /= part;
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return out;
}

void write_file(const fs::path& path, const Bytes& data) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        throw PakError(ErrorKind::IoError, "cannot create file", std::nullopt, path.string());
    }
    ofs.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
        throw PakError(ErrorKind::IoError, "cannot write file", std::nullopt, path.string());
    }
}

Bytes read_file(const fs::path& path) {
    std::ifstream src(path, std::ios::binary | std::ios::ate);
    if (!src) {
        throw PakError(ErrorKind::IoError, "cannot open source file", std::nullopt, path.string());
    }

    const auto size = static_cast<std::size_t>(src.tellg());
    src.seekg(0, std::ios::beg);

    Bytes data(size);
    if (size > 0 && !src.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
        throw PakError(ErrorKind::IoError, "cannot read source file", std::nullopt, path.string());
    }
    return data;
}

int run_list(const Options& opts) {
    ArchiveReader reader = open_archive(opts.positional[0]);
    const ArchiveHeader& h = reader.header();

    std::printf("Header offset: 0x%X\n", h.headerOffset);
    std::printf("Version: 0x%08X\n", h.version);
    std::printf("Index: off=0x%llX, compressed=%u, uncompressed=%u\n",
                static_cast<unsigned long long>(h.indexOffset), h.indexCompressed, h.indexUncompressed);
    std::printf("Data section starts at 0x%llX\n", static_cast<unsigned long long>(h.dataOffset));

    std::size_t files = 0;
    std::size_t dirs = 0;
    for (const FlatEntry& item : walk_tree(reader.tree())) {
        const Entry& e = *item.entry;
        if (e.is_directory()) {
            ++dirs;
            std::printf("[DIR]  %s/  (%zu children)\n", item.path.c_str(), e.children().size());
        } else {
            ++files;
            const FileData& f = e.file();
            std::printf("[FILE] %s  off=0x%llX  stored=%llu  size=%llu\n", item.path.c_str(),
                        static_cast<unsigned long long>(f.offset),
                        static_cast<unsigned long long>(f.storedSize),
                        static_cast<unsigned long long>(f.size));
        }
    }

    std::printf("Entries: %zu files, %zu directories\n", files, dirs);
    return 0;
}

int run_extract(const Options& opts) {
    ArchiveReader reader = open_archive(opts.positional[0]);

    if (!opts.manifest.empty()) {
        save_manifest(opts.manifest, reader.header(), reader.tree());
        logf(LogLevel::Info, "cli", "index manifest written: %s", opts.manifest.string().c_str());
    }

    std::error_code ec;
    fs::create_directories(opts.output, ec);
    if (ec) {
        throw PakError(ErrorKind::IoError, "cannot create output directory: " + ec.message(),
                       std::nullopt, opts.output.string());
    }

    std::size_t extracted = 0;
    for (const FlatEntry& item : walk_tree(reader.tree())) {
        if (item.path.empty()) {
            continue;  // root
        }

        const fs::path target = opts.output / safe_relative_path(item.path);
        if (item.entry->is_directory()) {
            fs::create_directories(target, ec);
            if (ec) {
                throw PakError(ErrorKind::IoError, "cannot create directory: " + ec.message(),
                               std::nullopt, target.string());
            }
            continue;
        }

        write_file(target, reader.read_payload(*item.entry));
        ++extracted;
        logf(LogLevel::Debug, "cli", "extracted %s", item.path.c_str());
    }

    logf(LogLevel::Info, "cli", "extracted %zu files to %s", extracted, opts.output.string().c_str());
    return 0;
}

int run_pack(const Options& opts) {
    const Manifest manifest = load_manifest(opts.positional[0]);
    const fs::path sourceDir = opts.positional[1];

    std::unordered_map<const Entry*, fs::path> sources;
    for (const FlatEntry& item : walk_tree(manifest.root)) {
        if (item.entry->is_file()) {
            sources.emplace(item.entry, sourceDir / safe_relative_path(item.path));
        }
    }

    WriterOptions writerOpts;
    writerOpts.compressionLevel = opts.level;
    writerOpts.compressPayloads = !opts.store;
    writerOpts.header = manifest.header;

    fs::path outputDir = opts.output.parent_path();
    std::error_code ec;
    if (!outputDir.empty() && !fs::exists(outputDir, ec)) {
        fs::create_directories(outputDir, ec);
        if (ec) {
            throw PakError(ErrorKind::IoError, "cannot create output directory: " + ec.message(),
                           std::nullopt, outputDir.string());
        }
    }

    write_archive(opts.output, manifest.root,
                  [&sources](const Entry& entry) { return read_file(sources.at(&entry)); },
                  writerOpts);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!pak_tool::parse_args(argc, argv, opts)) {
        return 1;
    }

    LogConfig logCfg;
    if (opts.verbose) {
        logCfg.minLevel = LogLevel::Debug;
        logCfg.index = true;
    }
    if (opts.quiet) {
        logCfg.minLevel = LogLevel::Error;
    }
    set_log_config(logCfg);

    try {
        if (opts.command == "list") {
            return run_list(opts);
        }
        if (opts.command == "extract") {
            return run_extract(opts);
        }
        return run_pack(opts);
    } catch (const PakError& e) {
        std::string where;
        if (e.offset()) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), " at offset 0x%llX", static_cast<unsigned long long>(*e.offset()));
            where += buf;
        }
        if (!e.path().empty()) {
            where += " (" + e.path() + ")";
        }
        logf(LogLevel::Error, "cli", "%s%s: %s", to_string(e.kind()), where.c_str(), e.what());
        return 1;
    } catch (const std::exception& e) {
        logf(LogLevel::Error, "cli", "%s", e.what());
        return 1;
    }
}
