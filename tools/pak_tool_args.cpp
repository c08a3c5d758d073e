#include "pak_tool_args.hpp"

#include <cerrno>
#include <cstdlib>
#include <iostream>

#ifndef DEBOPAK_VERSION
#define DEBOPAK_VERSION "0.0.0-dev"
#endif

namespace pak_tool {

namespace {

// Whole-string decimal parse; false on junk, overflow or an empty string.
bool parse_int(const char* text, long& out) {
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) {
        return false;
    }
    out = v;
    return true;
}

} // namespace

void print_usage(const char* program) {
    std::cerr << "pak_tool v" << DEBOPAK_VERSION << "\n"
              << "Usage:\n"
              << "  " << program << " list <archive.pak>\n"
              << "  " << program << " extract <archive.pak> --output <dir> [--manifest <file.xml>]\n"
              << "  " << program << " pack <manifest.xml> <dir> --output <archive.pak> [--level <0-9>] [--store]\n"
              << "\n"
              << "Options:\n"
              << "  --output, -o <path>   Output directory (extract) or archive (pack).\n"
              << "  --manifest, -m <file> Also export the index manifest (extract).\n"
              << "  --level <n>           Compression level for pack (default 9).\n"
              << "  --store               Store payloads without compression (pack).\n"
              << "  --verbose, -v         Debug logging.\n"
              << "  --quiet, -q           Errors only.\n"
              << "  --help, -h            Show this help message.\n";
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "--output" || arg == "-o") {
            if (++i >= argc) {
                std::cerr << "Error: --output requires a path.\n";
                return false;
            }
            opts.output = argv[i];
        } else if (arg == "--manifest" || arg == "-m") {
            if (++i >= argc) {
                std::cerr << "Error: --manifest requires a file path.\n";
                return false;
            }
            opts.manifest = argv[i];
        } else if (arg == "--level") {
            if (++i >= argc) {
                std::cerr << "Error: --level requires a number.\n";
                return false;
            }
            long level = 0;
            if (!parse_int(argv[i], level) || level < 0 || level > 9) {
                std::cerr << "Error: --level must be a number between 0 and 9.\n";
                return false;
            }
            opts.level = static_cast<int>(level);
        } else if (arg == "--store") {
            opts.store = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return false;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.positional.push_back(arg);
        }
    }

    if (opts.command == "list" || opts.command == "extract") {
        if (opts.positional.size() != 1) {
            std::cerr << "Error: " << opts.command << " takes exactly one archive path.\n";
            return false;
        }
        if (opts.command == "extract" && opts.output.empty()) {
            std::cerr << "Error: --output is required.\n";
            return false;
        }
    } else if (opts.command == "pack") {
        if (opts.positional.size() != 2) {
            std::cerr << "Error: pack takes a manifest and a source directory.\n";
            return false;
        }
        if (opts.output.empty()) {
            std::cerr << "Error: --output is required.\n";
            return false;
        }
    } else {
        std::cerr << "Error: Unknown command: " << opts.command << "\n";
        print_usage(argv[0]);
        return false;
    }

    return true;
}

} // namespace pak_tool
