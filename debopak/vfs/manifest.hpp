#pragma once

#include "entry.hpp"
#include "pak_format.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace debopak::vfs {

// Index manifest: the tree, per-entry metadata (attributes, timestamp) and
// the opaque header fields, kept next to an extracted directory so it can
// be packed again in the original order.
//
// <PakManifest format="1">
//   <Header version="0x00060010" unknown1="0" unknown2="0"/>
//   <Dir name="" attributes="16" time="00...">
//     <File name="a.bin" attributes="32" time="00..." size="4"/>
//   </Dir>
// </PakManifest>
//
// File sizes are informational; the writer recomputes them from the payload.
struct Manifest {
    ArchiveHeader header;
    Entry root;
};

// Throws ManifestError when the tree nests 400 or more levels below the root.
std::string manifest_to_string(const ArchiveHeader& header, const Entry& root);

// Throws ManifestError for malformed documents and InvalidName for
// duplicate sibling names.
Manifest parse_manifest(std::string_view xml);

void save_manifest(const std::filesystem::path& path, const ArchiveHeader& header, const Entry& root);
Manifest load_manifest(const std::filesystem::path& path);

} // namespace debopak::vfs
