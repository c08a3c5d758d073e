/**
 * @file test_manifest.cpp
 * @brief Tests for the XML index manifest.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/test_utils.hpp"
#include "vfs/manifest.hpp"

#include <string>

using namespace debopak;
using namespace debopak::vfs;
using test_helpers::pak_error_kind;

namespace {

// root{ d{ d{ ... } } } with `levels` directories below the root.
Entry nested_dirs(std::size_t levels) {
    Entry inner = Entry::make_directory("d");
    for (std::size_t i = 1; i < levels; ++i) {
        Entry outer = Entry::make_directory("d");
        outer.add_child(std::move(inner));
        inner = std::move(outer);
    }
    Entry root = Entry::make_directory("");
    root.add_child(std::move(inner));
    return root;
}

std::string wrap(const std::string& body) {
    return "<PakManifest format=\"1\"><Header version=\"0x00060010\"/>" + body + "</PakManifest>";
}

} // namespace

TEST_CASE("Manifests keep the tree and its metadata", "[vfs][manifest]") {
    const Entry root = test_helpers::make_sample_tree();
    ArchiveHeader header;
    header.unknown1 = 0xCAFEBABE;
    header.unknown2 = 3;

    const std::string xml = manifest_to_string(header, root);
    REQUIRE(xml.find("<PakManifest") != std::string::npos);

    const Manifest parsed = parse_manifest(xml);
    REQUIRE(parsed.root == root);
    REQUIRE(parsed.header.version == PAK_VERSION);
    REQUIRE(parsed.header.unknown1 == 0xCAFEBABE);
    REQUIRE(parsed.header.unknown2 == 3);
    REQUIRE(parsed.root.children()[2].name() == "b.bin");
}

TEST_CASE("Manifests round-trip through a file", "[vfs][manifest]") {
    test_helpers::TempDir dir;
    const auto path = dir.path() / "index.xml";

    Entry root = Entry::make_directory("");
    root.add_child(Entry::make_file("\xE3\x83\x86\xE3\x82\xB9\xE3\x83\x88.scb", 5));
    root.add_child(Entry::make_file("a & <b>.txt", 1));

    save_manifest(path, ArchiveHeader{}, root);
    const Manifest loaded = load_manifest(path);
    REQUIRE(loaded.root == root);
}

TEST_CASE("Malformed manifests are rejected", "[vfs][manifest]") {
    SECTION("not XML") {
        REQUIRE(pak_error_kind([] { (void)parse_manifest("<PakManifest"); }) == ErrorKind::ManifestError);
    }

    SECTION("wrong root element") {
        REQUIRE(pak_error_kind([] { (void)parse_manifest("<Other/>"); }) == ErrorKind::ManifestError);
    }

    SECTION("no root directory") {
        REQUIRE(pak_error_kind([] { (void)parse_manifest(wrap("")); }) == ErrorKind::ManifestError);
    }

    SECTION("two root directories") {
        REQUIRE(pak_error_kind([] { (void)parse_manifest(wrap("<Dir name=\"\"/><Dir name=\"x\"/>")); }) ==
                ErrorKind::ManifestError);
    }

    SECTION("unknown element") {
        REQUIRE(pak_error_kind([] { (void)parse_manifest(wrap("<Dir name=\"\"><Link name=\"x\"/></Dir>")); }) ==
                ErrorKind::ManifestError);
    }

    SECTION("missing name") {
        REQUIRE(pak_error_kind([] { (void)parse_manifest(wrap("<Dir name=\"\"><File/></Dir>")); }) ==
                ErrorKind::ManifestError);
    }

    SECTION("bad timestamp") {
        REQUIRE(pak_error_kind([] { (void)parse_manifest(wrap("<Dir name=\"\" time=\"00zz\"/>")); }) ==
                ErrorKind::ManifestError);
        const std::string notHex(48, 'g');
        REQUIRE(pak_error_kind([&] { (void)parse_manifest(wrap("<Dir name=\"\" time=\"" + notHex + "\"/>")); }) ==
                ErrorKind::ManifestError);
    }

    SECTION("bad attributes") {
        REQUIRE(pak_error_kind([] { (void)parse_manifest(wrap("<Dir name=\"\" attributes=\"lots\"/>")); }) ==
                ErrorKind::ManifestError);
    }

    SECTION("negative numbers") {
        REQUIRE(pak_error_kind([] {
                    (void)parse_manifest(wrap("<Dir name=\"\"><File name=\"f\" size=\"-1\"/></Dir>"));
                }) == ErrorKind::ManifestError);
        REQUIRE(pak_error_kind([] { (void)parse_manifest(wrap("<Dir name=\"\" attributes=\"-16\"/>")); }) ==
                ErrorKind::ManifestError);
    }

    SECTION("file with children") {
        REQUIRE(pak_error_kind([] {
                    (void)parse_manifest(wrap("<Dir name=\"\"><File name=\"f\"><File name=\"g\"/></File></Dir>"));
                }) == ErrorKind::ManifestError);
    }

    SECTION("duplicate siblings") {
        REQUIRE(pak_error_kind([] {
                    (void)parse_manifest(wrap("<Dir name=\"\"><File name=\"f\"/><File name=\"f\"/></Dir>"));
                }) == ErrorKind::InvalidName);
    }
}

TEST_CASE("Manifest nesting is bounded", "[vfs][manifest]") {
    SECTION("moderately deep trees round-trip") {
        const Entry root = nested_dirs(100);
        REQUIRE(parse_manifest(manifest_to_string(ArchiveHeader{}, root)).root == root);
    }

    SECTION("trees too deep to load back are refused when saving") {
        const Entry root = nested_dirs(400);
        REQUIRE(pak_error_kind([&] { (void)manifest_to_string(ArchiveHeader{}, root); }) ==
                ErrorKind::ManifestError);

        test_helpers::TempDir dir;
        const auto path = dir.path() / "deep.xml";
        REQUIRE(pak_error_kind([&] { save_manifest(path, ArchiveHeader{}, root); }) == ErrorKind::ManifestError);
        REQUIRE_FALSE(test_helpers::fs::exists(path));
    }
}

TEST_CASE("load_manifest reports the file path", "[vfs][manifest]") {
    test_helpers::TempDir dir;
    const auto path = dir.path() / "broken.xml";
    test_helpers::write_file_bytes(path, test_helpers::to_bytes("<Other/>"));

    try {
        (void)load_manifest(path);
        FAIL("expected PakError");
    } catch (const PakError& e) {
        REQUIRE(e.kind() == ErrorKind::ManifestError);
        REQUIRE(e.path() == path.string());
    }

    REQUIRE(pak_error_kind([&] { (void)load_manifest(dir.path() / "missing.xml"); }) == ErrorKind::IoError);
}
