//=============================================================================
// Archive Unit Tests
//
// Covers: gzip + ustar extraction, long names, rejected entries, truncation
//=============================================================================

#include <boost/ut.hpp>
#include <mdtypst/archive.h>
#include "harness/archive-builder.h"
#include "harness/scratch-dir.h"

using namespace boost::ut;
using namespace mdtypst;
using mdtypst::test::ArchiveBuilder;
using mdtypst::test::ScratchDir;

suite archive_tests = [] {
    "extracts files and directories"_test = [] {
        ScratchDir dir;
        auto gz = ArchiveBuilder()
                      .directory("src/")
                      .file("typst.toml", "[package]\nname = \"demo\"\n")
                      .file("src/lib.typ", "#let f(x) = x\n")
                      .file("empty.txt", "")
                      .tarGz();
        auto res = extractTarGz(gz, dir.path());
        expect(res.has_value()) << error_msg(res);
        expect(ScratchDir::read(dir.path() / "typst.toml") == "[package]\nname = \"demo\"\n");
        expect(ScratchDir::read(dir.path() / "src/lib.typ") == "#let f(x) = x\n");
        expect(std::filesystem::exists(dir.path() / "empty.txt"));
    };

    "large files cross block and chunk boundaries"_test = [] {
        ScratchDir dir;
        std::string big(200000, 'a');
        for (size_t i = 0; i < big.size(); i += 7) big[i] = static_cast<char>('a' + i % 26);
        auto res = extractTarGz(ArchiveBuilder().file("big.bin", big).tarGz(), dir.path());
        expect(res.has_value()) << error_msg(res);
        expect(ScratchDir::read(dir.path() / "big.bin") == big);
    };

    "pax and GNU long names"_test = [] {
        ScratchDir dir;
        std::string longPath = std::string(120, 'd') + "/file.typ";
        std::string gnuPath = std::string(110, 'g') + ".typ";
        auto gz = ArchiveBuilder()
                      .paxPath(longPath)
                      .file("short-pax", "pax")
                      .gnuLongName(gnuPath)
                      .file("short-gnu", "gnu")
                      .tarGz();
        auto res = extractTarGz(gz, dir.path());
        expect(res.has_value()) << error_msg(res);
        expect(ScratchDir::read(dir.path() / longPath) == "pax");
        expect(ScratchDir::read(dir.path() / gnuPath) == "gnu");
        expect(!std::filesystem::exists(dir.path() / "short-pax"));
    };

    "entries escaping the target are rejected"_test = [] {
        ScratchDir dir;
        expect(!extractTarGz(ArchiveBuilder().file("../evil.typ", "x").tarGz(), dir.path()).has_value());
        expect(!extractTarGz(ArchiveBuilder().file("/etc/evil", "x").tarGz(), dir.path()).has_value());
        expect(!extractTarGz(ArchiveBuilder().file("a/../../evil", "x").tarGz(), dir.path()).has_value());
        expect(!std::filesystem::exists(dir.path().parent_path() / "evil.typ"));
    };

    "links are rejected"_test = [] {
        ScratchDir dir;
        auto res = extractTarGz(ArchiveBuilder().entry("link", "", '2').tarGz(), dir.path());
        expect(!res.has_value());
    };

    "corrupt input is an error"_test = [] {
        ScratchDir dir;
        expect(!extractTarGz("definitely not gzip", dir.path()).has_value());

        auto gz = ArchiveBuilder().file("a.typ", std::string(5000, 'x')).tarGz();
        expect(!extractTarGz(gz.substr(0, gz.size() / 2), dir.path()).has_value());

        // valid gzip around an empty tar
        expect(!extractTarGz(ArchiveBuilder::gzip(std::string(1024, '\0')), dir.path()).has_value());
    };

    "checksum mismatch is detected"_test = [] {
        ScratchDir dir;
        std::string tar = ArchiveBuilder().file("a.typ", "x").tar();
        tar[0] = 'b';
        expect(!extractTarGz(ArchiveBuilder::gzip(tar), dir.path()).has_value());
    };
};
