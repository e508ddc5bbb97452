//=============================================================================
// PackageKey Unit Tests
//=============================================================================

#include <boost/ut.hpp>
#include <mdtypst/package-key.h>

using namespace boost::ut;
using namespace mdtypst;

suite package_key_tests = [] {
    "parses a full reference"_test = [] {
        auto key = PackageKey::parse("@preview/cetz:0.2.2");
        expect(key.has_value()) << error_msg(key);
        expect(key->ns == "preview");
        expect(key->name == "cetz");
        expect(key->version == "0.2.2");
        expect(key->toString() == "@preview/cetz:0.2.2");
        expect(key->subdir() == std::filesystem::path("preview/cetz/0.2.2"));
    };

    "rejects malformed references"_test = [] {
        for (const char* bad : {"preview/cetz:0.2.2", "@cetz:0.2.2", "@preview/cetz",
                                "@preview/cetz:0.2", "@preview/cetz:0.2.x", "@pre view/cetz:1.0.0",
                                "@preview/../x:1.0.0", "@1abc/x:1.0.0", "@preview/cetz:1..0"}) {
            expect(!PackageKey::parse(bad).has_value()) << bad;
        }
    };

    "finds distinct references in order"_test = [] {
        auto keys = findPackageReferences(
            "#import \"@preview/cetz:0.2.2\": canvas\n"
            "#import \"@local/mine:1.0.0\"\n"
            "#import \"@preview/cetz:0.2.2\": draw\n"
            "// \"not a package\" and @preview/bare:1.0.0 without quotes\n");
        expect(keys.size() == 2_u);
        expect(keys[0].toString() == "@preview/cetz:0.2.2");
        expect(keys[1].toString() == "@local/mine:1.0.0");
    };

    "keys hash by value"_test = [] {
        auto a = PackageKey::parse("@preview/a:1.0.0");
        auto b = PackageKey::parse("@preview/a:1.0.0");
        expect(*a == *b);
        expect(PackageKeyHash{}(*a) == PackageKeyHash{}(*b));
        expect(*a != *PackageKey::parse("@preview/a:1.0.1"));
    };
};
