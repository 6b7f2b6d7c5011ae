#include <catch2/catch.hpp>
#include <pm/metadata.h>

TEST_CASE("metadata files support # and // comment lines") {
    using namespace pm;

    SECTION("hash comment") {
        std::string s = "# leading comment\ncollection: ARCADE\n";
        auto c = parse_metadata(s);
        REQUIRE(c.header.collection == "ARCADE");
    }

    SECTION("double slash comment") {
        std::string s = "collection: ARCADE\n// section\ngame: Metal Slug\nfile: mslug.zip\n";
        auto c = parse_metadata(s);
        REQUIRE(c.games.size() == 1);
        REQUIRE(c.games[0].title == "Metal Slug");
    }

    SECTION("comment between block lines does not end the block") {
        std::string s = "collection: ARCADE\n"
                        "ignore-files:\n"
                        "  neogeo.zip\n"
                        "# bios\n"
                        "  pgm.zip\n";
        auto c = parse_metadata(s);
        REQUIRE(c.header.ignoreFiles == std::vector<std::string>{"neogeo.zip", "pgm.zip"});
    }

    SECTION("indented hash is block content") {
        std::string s = "collection: ARCADE\n"
                        "launch:\n"
                        "  fbneo\n"
                        "  # not a comment\n";
        auto c = parse_metadata(s);
        REQUIRE(c.header.launchBlock.has_value());
        REQUIRE(*c.header.launchBlock == "fbneo\n# not a comment");
    }

    SECTION("comments are not written back") {
        std::string s = "# generated\ncollection: ARCADE\n";
        auto out = dump_metadata(parse_metadata(s));
        REQUIRE(out.find('#') == std::string::npos);
    }
}
