#include <catch2/catch.hpp>
#include <pm/path_segments.h>

using namespace pm;

TEST_CASE("split_path accepts both separators", "[paths]") {
    REQUIRE(split_path("009/Final Fantasy VII (Disc 1).chd") ==
            PathSegments{"009", "Final Fantasy VII (Disc 1).chd"});
    REQUIRE(split_path("009\\disc1.chd") == PathSegments{"009", "disc1.chd"});
    REQUIRE(split_path("./009//disc1.chd") == PathSegments{"009", "disc1.chd"});
    REQUIRE(split_path("").empty());
}

TEST_CASE("join_path uses forward slashes", "[paths]") {
    REQUIRE(join_path({"media", "009", "cover.png"}) == "media/009/cover.png");
    REQUIRE(join_path({}).empty());
}

TEST_CASE("leading_directory needs a directory component", "[paths]") {
    REQUIRE(leading_directory("009/disc1.chd") == std::optional<std::string>("009"));
    REQUIRE(leading_directory("a\\b\\c.chd") == std::optional<std::string>("a"));
    REQUIRE_FALSE(leading_directory("disc1.chd").has_value());
}

TEST_CASE("file_name returns the last segment", "[paths]") {
    REQUIRE(file_name("media/009/cover.png") == "cover.png");
    REQUIRE(file_name("cover.png") == "cover.png");
    REQUIRE(file_name("").empty());
}

TEST_CASE("default assets follow the media/<title> convention", "[paths][assets]") {
    auto assets = default_assets("Shenmue");
    REQUIRE(assets.size() == 3);
    REQUIRE(assets.at("box_front") == "media/Shenmue/boxfront.png");
    REQUIRE(assets.at("logo") == "media/Shenmue/logo.png");
    REQUIRE(assets.at("video") == "media/Shenmue/video.mp4");
}

TEST_CASE("rebase_asset_path keeps root and file name", "[paths][assets]") {
    REQUIRE(rebase_asset_path("media/Final Fantasy VII/boxfront.png", "009") == "media/009/boxfront.png");
    REQUIRE(rebase_asset_path("media/009/cover.png", "009") == "media/009/cover.png");
    REQUIRE(rebase_asset_path("art\\old\\deep\\logo.png", "010") == "art/010/logo.png");
    REQUIRE(rebase_asset_path("cover.png", "009") == "media/009/cover.png");
    REQUIRE(rebase_asset_path("", "009").empty());
}
