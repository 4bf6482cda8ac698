#include "gwskynet/core/utils.hpp"
#include "gwskynet/core/errors.hpp"
#include "gwskynet/core/types.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using namespace gwskynet;

TEST_CASE("trim_strips_whitespace_and_fits_quotes") {
    REQUIRE(core::trim("  'H1,L1'  ") == "H1,L1");
    REQUIRE(core::trim("   ") == "");
    REQUIRE(core::trim("NESTED") == "NESTED");
}

TEST_CASE("split_and_join_are_inverse_for_simple_lists") {
    auto parts = core::split("H1,L1,V1", ',');
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[1] == "L1");
    REQUIRE(core::join(parts, ",") == "H1,L1,V1");
}

TEST_CASE("sha256_of_files_is_known_digest") {
    fs::path dir = fs::temp_directory_path() / "gwskynet_tests";
    fs::create_directories(dir);

    core::write_text(dir / "empty.bin", "");
    REQUIRE(core::sha256_file(dir / "empty.bin") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    core::write_text(dir / "abc.bin", "abc");
    REQUIRE(core::sha256_file(dir / "abc.bin") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    REQUIRE_THROWS_AS(core::sha256_file(dir / "no_such_file.bin"), IOError);
}

TEST_CASE("detector_names_parse_case_insensitively") {
    Detector d = Detector::H1;
    REQUIRE(string_to_detector("l1", d));
    REQUIRE(d == Detector::L1);
    REQUIRE(string_to_detector("V1", d));
    REQUIRE(d == Detector::V1);
    REQUIRE_FALSE(string_to_detector("K1", d));
}

TEST_CASE("channel_array_is_indexed_by_kind") {
    ChannelArray<int> a;
    a[ChannelKind::DISTSIGMA] = 7;
    REQUIRE(a[ChannelKind::DISTSIGMA] == 7);
    REQUIRE(a[ChannelKind::SKYMAP] == 0);
    REQUIRE(channel_index(ChannelKind::DISTNORM) == 3);
}
