#include <catch2/catch_test_macros.hpp>
#include "updater/ManifestParser.hpp"

using namespace updater;

TEST_CASE("ManifestParser - Valid manifests", "[updater][manifest]")
{
    ManifestParser parser;
    UpdateInfo info;
    std::string error;

    SECTION("Parses every field")
    {
        const std::string json = R"({
            "version": "1.2.0",
            "versionCode": 12,
            "downloadUrl": "https://example.com/app-1.2.0.bin",
            "changelog": "New features",
            "mandatory": true,
            "releaseDate": "2026-09-30",
            "minVersion": "1.0.0"
        })";

        REQUIRE(parser.parse(json, info, error));
        REQUIRE(info.version == "1.2.0");
        REQUIRE(info.versionCode == 12);
        REQUIRE(info.downloadUrl == "https://example.com/app-1.2.0.bin");
        REQUIRE(info.changelog == "New features");
        REQUIRE(info.mandatory);
        REQUIRE(info.releaseDate == "2026-09-30");
        REQUIRE(info.minVersion.has_value());
        REQUIRE(*info.minVersion == "1.0.0");
    }

    SECTION("Optional fields default when absent")
    {
        REQUIRE(parser.parse(R"({"versionCode": 10, "downloadUrl": "https://example/app.bin"})", info, error));
        REQUIRE(info.versionCode == 10);
        REQUIRE_FALSE(info.mandatory);
        REQUIRE(info.changelog.empty());
        REQUIRE_FALSE(info.minVersion.has_value());
    }

    SECTION("Accepts a numeric string version code")
    {
        REQUIRE(parser.parse(R"({"versionCode": "42", "downloadUrl": "http://example/app.bin"})", info, error));
        REQUIRE(info.versionCode == 42);
    }

    SECTION("Ignores unknown fields")
    {
        REQUIRE(parser.parse(R"({"versionCode": 3, "downloadUrl": "https://e/a", "extra": [1, 2]})", info, error));
        REQUIRE(info.versionCode == 3);
    }
}

TEST_CASE("ManifestParser - Malformed manifests", "[updater][manifest]")
{
    ManifestParser parser;
    UpdateInfo info;
    info.version = "untouched";
    std::string error;

    SECTION("Rejects invalid JSON")
    {
        REQUIRE_FALSE(parser.parse("{not json", info, error));
        REQUIRE(error.find("JSON parse error") != std::string::npos);
    }

    SECTION("Rejects a non-object document")
    {
        REQUIRE_FALSE(parser.parse("[1, 2, 3]", info, error));
        REQUIRE(error == "Manifest is not a JSON object");
    }

    SECTION("Rejects a missing version code")
    {
        REQUIRE_FALSE(parser.parse(R"({"downloadUrl": "https://e/a"})", info, error));
        REQUIRE(error.find("versionCode") != std::string::npos);
    }

    SECTION("Rejects a non-integer version code")
    {
        REQUIRE_FALSE(parser.parse(R"({"versionCode": "ten", "downloadUrl": "https://e/a"})", info, error));
        REQUIRE_FALSE(parser.parse(R"({"versionCode": 1.5, "downloadUrl": "https://e/a"})", info, error));
        REQUIRE_FALSE(parser.parse(R"({"versionCode": "12abc", "downloadUrl": "https://e/a"})", info, error));
    }

    SECTION("Rejects a negative version code")
    {
        REQUIRE_FALSE(parser.parse(R"({"versionCode": -1, "downloadUrl": "https://e/a"})", info, error));
    }

    SECTION("Rejects a missing or relative download URL")
    {
        REQUIRE_FALSE(parser.parse(R"({"versionCode": 10})", info, error));
        REQUIRE_FALSE(parser.parse(R"({"versionCode": 10, "downloadUrl": ""})", info, error));
        REQUIRE_FALSE(parser.parse(R"({"versionCode": 10, "downloadUrl": "/app.bin"})", info, error));
        REQUIRE_FALSE(parser.parse(R"({"versionCode": 10, "downloadUrl": "ftp://e/a"})", info, error));
    }

    SECTION("Rejects wrongly typed optional fields")
    {
        REQUIRE_FALSE(parser.parse(R"({"versionCode": 10, "downloadUrl": "https://e/a", "mandatory": "yes"})",
                                   info, error));
        REQUIRE(error.find("mandatory") != std::string::npos);
        REQUIRE_FALSE(parser.parse(R"({"versionCode": 10, "downloadUrl": "https://e/a", "changelog": 5})", info,
                                   error));
    }

    SECTION("Leaves the output untouched on failure")
    {
        REQUIRE_FALSE(parser.parse(R"({"versionCode": 10})", info, error));
        REQUIRE(info.version == "untouched");
    }
}
