#include <catch2/catch_test_macros.hpp>
#include "utils/Base64.hpp"

using namespace utils;

TEST_CASE("Base64 - Encoding", "[utils][base64]")
{
    SECTION("Known vectors")
    {
        REQUIRE(Base64Encode("") == "");
        REQUIRE(Base64Encode("f") == "Zg==");
        REQUIRE(Base64Encode("fo") == "Zm8=");
        REQUIRE(Base64Encode("foo") == "Zm9v");
        REQUIRE(Base64Encode("foob") == "Zm9vYg==");
        REQUIRE(Base64Encode("fooba") == "Zm9vYmE=");
        REQUIRE(Base64Encode("foobar") == "Zm9vYmFy");
    }

    SECTION("Binary bytes")
    {
        const std::string bytes("\x00\xff\xfe", 3);
        REQUIRE(Base64Encode(bytes) == "AP/+");
    }
}

TEST_CASE("Base64 - Decoding", "[utils][base64]")
{
    std::string out;

    SECTION("Known vectors")
    {
        REQUIRE(Base64Decode("Zm9vYmFy", out));
        REQUIRE(out == "foobar");
        REQUIRE(Base64Decode("Zm9vYg==", out));
        REQUIRE(out == "foob");
        REQUIRE(Base64Decode("AP/+", out));
        REQUIRE(out == std::string("\x00\xff\xfe", 3));
    }

    SECTION("Restores every byte value")
    {
        std::string all;
        for (int i = 0; i < 256; ++i)
            all.push_back(static_cast<char>(i));
        REQUIRE(Base64Decode(Base64Encode(all), out));
        REQUIRE(out == all);
    }

    SECTION("Rejects malformed input")
    {
        REQUIRE_FALSE(Base64Decode("Zm9", out));
        REQUIRE_FALSE(Base64Decode("Zm9v!mFy", out));
        REQUIRE_FALSE(Base64Decode("Z=9v", out));
        REQUIRE_FALSE(Base64Decode("Zg==Zm9v", out));
        REQUIRE_FALSE(Base64Decode("Zm9v\n", out));
    }
}
