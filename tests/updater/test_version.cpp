#include <catch2/catch_test_macros.hpp>
#include "updater/Version.hpp"

#include <limits>

using namespace updater;

TEST_CASE("isNewer - Compares release codes only", "[updater][version]")
{
    SECTION("Higher manifest code is newer")
    {
        REQUIRE(isNewer(10, 9));
        REQUIRE(isNewer(1, 0));
    }

    SECTION("Equal code is not newer")
    {
        REQUIRE_FALSE(isNewer(9, 9));
        REQUIRE_FALSE(isNewer(0, 0));
    }

    SECTION("Lower code is not newer")
    {
        REQUIRE_FALSE(isNewer(8, 9));
        REQUIRE_FALSE(isNewer(0, 100));
    }

    SECTION("Holds across a range of pairs")
    {
        for (std::int64_t manifest = -3; manifest <= 3; ++manifest)
        {
            for (std::int64_t current = -3; current <= 3; ++current)
            {
                REQUIRE(isNewer(manifest, current) == (manifest > current));
            }
        }
    }

    SECTION("Handles large codes")
    {
        constexpr auto max = std::numeric_limits<std::int64_t>::max();
        REQUIRE(isNewer(max, max - 1));
        REQUIRE_FALSE(isNewer(max - 1, max));
    }
}

TEST_CASE("isBroadcastVisible - Hides broadcasts for newer releases", "[updater][version]")
{
    VersionDescriptor current("1.0.0", 9);

    SECTION("Untargeted broadcast is visible")
    {
        REQUIRE(isBroadcastVisible(std::nullopt, current));
    }

    SECTION("Broadcast for the running or an older release is visible")
    {
        REQUIRE(isBroadcastVisible(9, current));
        REQUIRE(isBroadcastVisible(3, current));
    }

    SECTION("Broadcast for a newer release is hidden")
    {
        REQUIRE_FALSE(isBroadcastVisible(10, current));
    }
}

TEST_CASE("currentBuildVersion - Reports the baked-in version", "[updater][version]")
{
    auto version = currentBuildVersion();
    REQUIRE_FALSE(version.name.empty());
    REQUIRE(version.code >= 0);
}

TEST_CASE("ErrorKindToString - Names every kind", "[updater][version]")
{
    REQUIRE(std::string(ErrorKindToString(UpdateErrorKind::None)) == "None");
    REQUIRE(std::string(ErrorKindToString(UpdateErrorKind::HttpStatus)) == "HttpStatus");
    REQUIRE(std::string(ErrorKindToString(UpdateErrorKind::ConversionFailed)) == "ConversionFailed");
    REQUIRE(std::string(ErrorKindToString(UpdateErrorKind::Installer)) == "Installer");
}
