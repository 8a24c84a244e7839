#include <catch2/catch_test_macros.hpp>

#include <nrp/errors.hpp>
#include <nrp/manifest/serializer.hpp>

#include <nrp/version.hpp>

#include "test_util.hpp"

namespace
{
Manifest MakeManifest()
{
    Manifest manifest{};
    manifest.m_Collections = { Collection{ "english", "English" } };
    manifest.m_Cards = {
        Card{
            .m_Id{ "sure_gamble" },
            .m_Group{ "english" },
            .m_Title{ MakeTitle("Sure Gamble") },
            .m_Faces{},
            .m_Variants{},
            .m_Printings{
                Printing{ 30001, "System Gateway" },
                Printing{ 1050, "Core Set" },
            },
        },
        Card{
            .m_Id{ "hoshiko_shiro_untold_protagonist" },
            .m_Group{ "english" },
            .m_Title{ MakeTitle("Hoshiko Shiro: Untold Protagonist") },
            .m_Faces{ MakeTitle("Hoshiko Shiro: Mahou Shoujo") },
            .m_Variants{},
            .m_Printings{
                Printing{ 33004, "Midnight Sun (face 2/2)", 2u },
                Printing{ 33004, "Midnight Sun (face 1/2)", 1u },
            },
        },
        Card{
            .m_Id{ "aniccam" },
            .m_Group{ "english" },
            .m_Title{ MakeTitle("Aniccam") },
            .m_Faces{},
            .m_Variants{ 2u },
            .m_Printings{
                Printing{ 34001, "Parhelion (variant 1/2)", std::nullopt, 1u },
                Printing{ 34001, "Parhelion (variant 2/2)", std::nullopt, 2u },
            },
        },
    };
    manifest.m_Inserts = { Insert{ "rules", "english", MakeTitle("Rules Reference"), { "reference" } } };
    manifest.m_NrdbRemaps = { NrdbRemap{ 32003, 33022 } };
    return manifest;
}
} // namespace

TEST_CASE("Dumped manifests are canonical", "[serializer_canonical]")
{
    const Manifest manifest{ MakeManifest() };

    Manifest shuffled{ manifest };
    std::ranges::reverse(shuffled.m_Cards);
    for (Card& card : shuffled.m_Cards)
    {
        std::ranges::reverse(card.m_Printings);
    }

    const std::string dumped{ DumpManifest(manifest) };
    REQUIRE(dumped == DumpManifest(manifest));
    REQUIRE(dumped == DumpManifest(shuffled));

    REQUIRE(dumped.starts_with(fmt::format("format_version = '{}'", ManifestFormatVersion())) ||
            dumped.starts_with(fmt::format("format_version = \"{}\"", ManifestFormatVersion())));
    REQUIRE(dumped.ends_with('\n'));

    // Cards are ordered by id within their group
    REQUIRE(dumped.find("aniccam") < dumped.find("hoshiko_shiro_untold_protagonist"));
    REQUIRE(dumped.find("hoshiko_shiro_untold_protagonist") < dumped.find("sure_gamble"));

    // Nothing was declared, so nothing is written
    REQUIRE(dumped.find("local_image") == std::string::npos);
}

TEST_CASE("Dumped manifests read back", "[serializer_read_back]")
{
    Manifest manifest{ MakeManifest() };
    const Manifest read_back{ ParseManifest(DumpManifest(manifest), "manifest.toml") };

    SortManifest(manifest);
    REQUIRE(read_back == manifest);
}

TEST_CASE("Reject foreign manifests", "[serializer_format_version]")
{
    REQUIRE_THROWS_AS(ParseManifest("format_version = \"NRP00000\"\n", "old.toml"), LoadError);
    REQUIRE_THROWS_AS(ParseManifest("[[card]]\nid = \"a\"\n", "unversioned.toml"), LoadError);
    REQUIRE_NOTHROW(ParseManifest(fmt::format("format_version = \"{}\"\n", ManifestFormatVersion()), "empty.toml"));
}

TEST_CASE("Write manifests", "[serializer_write]")
{
    const ScopedTestDir dir{ "serializer_write" };
    const Manifest primary{ MakeManifest() };

    Manifest overlay{};
    overlay.m_LocalImages = { LocalImageOverride{ "english", 1050, std::nullopt, "https://img.example/1050.webp" } };

    const std::vector<ManifestOutput> outputs{
        ManifestOutput{ &primary, dir / "out/manifest.toml" },
        ManifestOutput{ &overlay, dir / "local-assets/manifest.local.toml" },
    };
    WriteManifests(outputs);

    REQUIRE(fs::exists(dir / "out/manifest.toml"));
    REQUIRE(fs::exists(dir / "local-assets/manifest.local.toml"));
    REQUIRE_FALSE(fs::exists(StagingPath(dir / "out/manifest.toml")));

    REQUIRE(ReadTextFile(dir / "out/manifest.toml") == DumpManifest(primary));
    REQUIRE(ReadManifest(dir / "local-assets/manifest.local.toml") == overlay);
}

TEST_CASE("Failed writes leave no output", "[serializer_write_failure]")
{
    const ScopedTestDir dir{ "serializer_write_failure" };
    const Manifest primary{ MakeManifest() };

    // A file where the second output wants a directory
    WriteTextFile(dir / "blocked", "not a directory");

    const std::vector<ManifestOutput> outputs{
        ManifestOutput{ &primary, dir / "manifest.toml" },
        ManifestOutput{ &primary, dir / "blocked/manifest.local.toml" },
    };
    REQUIRE_THROWS_AS(WriteManifests(outputs), SerializationError);
    REQUIRE_FALSE(fs::exists(dir / "manifest.toml"));
    REQUIRE_FALSE(fs::exists(StagingPath(dir / "manifest.toml")));
}

TEST_CASE("Blocked outputs keep the previous manifests", "[serializer_blocked_output]")
{
    const ScopedTestDir dir{ "serializer_blocked_output" };
    const Manifest primary{ MakeManifest() };

    // A directory where the overlay file should go
    fs::create_directories(dir / "local-assets/manifest.local.toml");

    const std::vector<ManifestOutput> outputs{
        ManifestOutput{ &primary, dir / "manifest.toml" },
        ManifestOutput{ &primary, dir / "local-assets/manifest.local.toml" },
    };

    SECTION("No previous manifest")
    {
        REQUIRE_THROWS_AS(WriteManifests(outputs), SerializationError);
        REQUIRE_FALSE(fs::exists(dir / "manifest.toml"));
    }

    SECTION("Previous manifest")
    {
        WriteTextFile(dir / "manifest.toml", "previous");
        REQUIRE_THROWS_AS(WriteManifests(outputs), SerializationError);
        REQUIRE(ReadTextFile(dir / "manifest.toml") == "previous");
        REQUIRE_FALSE(fs::exists(dir / "manifest.toml.prev"));
    }

    REQUIRE_FALSE(fs::exists(StagingPath(dir / "manifest.toml")));
    REQUIRE(fs::is_directory(dir / "local-assets/manifest.local.toml"));
}

TEST_CASE("Rewrites replace the previous manifests", "[serializer_rewrite]")
{
    const ScopedTestDir dir{ "serializer_rewrite" };
    const Manifest primary{ MakeManifest() };
    WriteTextFile(dir / "manifest.toml", "previous");

    const std::vector<ManifestOutput> outputs{ ManifestOutput{ &primary, dir / "manifest.toml" } };
    WriteManifests(outputs);

    REQUIRE(ReadTextFile(dir / "manifest.toml") == DumpManifest(primary));
    REQUIRE_FALSE(fs::exists(dir / "manifest.toml.prev"));
}
