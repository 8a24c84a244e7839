#include <catch2/catch_test_macros.hpp>

#include <nrp/errors.hpp>
#include <nrp/manifest/overrides.hpp>
#include <nrp/manifest/source_loader.hpp>

#include "test_util.hpp"

TEST_CASE("Parse printing ids", "[source_printing_id]")
{
    REQUIRE(ParsePrintingId("01001") == 1001u);
    REQUIRE(ParsePrintingId("33022") == 33022u);
    REQUIRE_FALSE(ParsePrintingId("").has_value());
    REQUIRE_FALSE(ParsePrintingId("01001a").has_value());
    REQUIRE_FALSE(ParsePrintingId("-5").has_value());
}

TEST_CASE("Load sample dataset", "[source_load]")
{
    const ScopedTestDir dir{ "source_load" };
    WriteSampleDataset(dir.m_Path);

    const OverrideFile overrides{ ParseOverrideString(c_SampleCollections, "overrides.toml") };
    const SourceDataset dataset{ LoadSourceDataset(dir.m_Path, overrides.m_Collections) };

    REQUIRE(dataset.m_Collections.size() == 1);
    REQUIRE(dataset.m_Collections[0].m_Group == "english");
    REQUIRE(dataset.m_Cards.size() == 6);
    REQUIRE(dataset.m_Inserts.size() == 1);
    REQUIRE(dataset.m_Inserts[0].m_Name == "rules");

    const CardRecord* deja_vu{ dataset.FindCard("english", "deja_vu") };
    REQUIRE(deja_vu != nullptr);
    REQUIRE(deja_vu->m_Title.m_Title == "Déjà Vu");
    REQUIRE(deja_vu->m_Title.m_StrippedTitle == "Deja Vu");
    REQUIRE(deja_vu->m_Printings.size() == 1);
    REQUIRE(deja_vu->m_Printings[0].m_Id == 1002);
    REQUIRE(deja_vu->m_Printings[0].m_Name == "Core Set");

    const CardRecord* noise{ dataset.FindCard("english", "noise_hacker_extraordinaire") };
    REQUIRE(noise != nullptr);
    REQUIRE(noise->m_Title.m_StrippedTitle == "Noise: Hacker Extraordinaire");

    const CardRecord* hoshiko{ dataset.FindCard("english", "hoshiko_shiro_untold_protagonist") };
    REQUIRE(hoshiko != nullptr);
    REQUIRE(hoshiko->m_Faces.size() == 1);
    REQUIRE(hoshiko->m_Faces[0].m_Title == "Hoshiko Shiro: Mahou Shoujo");
    REQUIRE_FALSE(hoshiko->m_Variants.has_value());

    const CardRecord* aniccam{ dataset.FindCard("english", "aniccam") };
    REQUIRE(aniccam != nullptr);
    REQUIRE(aniccam->m_Faces.empty());
    REQUIRE(aniccam->m_Variants == 3u);

    REQUIRE(dataset.FindCard("japanese", "aniccam") == nullptr);
}

TEST_CASE("Dataset errors are load errors", "[source_errors]")
{
    const ScopedTestDir dir{ "source_errors" };
    WriteSampleDataset(dir.m_Path);

    SECTION("Missing dataset directory")
    {
        const OverrideFile overrides{ ParseOverrideString(c_SampleCollections, "overrides.toml") };
        REQUIRE_THROWS_AS(LoadSourceDataset(dir / "nothing_here", overrides.m_Collections), LoadError);
    }

    SECTION("Missing printing file")
    {
        const OverrideFile overrides{ ParseOverrideString(R"(
[[collection]]
name = "English"
group = "english"
[[collection.printing]]
spec = "unreleased"
name = "Unreleased"
)",
                                                          "overrides.toml") };
        REQUIRE_THROWS_AS(LoadSourceDataset(dir.m_Path, overrides.m_Collections), LoadError);
    }

    SECTION("Printing of an unknown card")
    {
        WritePrintingsJson(dir.m_Path, "broken", R"([{ "id": "99001", "card_id": "nobody" }])");
        const OverrideFile overrides{ ParseOverrideString(R"(
[[collection]]
name = "English"
group = "english"
[[collection.printing]]
spec = "broken"
name = "Broken"
)",
                                                          "overrides.toml") };
        REQUIRE_THROWS_AS(LoadSourceDataset(dir.m_Path, overrides.m_Collections), LoadError);
    }

    SECTION("Printing id that is not a number")
    {
        WritePrintingsJson(dir.m_Path, "broken", R"([{ "id": "ab001", "card_id": "sure_gamble" }])");
        const OverrideFile overrides{ ParseOverrideString(R"(
[[collection]]
name = "English"
group = "english"
[[collection.printing]]
spec = "broken"
name = "Broken"
)",
                                                          "overrides.toml") };
        REQUIRE_THROWS_AS(LoadSourceDataset(dir.m_Path, overrides.m_Collections), LoadError);
    }

    SECTION("Group declared twice")
    {
        const OverrideFile overrides{ ParseOverrideString(R"(
[[collection]]
name = "English"
group = "english"
[[collection]]
name = "Also English"
group = "english"
)",
                                                          "overrides.toml") };
        REQUIRE_THROWS_AS(LoadSourceDataset(dir.m_Path, overrides.m_Collections), LoadError);
    }
}
