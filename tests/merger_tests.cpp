#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <optional>
#include <ranges>
#include <set>

#include <fmt/format.h>

#include <nrp/errors.hpp>
#include <nrp/manifest/merger.hpp>
#include <nrp/manifest/overrides.hpp>
#include <nrp/manifest/source_loader.hpp>

#include "test_util.hpp"

namespace
{
CompiledManifests MergeSample(const ScopedTestDir& dir,
                              std::string_view overrides_text,
                              std::optional<std::string_view> local_text = std::nullopt)
{
    WriteSampleDataset(dir.m_Path);

    const OverrideFile overrides{
        ParseOverrideString(fmt::format("{}\n{}", c_SampleCollections, overrides_text), "overrides.toml"),
    };
    std::optional<OverrideFile> local_overrides;
    if (local_text.has_value())
    {
        local_overrides = ParseOverrideString(local_text.value(), "overrides.local.toml");
    }

    SourceDataset dataset{ LoadSourceDataset(dir.m_Path, overrides.m_Collections) };
    return MergeOverrides(std::move(dataset),
                          overrides,
                          local_overrides.has_value() ? &local_overrides.value() : nullptr);
}

bool HasPrinting(const Manifest& manifest, uint32_t printing_id)
{
    return std::ranges::any_of(manifest.m_Cards,
                               [&](const Card& card)
                               { return !card.FindPrintings(printing_id).empty(); });
}
} // namespace

TEST_CASE("Merging without overrides expands the dataset", "[merge_plain]")
{
    const ScopedTestDir dir{ "merge_plain" };
    const CompiledManifests compiled{ MergeSample(dir, "") };
    const Manifest& primary{ compiled.m_Primary };

    REQUIRE(primary.m_Cards.size() == 6);
    REQUIRE(primary.NumPrintings() == 9);
    REQUIRE(primary.m_Inserts.size() == 1);
    REQUIRE(compiled.m_Overlay.Empty());

    const Card* hoshiko{ primary.FindCard("english", "hoshiko_shiro_untold_protagonist") };
    REQUIRE(hoshiko != nullptr);
    REQUIRE(hoshiko->m_Printings.size() == 2);
    REQUIRE(hoshiko->m_Printings[0].m_Face == 1u);
    REQUIRE(hoshiko->m_Printings[0].m_Name == "Midnight Sun (face 1/2)");
    REQUIRE(hoshiko->m_Printings[1].m_Face == 2u);

    const Card* aniccam{ primary.FindCard("english", "aniccam") };
    REQUIRE(aniccam != nullptr);
    REQUIRE(aniccam->m_Printings.size() == 3);
    REQUIRE(aniccam->m_Printings[2].m_Variant == 3u);
    REQUIRE(aniccam->m_Printings[2].m_Name == "Parhelion (variant 3/3)");
}

TEST_CASE("Every printing key appears exactly once", "[merge_unique_keys]")
{
    const ScopedTestDir dir{ "merge_unique_keys" };
    const CompiledManifests compiled{ MergeSample(dir, R"(
[[card]]
id = "sure_gamble"
printings = [{ id = 30001, name = "System Gateway" }, { id = 1050 }]

[[card]]
id = "hoshiko_shiro_untold_protagonist"
printing_id = 33004
)") };

    const std::vector<PrintingKey> keys{ compiled.m_Primary.PrintingKeys() };
    const std::set<PrintingKey> unique_keys{ keys.begin(), keys.end() };
    REQUIRE(keys.size() == unique_keys.size());
    REQUIRE(keys.size() == 10);
}

TEST_CASE("New card from an override", "[merge_new_card]")
{
    const ScopedTestDir dir{ "merge_new_card" };
    const CompiledManifests compiled{ MergeSample(dir, R"(
[[card]]
id = "33001"
title = "Chameleon"
printing_id = 99001
)") };

    const auto matching{
        compiled.m_Primary.m_Cards |
        std::views::filter([](const Card& card)
                           { return card.m_Id == "33001"; }) |
        std::ranges::to<std::vector>()
    };
    REQUIRE(matching.size() == 1);

    const Card& card{ matching.front() };
    REQUIRE(card.m_Group == "english");
    REQUIRE(card.m_Title.m_Title == "Chameleon");
    REQUIRE(card.m_Printings.size() == 1);
    REQUIRE(card.m_Printings[0].m_Id == 99001);
    REQUIRE(card.m_Printings[0].m_Name == "Custom");
}

TEST_CASE("New card needs a title and printings", "[merge_new_card_incomplete]")
{
    const ScopedTestDir dir{ "merge_new_card_incomplete" };
    REQUIRE_THROWS_AS(MergeSample(dir, "[[card]]\nid = \"33001\"\nprinting_id = 99001\n"), LoadError);
    REQUIRE_THROWS_AS(MergeSample(dir, "[[card]]\nid = \"33001\"\ntitle = \"Chameleon\"\n"), LoadError);
}

TEST_CASE("Card override in an unknown group", "[merge_unknown_group]")
{
    const ScopedTestDir dir{ "merge_unknown_group" };
    REQUIRE_THROWS_AS(MergeSample(dir, R"(
[[card]]
id = "33001"
group = "klingon"
title = "Chameleon"
printing_id = 99001
)"),
                      LoadError);
}

TEST_CASE("Variants expand into distinct printings", "[merge_variants]")
{
    const ScopedTestDir dir{ "merge_variants" };
    const CompiledManifests compiled{ MergeSample(dir, R"(
[[card]]
id = "sure_gamble"
variants = 3
)") };

    const Card* sure_gamble{ compiled.m_Primary.FindCard("english", "sure_gamble") };
    REQUIRE(sure_gamble != nullptr);
    REQUIRE(sure_gamble->m_Printings.size() == 3);

    std::set<PrintingKey> keys;
    for (const Printing& printing : sure_gamble->m_Printings)
    {
        REQUIRE(printing.m_Id == 1050);
        keys.insert(sure_gamble->KeyOf(printing));
    }
    REQUIRE(keys.size() == 3);
}

TEST_CASE("Overriding an existing field warns", "[merge_override_warning]")
{
    const CapturedLog log{};
    const ScopedTestDir dir{ "merge_override_warning" };
    const CompiledManifests compiled{ MergeSample(dir, R"(
[[card]]
id = "deja_vu"
title = "Deja Vu"

[[card]]
id = "noise_hacker_extraordinaire"
printing_name = "Revised Core Set"
)") };

    const Card* deja_vu{ compiled.m_Primary.FindCard("english", "deja_vu") };
    REQUIRE(deja_vu != nullptr);
    REQUIRE(deja_vu->m_Title.m_Title == "Deja Vu");
    REQUIRE(log.Warned("overrides title of card english/deja_vu"));

    const Card* noise{ compiled.m_Primary.FindCard("english", "noise_hacker_extraordinaire") };
    REQUIRE(noise != nullptr);
    REQUIRE(noise->m_Printings[0].m_Name == "Revised Core Set");
    REQUIRE(log.Warned("name of printing 1001"));
}

TEST_CASE("Entries for one card apply in order", "[merge_override_order]")
{
    const CapturedLog log{};
    const ScopedTestDir dir{ "merge_override_order" };
    const CompiledManifests compiled{ MergeSample(dir, R"(
[[card]]
id = "deja_vu"
title = "Deja Vu A"

[[card]]
id = "deja_vu"
title = "Deja Vu B"
printing_name = "Revised Core Set"
)") };

    const Card* deja_vu{ compiled.m_Primary.FindCard("english", "deja_vu") };
    REQUIRE(deja_vu != nullptr);
    REQUIRE(deja_vu->m_Title.m_Title == "Deja Vu B");
    REQUIRE(deja_vu->m_Title.m_StrippedTitle == "Deja Vu B");
    REQUIRE(log.Warned("`Deja Vu A` -> `Deja Vu B`"));

    // Printings from the dataset survive with their new name
    REQUIRE(deja_vu->m_Printings.size() == 1);
    REQUIRE(deja_vu->m_Printings[0].m_Id == 1002);
    REQUIRE(deja_vu->m_Printings[0].m_Name == "Revised Core Set");
}

TEST_CASE("Faces override turns a card into a flip card", "[merge_faces]")
{
    const ScopedTestDir dir{ "merge_faces" };
    const CompiledManifests compiled{ MergeSample(dir, R"(
[[card]]
id = "aniccam"
faces = ["Aniccam: Reversed"]
)") };

    const Card* aniccam{ compiled.m_Primary.FindCard("english", "aniccam") };
    REQUIRE(aniccam != nullptr);
    REQUIRE_FALSE(aniccam->m_Variants.has_value());
    REQUIRE(aniccam->m_Printings.size() == 2);
    REQUIRE(aniccam->m_Printings[1].m_Face == 2u);
}

TEST_CASE("Two cards claiming one printing conflict", "[merge_duplicate_printing]")
{
    const ScopedTestDir dir{ "merge_duplicate_printing" };
    REQUIRE_THROWS_AS(MergeSample(dir, R"(
[[card]]
id = "sure_gamble"
printing_id = 1001
)"),
                      MergeConflictError);
}

TEST_CASE("Remap moves a printing to its new id", "[merge_remap]")
{
    const ScopedTestDir dir{ "merge_remap" };
    const CompiledManifests compiled{ MergeSample(dir, R"(
[[nrdb_remap]]
from = 32003
to = 33022
)") };
    const Manifest& primary{ compiled.m_Primary };

    REQUIRE_FALSE(HasPrinting(primary, 32003));

    const Card* card{ primary.FindCardByPrinting("english", 33022) };
    REQUIRE(card != nullptr);
    REQUIRE(card->m_Id == "diversion_of_funds");
    REQUIRE(card->m_Title.m_Title == "Diversion of Funds");

    const auto printings{ card->FindPrintings(33022) };
    REQUIRE(printings.size() == 1);
    REQUIRE(printings[0]->m_Name == "System Update 2021");

    REQUIRE(primary.m_NrdbRemaps.size() == 1);
    REQUIRE(primary.FindRemap(32003) == 33022u);
}

TEST_CASE("Remap conflicts", "[merge_remap_conflicts]")
{
    const ScopedTestDir dir{ "merge_remap_conflicts" };

    SECTION("Unknown source")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, "[[nrdb_remap]]\nfrom = 12345\nto = 33022\n"), MergeConflictError);
    }

    SECTION("Onto itself")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, "[[nrdb_remap]]\nfrom = 32003\nto = 32003\n"), MergeConflictError);
    }

    SECTION("Onto an existing printing")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, "[[nrdb_remap]]\nfrom = 32003\nto = 1050\n"), MergeConflictError);
    }

    SECTION("Chained")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, R"(
[[nrdb_remap]]
from = 32003
to = 33022

[[nrdb_remap]]
from = 33022
to = 33023
)"),
                          MergeConflictError);
    }

    SECTION("Same source twice")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, R"(
[[nrdb_remap]]
from = 32003
to = 33022

[[nrdb_remap]]
from = 32003
to = 33023
)"),
                          MergeConflictError);
    }
}

TEST_CASE("Superseding remap replaces the existing printing", "[merge_remap_supersede]")
{
    const CapturedLog log{};
    const ScopedTestDir dir{ "merge_remap_supersede" };
    const CompiledManifests compiled{ MergeSample(dir, R"(
[[nrdb_remap]]
from = 32003
to = 1050
supersede = true
)") };
    const Manifest& primary{ compiled.m_Primary };

    REQUIRE_FALSE(HasPrinting(primary, 32003));
    REQUIRE(primary.FindCard("english", "sure_gamble") == nullptr);

    const Card* card{ primary.FindCardByPrinting("english", 1050) };
    REQUIRE(card != nullptr);
    REQUIRE(card->m_Id == "diversion_of_funds");

    REQUIRE(log.Warned("supersedes"));
    REQUIRE(log.Warned("card english/sure_gamble has no printings left"));
}

TEST_CASE("Local overrides only end up in the overlay", "[merge_overlay]")
{
    const ScopedTestDir dir{ "merge_overlay" };
    const CompiledManifests compiled{ MergeSample(dir,
                                                  "",
                                                  R"(
[[card]]
id = "33001"
title = "Chameleon"
printing_id = 99001

[[card]]
id = "sure_gamble"
printing_id = 99002
printing_name = "Playtest"

[[nrdb_remap]]
from = 99999
to = 1050
)") };
    const Manifest& primary{ compiled.m_Primary };
    const LocalOverlayManifest& overlay{ compiled.m_Overlay };

    REQUIRE(primary.FindCard("english", "33001") == nullptr);
    REQUIRE_FALSE(HasPrinting(primary, 99001));
    REQUIRE_FALSE(HasPrinting(primary, 99002));
    REQUIRE(primary.m_NrdbRemaps.empty());

    REQUIRE(overlay.m_Collections.empty());
    REQUIRE(overlay.FindCard("english", "33001") != nullptr);

    const Card* sure_gamble{ overlay.FindCard("english", "sure_gamble") };
    REQUIRE(sure_gamble != nullptr);
    REQUIRE(sure_gamble->m_Title.m_Title == "Sure Gamble");
    REQUIRE(sure_gamble->m_Printings.size() == 1);
    REQUIRE(sure_gamble->m_Printings[0].m_Id == 99002);
    REQUIRE(sure_gamble->m_Printings[0].m_Name == "Playtest");

    REQUIRE(overlay.FindRemap(99999) == 1050u);
}

TEST_CASE("Local overrides can not touch primary printings", "[merge_overlay_conflicts]")
{
    const ScopedTestDir dir{ "merge_overlay_conflicts" };

    SECTION("Existing printing")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, "", "[[card]]\nid = \"sure_gamble\"\nprinting_id = 1050\n"), MergeConflictError);
    }

    SECTION("Printing of another card")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, "", "[[card]]\nid = \"sure_gamble\"\nprinting_id = 1001\n"), MergeConflictError);
    }

    SECTION("Remapping a printing")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, "", "[[nrdb_remap]]\nfrom = 1050\nto = 1001\n"), MergeConflictError);
    }

    SECTION("Remapping onto nothing")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, "", "[[nrdb_remap]]\nfrom = 99999\nto = 99998\n"), MergeConflictError);
    }

    SECTION("Declaring a collection")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, "", "[[collection]]\nname = \"Mine\"\ngroup = \"mine\"\n"), LoadError);
    }
}

TEST_CASE("Local images resolve to urls in the overlay", "[merge_local_images]")
{
    const ScopedTestDir dir{ "merge_local_images" };
    const CompiledManifests compiled{ MergeSample(dir,
                                                  R"(
[[local_image]]
id = 1050
url = "https://img.example/sure_gamble.webp"
)",
                                                  R"(
[local_image_root]
url = "https://img.example/local/"

[[local_image]]
id = 33004
face = 2

[[local_image]]
id = 1001
path = "art/noise.png"
)") };
    const Manifest& primary{ compiled.m_Primary };
    const LocalOverlayManifest& overlay{ compiled.m_Overlay };

    REQUIRE(primary.m_LocalImages.empty());
    REQUIRE(overlay.m_LocalImages.size() == 3);

    const LocalImageOverride* sure_gamble{ overlay.FindLocalImage(PrintingKey{ "english", 1050 }) };
    REQUIRE(sure_gamble != nullptr);
    REQUIRE(sure_gamble->m_Url == "https://img.example/sure_gamble.webp");

    const LocalImageOverride* hoshiko_back{ overlay.FindLocalImage(PrintingKey{ "english", 33004, 2u }) };
    REQUIRE(hoshiko_back != nullptr);
    REQUIRE(hoshiko_back->m_Url == "https://img.example/local/33004.2.webp");

    const LocalImageOverride* noise{ overlay.FindLocalImage(PrintingKey{ "english", 1001 }) };
    REQUIRE(noise != nullptr);
    REQUIRE(noise->m_Url == ToFileUrl("art/noise.png"));
    REQUIRE(noise->m_Url.starts_with("file://"));
}

TEST_CASE("Local image conflicts", "[merge_local_image_conflicts]")
{
    const ScopedTestDir dir{ "merge_local_image_conflicts" };

    SECTION("Ambiguous face")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, "[[local_image]]\nid = 33004\nurl = \"a.webp\"\n"), MergeConflictError);
    }

    SECTION("Unknown printing")
    {
        REQUIRE_THROWS_AS(MergeSample(dir, "[[local_image]]\nid = 4242\nurl = \"a.webp\"\n"), MergeConflictError);
    }

    SECTION("Same printing twice")
    {
        REQUIRE_THROWS_AS(MergeSample(dir,
                                      "[[local_image]]\nid = 1050\nurl = \"a.webp\"\n",
                                      "[[local_image]]\nid = 1050\nurl = \"b.webp\"\n"),
                          MergeConflictError);
    }
}
