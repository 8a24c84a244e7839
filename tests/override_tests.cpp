#include <catch2/catch_test_macros.hpp>

#include <nrp/errors.hpp>
#include <nrp/manifest/overrides.hpp>

TEST_CASE("Parse collections with printings and inserts", "[overrides_collection]")
{
    const OverrideFile overrides{ ParseOverrideString(R"(
[[collection]]
name = "English"
group = "english"

[[collection.printing]]
spec = "core"
name = "Core Set"

[[collection.printing]]
spec = "system_gateway"
name = "System Gateway"

[[collection.insert]]
id = "rules"
title = "Rules Reference"
insert_groups = ["rules", "reference"]
)",
                                                      "overrides.toml") };

    REQUIRE(overrides.m_Collections.size() == 1);

    const CollectionInput& collection{ overrides.m_Collections.front() };
    REQUIRE(collection.m_Name == "English");
    REQUIRE(collection.m_Group == "english");
    REQUIRE(collection.m_Printings.size() == 2);
    REQUIRE(collection.m_Printings[1].m_Spec == "system_gateway");
    REQUIRE(collection.m_Printings[1].m_Name == "System Gateway");
    REQUIRE(collection.m_Inserts.size() == 1);
    REQUIRE(collection.m_Inserts[0].m_Id == "rules");
    REQUIRE(collection.m_Inserts[0].m_InsertGroups == std::vector<std::string>{ "rules", "reference" });
    REQUIRE_FALSE(collection.m_Inserts[0].m_StrippedTitle.has_value());
}

TEST_CASE("Parse card overrides", "[overrides_card]")
{
    const OverrideFile overrides{ ParseOverrideString(R"(
[[card]]
id = "33001"
title = "Chameleon"
printing_id = 99001

[[card]]
id = "hoshiko_shiro"
group = "japanese"
faces = ["Hoshiko Shiro: Mahou Shoujo"]
printing_name = "Promo"
printings = [{ id = 26010 }, { id = 26011, name = "Alt Art" }]

[[card]]
id = 1234
variants = 3
)",
                                                      "overrides.toml") };

    REQUIRE(overrides.m_Cards.size() == 3);

    const CardOverride& chameleon{ overrides.m_Cards[0] };
    REQUIRE(chameleon.m_Index == 0);
    REQUIRE(chameleon.m_Id == "33001");
    REQUIRE(chameleon.m_Group == "english");
    REQUIRE(chameleon.m_Title == "Chameleon");
    REQUIRE(chameleon.m_Printings.size() == 1);
    REQUIRE(chameleon.m_Printings[0].m_Id == 99001);
    REQUIRE_FALSE(chameleon.m_Printings[0].m_Name.has_value());

    const CardOverride& hoshiko{ overrides.m_Cards[1] };
    REQUIRE(hoshiko.m_Group == "japanese");
    REQUIRE(hoshiko.m_Faces == std::vector<std::string>{ "Hoshiko Shiro: Mahou Shoujo" });
    REQUIRE(hoshiko.m_PrintingName == "Promo");
    REQUIRE(hoshiko.m_Printings.size() == 2);
    REQUIRE(hoshiko.m_Printings[1].m_Name == "Alt Art");

    const CardOverride& variants{ overrides.m_Cards[2] };
    REQUIRE(variants.m_Id == "1234");
    REQUIRE(variants.m_Variants == 3u);
    REQUIRE(variants.m_Printings.empty());
}

TEST_CASE("Parse remaps and local images", "[overrides_remap_local_image]")
{
    const OverrideFile overrides{ ParseOverrideString(R"(
[[nrdb_remap]]
from = 32003
to = 33022

[[nrdb_remap]]
from = 32004
to = 33023
supersede = true

[local_image_root]
path = "local-assets/images"

[[local_image]]
id = 33022

[[local_image]]
id = 26010
face = 2
url = "https://example.com/26010.2.webp"
)",
                                                      "overrides.toml") };

    REQUIRE(overrides.m_Remaps.size() == 2);
    REQUIRE(overrides.m_Remaps[0].m_From == 32003);
    REQUIRE(overrides.m_Remaps[0].m_To == 33022);
    REQUIRE_FALSE(overrides.m_Remaps[0].m_Supersede);
    REQUIRE(overrides.m_Remaps[1].m_Supersede);

    REQUIRE(overrides.m_LocalImageRoot.has_value());
    REQUIRE(overrides.m_LocalImageRoot->m_Path == "local-assets/images");

    REQUIRE(overrides.m_LocalImages.size() == 2);
    REQUIRE(overrides.m_LocalImages[0].m_Group == "english");
    REQUIRE_FALSE(overrides.m_LocalImages[0].m_Url.has_value());
    REQUIRE(overrides.m_LocalImages[1].m_Face == 2u);
}

TEST_CASE("Reject malformed override files", "[overrides_invalid]")
{
    SECTION("Unknown key")
    {
        REQUIRE_THROWS_AS(ParseOverrideString("[[card]]\nid = \"1\"\nprinting = 5\n", "bad.toml"), LoadError);
    }

    SECTION("Missing id")
    {
        REQUIRE_THROWS_AS(ParseOverrideString("[[card]]\ntitle = \"Nameless\"\n", "bad.toml"), LoadError);
    }

    SECTION("Both printing forms")
    {
        REQUIRE_THROWS_AS(ParseOverrideString(R"(
[[card]]
id = "1"
printing_id = 1
printings = [{ id = 2 }]
)",
                                              "bad.toml"),
                          LoadError);
    }

    SECTION("Faces and variants together")
    {
        REQUIRE_THROWS_AS(ParseOverrideString("[[card]]\nid = \"1\"\nfaces = [\"Back\"]\nvariants = 2\n", "bad.toml"), LoadError);
    }

    SECTION("Too few variants")
    {
        REQUIRE_THROWS_AS(ParseOverrideString("[[card]]\nid = \"1\"\nvariants = 1\n", "bad.toml"), LoadError);
    }

    SECTION("Negative printing id")
    {
        REQUIRE_THROWS_AS(ParseOverrideString("[[card]]\nid = \"1\"\nprinting_id = -4\n", "bad.toml"), LoadError);
    }

    SECTION("Local image without any location")
    {
        REQUIRE_THROWS_AS(ParseOverrideString("[[local_image]]\nid = 1\n", "bad.toml"), LoadError);
    }

    SECTION("Local image with url and path")
    {
        REQUIRE_THROWS_AS(ParseOverrideString("[[local_image]]\nid = 1\nurl = \"a\"\npath = \"b\"\n", "bad.toml"), LoadError);
    }

    SECTION("Not toml at all")
    {
        REQUIRE_THROWS_AS(ParseOverrideString("[[card]\nid = ", "bad.toml"), LoadError);
    }
}

TEST_CASE("Missing override file", "[overrides_missing_file]")
{
    REQUIRE_THROWS_AS(ParseOverrideFile("does_not_exist.toml"), LoadError);
}
