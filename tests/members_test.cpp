#include "fixtures.hpp"

#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <type_traits>
#include <vector>

using nbtmap::Tag;
using nbtmap::TagType;

namespace {

template<class S>
concept NameableWith = requires(S name) { nbtmap::tagged(name); };

}  // namespace

// ------------------------------------------------------------------
// 1. Member table
// ------------------------------------------------------------------

TEST(MembersTest, DirectiveNameOverridesMemberName) {
    const auto& table = nbtmap::members_of<Profile>();
    EXPECT_EQ(std::get<0>(table).name(), "Id");
    EXPECT_EQ(std::get<0>(table).exported_name(), "id");
    EXPECT_FALSE(std::get<0>(table).hide_when_default());
    EXPECT_TRUE(std::get<1>(table).hide_when_default());

    const auto& settings = nbtmap::members_of<Settings>();
    EXPECT_EQ(std::get<0>(settings).exported_name(), "enabled");
    EXPECT_FALSE(std::get<2>(settings).mapped());
}

TEST(MembersTest, CapabilitiesFollowMemberKind) {
    using Table = std::remove_cvref_t<decltype(nbtmap::members_of<Player>())>;
    static_assert(std::tuple_element_t<0, Table>::replaceable);
    static_assert(std::tuple_element_t<3, Table>::replaceable);
    static_assert(!std::tuple_element_t<4, Table>::replaceable);
    SUCCEED();
}

TEST(MembersTest, TableIsBuiltOnceAcrossThreads) {
    std::vector<const void*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < seen.size(); i++) {
        threads.emplace_back([&seen, i] { seen[i] = &nbtmap::members_of<Item>(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const void* address : seen) {
        EXPECT_EQ(address, seen.front());
    }
}

// ------------------------------------------------------------------
// 2. Selection while mapping
// ------------------------------------------------------------------

TEST(MembersTest, UnannotatedMembersNeverReachTheTag) {
    Settings settings;
    settings.volume = 3;
    settings.secret = "hunter2";

    Tag tag = nbtmap::serialize_object(settings);
    EXPECT_EQ(tag.size(), 1u);
    EXPECT_TRUE(tag.contains("volume"));
    EXPECT_FALSE(tag.contains("secret"));
}

TEST(MembersTest, UnannotatedMembersAreNotRead) {
    Tag tag = Tag::compound();
    Tag secret = Tag::make("leaked");
    secret.set_name("secret");
    tag.add(secret);

    Settings settings = nbtmap::deserialize_object<Settings>(tag);
    EXPECT_TRUE(settings.secret.empty());
}

TEST(MembersTest, RenamedMemberUsesExportedNameOnly) {
    Item item{"apple", 4};
    Tag tag = nbtmap::serialize_object(item);

    EXPECT_TRUE(tag.contains("Count"));
    EXPECT_FALSE(tag.contains("count"));
    EXPECT_EQ(nbtmap::deserialize_object<Item>(tag).count, 4);
}

TEST(MembersTest, PropertyUsesGetterAndSetter) {
    Player player;
    player.name = "steve";
    player.set_score(1200);

    Tag tag = nbtmap::serialize_object(player);
    EXPECT_EQ(tag["Score"].get<std::int32_t>(), 1200);

    Player copy = nbtmap::deserialize_object<Player>(tag);
    EXPECT_EQ(copy.score(), 1200);
}

TEST(MembersTest, StaticMemberIsWrittenAndRead) {
    Config::version = 9;
    Config config;
    config.label = "main";

    Tag tag = nbtmap::serialize_object(config);
    EXPECT_EQ(tag["version"].get<std::int32_t>(), 9);
    EXPECT_EQ(*tag.at(0).name(), "version");

    Config::version = 0;
    Config copy = nbtmap::deserialize_object<Config>(tag);
    EXPECT_EQ(Config::version, 9);
    EXPECT_EQ(copy.label, "main");
}

TEST(MembersTest, DuplicateExportedNamesAreRejected) {
    struct Clash {
        std::int32_t a = 1;
        std::int32_t b = 2;
    };
    // Registered inline through a local table
    const auto table = nbtmap::members(
        nbtmap::field("a", &Clash::a, nbtmap::tagged("same")),
        nbtmap::field("b", &Clash::b, nbtmap::tagged("same")));

    Clash clash;
    Tag compound = Tag::compound();
    EXPECT_THROW(nbtmap::for_each_member(table, [&](const auto& member) {
        Tag child = nbtmap::scalar_to_tag(member.read(clash));
        child.set_name(std::string(member.exported_name()));
        compound.add(std::move(child));
    }), nbtmap::TagError);
}

TEST(MembersTest, NamesAreTakenAsLiterals) {
    static_assert(NameableWith<const char*>);
    static_assert(!NameableWith<std::string>);
    static_assert(!NameableWith<std::string_view>);

    constexpr nbtmap::Directive directive = nbtmap::tagged("lit").hide_default();
    EXPECT_EQ(*directive.name, "lit");
    EXPECT_TRUE(directive.hide_when_default);
}
