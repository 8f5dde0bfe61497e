#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nbtmap/nbtmap.hpp>

// Record types shared by the tests

struct Profile {
    std::int64_t id = 0;
    std::vector<std::string> tags;
};

struct Scoreboard {
    std::map<std::string, std::int32_t> scores;
};

struct Settings {
    bool enabled = false;
    std::int32_t volume = 0;
    std::string secret;  // registered without a directive
};

struct Item {
    std::string id;
    std::int16_t count = 0;
};

struct AllScalars {
    std::int8_t i8 = 0;
    std::uint8_t u8 = 0;
    std::int16_t i16 = 0;
    std::uint16_t u16 = 0;
    std::int32_t i32 = 0;
    std::uint32_t u32 = 0;
    std::int64_t i64 = 0;
    std::uint64_t u64 = 0;
    float f32 = 0.0f;
    double f64 = 0.0;
    bool flag = false;
    std::string text;
    nbtmap::ByteArray bytes;
    nbtmap::IntArray ints;
};

class Player {
public:
    std::string name;
    std::int32_t level = 1;
    Settings settings;

    std::int32_t score() const { return score_; }
    void set_score(std::int32_t score) { score_ = score; }

    std::vector<Item>& inventory() { return inventory_; }
    const std::vector<Item>& inventory() const { return inventory_; }

    std::string nickname;  // not registered at all

private:
    friend struct nbtmap::Mapping<Player>;

    std::int32_t score_ = 0;
    std::vector<Item> inventory_;
};

struct Config {
    static inline std::int32_t version = 0;
    std::string label;
};

struct Node {
    std::string label;
    std::vector<Node> children;
};

struct Awkward {
    long double precise = 0.0L;
    std::map<int, std::string> by_id;
    std::int32_t marker = 0;
};

struct Holder {
    nbtmap::Tag extra;
    std::optional<std::int32_t> maybe;
    std::optional<Item> item;
};

// Every member without a mutator
struct Bag {
    std::vector<std::string> items;
    std::unordered_map<std::string, std::int32_t> counts;
    Settings settings;
    std::int32_t fixed = 7;
};

namespace nbtmap {

template<>
struct Mapping<Profile> {
    static auto members()
    {
        return nbtmap::members(
            field("Id", &Profile::id, tagged("id")),
            field("Tags", &Profile::tags, tagged("tags").hide_default()));
    }
};

template<>
struct Mapping<Scoreboard> {
    static auto members()
    {
        return nbtmap::members(field("Scores", &Scoreboard::scores, tagged("scores")));
    }
};

template<>
struct Mapping<Settings> {
    static auto members()
    {
        return nbtmap::members(
            field("enabled", &Settings::enabled, tagged().hide_default()),
            field("volume", &Settings::volume, tagged().hide_default()),
            field("secret", &Settings::secret));
    }
};

template<>
struct Mapping<Item> {
    static auto members()
    {
        return nbtmap::members(
            field("id", &Item::id, tagged()),
            field("count", &Item::count, tagged("Count")));
    }
};

template<>
struct Mapping<AllScalars> {
    static auto members()
    {
        return nbtmap::members(
            field("i8", &AllScalars::i8, tagged()),
            field("u8", &AllScalars::u8, tagged()),
            field("i16", &AllScalars::i16, tagged()),
            field("u16", &AllScalars::u16, tagged()),
            field("i32", &AllScalars::i32, tagged()),
            field("u32", &AllScalars::u32, tagged()),
            field("i64", &AllScalars::i64, tagged()),
            field("u64", &AllScalars::u64, tagged()),
            field("f32", &AllScalars::f32, tagged()),
            field("f64", &AllScalars::f64, tagged()),
            field("flag", &AllScalars::flag, tagged()),
            field("text", &AllScalars::text, tagged()),
            field("bytes", &AllScalars::bytes, tagged()),
            field("ints", &AllScalars::ints, tagged()));
    }
};

template<>
struct Mapping<Player> {
    static auto members()
    {
        return nbtmap::members(
            field("name", &Player::name, tagged("Name")),
            field("level", &Player::level, tagged().hide_default()),
            field("settings", &Player::settings, tagged()),
            property("score", &Player::score, &Player::set_score, tagged("Score")),
            readonly("inventory", &Player::inventory_, tagged("Inventory")));
    }
};

template<>
struct Mapping<Config> {
    static auto members()
    {
        return nbtmap::members(
            static_field("version", &Config::version, tagged()),
            field("label", &Config::label, tagged()));
    }
};

template<>
struct Mapping<Node> {
    static auto members()
    {
        return nbtmap::members(
            field("label", &Node::label, tagged()),
            field("children", &Node::children, tagged()));
    }
};

template<>
struct Mapping<Awkward> {
    static auto members()
    {
        return nbtmap::members(
            field("precise", &Awkward::precise, tagged().hide_default()),
            field("by_id", &Awkward::by_id, tagged()),
            field("marker", &Awkward::marker, tagged()));
    }
};

template<>
struct Mapping<Holder> {
    static auto members()
    {
        return nbtmap::members(
            field("extra", &Holder::extra, tagged()),
            field("maybe", &Holder::maybe, tagged()),
            field("item", &Holder::item, tagged()));
    }
};

template<>
struct Mapping<Bag> {
    static auto members()
    {
        return nbtmap::members(
            readonly("items", &Bag::items, tagged()),
            readonly("counts", &Bag::counts, tagged()),
            readonly("settings", &Bag::settings, tagged()),
            readonly("fixed", &Bag::fixed, tagged()));
    }
};

} // namespace nbtmap
