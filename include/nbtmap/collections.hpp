#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <nbtmap/tag.hpp>

namespace nbtmap::detail {

/*
 * Sequence -> List tag. Empty sequences, and sequences whose elements all
 * map to nothing, produce no tag.
 */
template<class Walker, class Seq>
std::optional<Tag> sequence_to_tag(Walker& walker, std::optional<std::string_view> name, const Seq& seq)
{
    if (seq.size() == 0) {
        walker.elided("empty sequence");
        return std::nullopt;
    }

    Tag list = Tag::list();
    std::size_t index = 0;
    for (const auto& element : seq) {
        auto step = walker.enter_index(index++);
        if (auto child = walker.serialize(std::nullopt, element)) {
            list.add(std::move(*child));
        }
    }

    if (list.size() == 0) {
        return std::nullopt;
    }
    if (name) {
        list.set_name(std::string(*name));
    }
    return list;
}

/*
 * String-keyed map -> Compound tag. Any other key type cannot be named in
 * a compound, so the map is left out.
 */
template<class Walker, class Map>
std::optional<Tag> map_to_tag(Walker& walker, std::optional<std::string_view> name, const Map& map)
{
    if constexpr (!std::is_same_v<typename Map::key_type, std::string>) {
        walker.elided("map key type is not std::string");
        return std::nullopt;
    } else {
        if (map.size() == 0) {
            walker.elided("empty map");
            return std::nullopt;
        }

        Tag compound = Tag::compound();
        for (const auto& [key, value] : map) {
            auto step = walker.enter_key(key);
            if (auto child = walker.serialize(std::string_view(key), value)) {
                compound.add(std::move(*child));
            }
        }

        if (compound.size() == 0) {
            return std::nullopt;
        }
        if (name) {
            compound.set_name(std::string(*name));
        }
        return compound;
    }
}

// Appends every list child, converted to the element type, in tag order
template<class Walker, class Seq>
void fill_sequence(Walker& walker, Seq& seq, const Tag& tag)
{
    walker.expect(tag, TagType::List);

    using Element = typename Seq::value_type;
    std::size_t index = 0;
    for (const Tag& child : tag.children()) {
        auto step = walker.enter_index(index++);
        seq.insert(seq.end(), walker.template deserialize<Element>(child));
    }
}

// Inserts one entry per compound child, keyed by the child's name
template<class Walker, class Map>
void fill_map(Walker& walker, Map& map, const Tag& tag)
{
    if constexpr (!std::is_same_v<typename Map::key_type, std::string>) {
        walker.unsupported("map with a key type other than std::string");
    } else {
        walker.expect(tag, TagType::Compound);

        using Value = typename Map::mapped_type;
        for (const Tag& child : tag.children()) {
            const std::string& key = *child.name();
            auto step = walker.enter_key(key);
            map.emplace(key, walker.template deserialize<Value>(child));
        }
    }
}

} // namespace nbtmap::detail
