#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <nbtmap/collections.hpp>
#include <nbtmap/members.hpp>
#include <nbtmap/options.hpp>
#include <nbtmap/scalar.hpp>
#include <nbtmap/shape.hpp>
#include <nbtmap/tag.hpp>

namespace nbtmap::detail {

/*
 * Recursive walk over an object graph and a tag tree in lockstep.
 * One Walker serves one top-level call; it tracks the current path for
 * error messages and enforces the depth limit.
 */
class Walker {
public:
    explicit Walker(const Options& options) : options_(options) {}

    // One level down the tree, popped again on destruction
    class Step {
    public:
        Step(Walker& walker, std::string segment);
        ~Step();

        Step(const Step&) = delete;
        Step& operator=(const Step&) = delete;

    private:
        Walker& walker_;
    };

    Step enter_member(std::string_view name);
    Step enter_index(std::size_t index);
    Step enter_key(std::string_view key);

    // Dotted path of the current position, e.g. "inventory[2].count"
    std::string path() const;

    void expect(const Tag& tag, TagType type) const;
    [[noreturn]] void unsupported(std::string_view what) const;
    void elided(std::string_view reason) const;

    template<class T>
    std::optional<Tag> serialize(std::optional<std::string_view> name, const T& value);

    template<class T>
    T deserialize(const Tag& tag);

    template<class T>
    void fill(T& value, const Tag& tag);

private:
    template<class T>
    std::optional<Tag> serialize_record(std::optional<std::string_view> name, const T& value);

    template<class T>
    void populate(T& target, const Tag& tag);

    template<class T>
    T narrow(const Tag& tag);

    const Options& options_;
    std::vector<std::string> path_;
};

template<class T>
std::optional<Tag> Walker::serialize(std::optional<std::string_view> name, const T& value)
{
    constexpr Shape shape = shape_v<T>;

    if constexpr (shape == Shape::AlreadyTag) {
        // Pre-built tags are embedded as they are, under the member's name
        if (value.type() == TagType::End) {
            elided("End tag");
            return std::nullopt;
        }
        Tag tag = value;
        if (name) {
            tag.set_name(std::string(*name));
        }
        return tag;
    } else if constexpr (shape == Shape::Scalar) {
        Tag tag = scalar_to_tag(value);
        if (name) {
            tag.set_name(std::string(*name));
        }
        return tag;
    } else if constexpr (shape == Shape::Optional) {
        if (!value) {
            elided("empty optional");
            return std::nullopt;
        }
        return serialize(name, *value);
    } else if constexpr (shape == Shape::Sequence) {
        return sequence_to_tag(*this, name, value);
    } else if constexpr (shape == Shape::Map) {
        return map_to_tag(*this, name, value);
    } else if constexpr (shape == Shape::Record) {
        return serialize_record(name, value);
    } else {
        elided("type has no tag representation");
        return std::nullopt;
    }
}

template<class T>
std::optional<Tag> Walker::serialize_record(std::optional<std::string_view> name, const T& value)
{
    Tag compound = Tag::compound();

    for_each_member(members_of<T>(), [&](const auto& member) {
        if (!member.mapped()) {
            return;
        }

        auto step = enter_member(member.exported_name());
        decltype(auto) current = member.read(value);
        if (member.hide_when_default() && is_default_value(current)) {
            elided("default value");
            return;
        }
        if (auto child = serialize(member.exported_name(), current)) {
            compound.add(std::move(*child));
        }
    });

    // Records without a single written member vanish from their parent too
    if (compound.size() == 0) {
        elided("record has no values to write");
        return std::nullopt;
    }
    if (name) {
        compound.set_name(std::string(*name));
    }
    return compound;
}

template<class T>
T Walker::deserialize(const Tag& tag)
{
    constexpr Shape shape = shape_v<T>;

    if constexpr (shape == Shape::AlreadyTag) {
        Tag copy = tag;
        copy.clear_name();
        return copy;
    } else if constexpr (shape == Shape::Scalar) {
        if (options_.widened_numbers && tag.type() != scalar_kind<T>()) {
            return narrow<T>(tag);
        }
        expect(tag, scalar_kind<T>());
        return scalar_from_tag<T>(tag);
    } else if constexpr (shape == Shape::Optional) {
        return T(deserialize<typename T::value_type>(tag));
    } else if constexpr (shape == Shape::Sequence) {
        T result{};
        fill_sequence(*this, result, tag);
        return result;
    } else if constexpr (shape == Shape::Map) {
        T result{};
        fill_map(*this, result, tag);
        return result;
    } else if constexpr (shape == Shape::Record) {
        T result{};
        populate(result, tag);
        return result;
    } else {
        unsupported("type has no tag representation");
    }
}

template<class T>
void Walker::fill(T& value, const Tag& tag)
{
    constexpr Shape shape = shape_v<T>;

    if constexpr (shape == Shape::AlreadyTag) {
        value = tag;
        value.clear_name();
    } else if constexpr (shape == Shape::Scalar) {
        // Nothing to fill inside a scalar
    } else if constexpr (shape == Shape::Optional) {
        if (value) {
            fill(*value, tag);
        } else {
            value.emplace(deserialize<typename T::value_type>(tag));
        }
    } else if constexpr (shape == Shape::Sequence) {
        expect(tag, TagType::List);
        value.clear();
        fill_sequence(*this, value, tag);
    } else if constexpr (shape == Shape::Map) {
        // The map is only cleared once the refill is known to be possible
        if constexpr (!std::is_same_v<typename T::key_type, std::string>) {
            unsupported("map with a key type other than std::string");
        } else {
            expect(tag, TagType::Compound);
            value.clear();
            fill_map(*this, value, tag);
        }
    } else if constexpr (shape == Shape::Record) {
        populate(value, tag);
    } else {
        unsupported("type has no tag representation");
    }
}

/*
 * Scalar from a tag of a wider kind. Integers must fit the signed or the
 * unsigned range of T's width, since either may have been stored there.
 */
template<class T>
T Walker::narrow(const Tag& tag)
{
    if constexpr (std::is_same_v<T, bool>) {
        expect(tag, TagType::Long);
        return tag.get<std::int64_t>() != 0;
    } else if constexpr (std::is_integral_v<T>) {
        expect(tag, TagType::Long);
        std::int64_t wide = tag.get<std::int64_t>();
        if constexpr (sizeof(T) < sizeof(std::int64_t)) {
            using Signed = typename IntStorage<sizeof(T)>::type;
            using Unsigned = std::make_unsigned_t<Signed>;
            if (wide < std::numeric_limits<Signed>::min() ||
                wide > static_cast<std::int64_t>(std::numeric_limits<Unsigned>::max())) {
                throw TypeMismatchError("at '" + path() + "': " + std::to_string(wide) +
                                        " does not fit a " + tag_type_name(scalar_kind<T>()) + " tag");
            }
        }
        return static_cast<T>(wide);
    } else if constexpr (std::is_same_v<T, float>) {
        expect(tag, TagType::Double);
        return static_cast<float>(tag.get<double>());
    } else if constexpr (std::is_same_v<T, IntArray>) {
        expect(tag, TagType::List);
        IntArray result;
        result.reserve(tag.size());
        std::size_t index = 0;
        for (const Tag& child : tag.children()) {
            auto step = enter_index(index++);
            result.push_back(narrow<std::int32_t>(child));
        }
        return result;
    } else {
        expect(tag, scalar_kind<T>());
        return scalar_from_tag<T>(tag);
    }
}

/*
 * Copy every mapped member present in the compound into target.
 * Members with a mutator are replaced, the others are filled in place.
 * Members missing from the compound keep whatever the constructor set.
 */
template<class T>
void Walker::populate(T& target, const Tag& tag)
{
    expect(tag, TagType::Compound);

    for_each_member(members_of<T>(), [&](const auto& member) {
        if (!member.mapped()) {
            return;
        }

        const Tag* child = tag.find(member.exported_name());
        if (child == nullptr) {
            return;
        }

        auto step = enter_member(member.exported_name());
        using Member = std::remove_cvref_t<decltype(member)>;
        using Value = typename Member::value_type;
        if constexpr (Member::replaceable) {
            member.assign(target, deserialize<Value>(*child));
        } else {
            fill(member.mutate(target), *child);
        }
    });
}

} // namespace nbtmap::detail
