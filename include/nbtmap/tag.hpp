#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <nbtmap/errors.hpp>

namespace nbtmap {

// Tag ids, numbered as in NBT
enum class TagType : std::uint8_t {
    End = 0,
    Byte = 1,
    Short = 2,
    Int = 3,
    Long = 4,
    Float = 5,
    Double = 6,
    ByteArray = 7,
    String = 8,
    List = 9,
    Compound = 10,
    IntArray = 11
};

const char* tag_type_name(TagType type);

class Tag;

using ByteArray = std::vector<std::uint8_t>;
using IntArray = std::vector<std::int32_t>;

struct ListPayload {
    TagType element = TagType::End;
    std::vector<Tag> items;
};

struct CompoundPayload {
    std::vector<Tag> items;
};

bool operator==(const ListPayload& a, const ListPayload& b);
bool operator==(const CompoundPayload& a, const CompoundPayload& b);

namespace detail {

template<class V>
inline constexpr bool is_leaf_payload_v =
    std::is_same_v<V, std::int8_t> || std::is_same_v<V, std::int16_t> ||
    std::is_same_v<V, std::int32_t> || std::is_same_v<V, std::int64_t> ||
    std::is_same_v<V, float> || std::is_same_v<V, double> ||
    std::is_same_v<V, ByteArray> || std::is_same_v<V, std::string> ||
    std::is_same_v<V, IntArray>;

template<class V>
inline constexpr bool is_payload_v =
    is_leaf_payload_v<V> || std::is_same_v<V, ListPayload> || std::is_same_v<V, CompoundPayload>;

} // namespace detail

/*
 * A node of the tag tree.
 *
 * Scalars hold one value, List holds unnamed children of a single tag type,
 * Compound holds uniquely named children in insertion order. The name only
 * matters when the tag is the child of a compound.
 */
class Tag {
public:
    // Alternative index == TagType id
    using Payload = std::variant<
        std::monostate,
        std::int8_t,
        std::int16_t,
        std::int32_t,
        std::int64_t,
        float,
        double,
        ByteArray,
        std::string,
        ListPayload,
        CompoundPayload,
        IntArray
    >;

    Tag() = default;

    // Leaf tags only; containers start from list()/compound() and grow by add()
    template<class V>
        requires detail::is_leaf_payload_v<V>
    static Tag make(V value) {
        Tag tag;
        tag.payload_ = std::move(value);
        return tag;
    }

    static Tag make(const char* value) { return make(std::string(value)); }

    static Tag list(TagType element = TagType::End);
    static Tag compound();

    TagType type() const { return static_cast<TagType>(payload_.index()); }
    bool is_list() const { return type() == TagType::List; }
    bool is_compound() const { return type() == TagType::Compound; }
    bool is_container() const { return is_list() || is_compound(); }

    const std::optional<std::string>& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }
    void clear_name() { name_.reset(); }

    template<class V>
    const V& get() const {
        static_assert(detail::is_payload_v<V>, "not a tag payload type");
        if (const V* value = std::get_if<V>(&payload_)) {
            return *value;
        }
        throw TagError(std::string("tag is ") + tag_type_name(type()) + ", not the requested kind");
    }

    // Element type of a list; End while the list is still empty
    TagType list_type() const;

    std::size_t size() const;
    const std::vector<Tag>& children() const;
    const Tag& at(std::size_t index) const;

    // Compound children need a name that is not taken yet; list children
    // must match the element type and lose their name.
    void add(Tag child);

    const Tag* find(std::string_view name) const;
    bool contains(std::string_view name) const { return find(name) != nullptr; }
    const Tag& operator[](std::string_view name) const;

    // Removes all children, a list also forgets its element type
    void clear();

    const Payload& payload() const { return payload_; }

    friend bool operator==(const Tag& a, const Tag& b);

private:
    std::vector<Tag>& items();
    const std::vector<Tag>& items() const;

    std::optional<std::string> name_;
    Payload payload_;
};

} // namespace nbtmap
