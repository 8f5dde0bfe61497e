#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

#include <nbtmap/errors.hpp>
#include <nbtmap/tag.hpp>

namespace nbtmap {

/*
 * Tag kind a scalar type is stored as; End when T has no leaf representation.
 * Integers are stored by width, so signed and unsigned types of the same size
 * share a kind.
 */
template<class T>
constexpr TagType scalar_kind()
{
    if constexpr (std::is_same_v<T, bool>) {
        return TagType::Byte;
    } else if constexpr (std::is_integral_v<T>) {
        if constexpr (sizeof(T) == 1) return TagType::Byte;
        else if constexpr (sizeof(T) == 2) return TagType::Short;
        else if constexpr (sizeof(T) == 4) return TagType::Int;
        else if constexpr (sizeof(T) == 8) return TagType::Long;
        else return TagType::End;
    } else if constexpr (std::is_same_v<T, float>) {
        return TagType::Float;
    } else if constexpr (std::is_same_v<T, double>) {
        return TagType::Double;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return TagType::String;
    } else if constexpr (std::is_same_v<T, ByteArray>) {
        return TagType::ByteArray;
    } else if constexpr (std::is_same_v<T, IntArray>) {
        return TagType::IntArray;
    } else {
        return TagType::End;
    }
}

template<class T>
inline constexpr bool is_scalar_v = scalar_kind<T>() != TagType::End;

namespace detail {

// Signed storage type for an integer width
template<std::size_t Width> struct IntStorage;
template<> struct IntStorage<1> { using type = std::int8_t; };
template<> struct IntStorage<2> { using type = std::int16_t; };
template<> struct IntStorage<4> { using type = std::int32_t; };
template<> struct IntStorage<8> { using type = std::int64_t; };

} // namespace detail

template<class T>
Tag scalar_to_tag(const T& value)
{
    static_assert(is_scalar_v<T>, "type has no scalar tag kind");

    if constexpr (std::is_same_v<T, bool>) {
        return Tag::make(static_cast<std::int8_t>(value ? 1 : 0));
    } else if constexpr (std::is_integral_v<T>) {
        // Same-width conversion keeps the bit pattern
        return Tag::make(static_cast<typename detail::IntStorage<sizeof(T)>::type>(value));
    } else {
        return Tag::make(value);
    }
}

/*
 * Read a scalar back. The tag must carry exactly the kind T is stored as;
 * the signedness of integers comes from T, not from the tag.
 */
template<class T>
T scalar_from_tag(const Tag& tag)
{
    static_assert(is_scalar_v<T>, "type has no scalar tag kind");

    constexpr TagType kind = scalar_kind<T>();
    if (tag.type() != kind) {
        throw TypeMismatchError(std::string("expected ") + tag_type_name(kind) +
                                " tag, got " + tag_type_name(tag.type()));
    }

    if constexpr (std::is_same_v<T, bool>) {
        return tag.get<std::int8_t>() != 0;
    } else if constexpr (std::is_integral_v<T>) {
        return static_cast<T>(tag.get<typename detail::IntStorage<sizeof(T)>::type>());
    } else {
        return tag.get<T>();
    }
}

/*
 * Default used by hide-when-default: zero for arithmetic kinds, false for
 * bool. Nothing else has a default, so it is never elided.
 */
template<class T>
bool is_default_value(const T& value)
{
    if constexpr (std::is_arithmetic_v<T>) {
        return value == T{};
    } else {
        return false;
    }
}

} // namespace nbtmap
