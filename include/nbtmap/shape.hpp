#pragma once

#include <optional>
#include <type_traits>
#include <utility>

#include <nbtmap/members.hpp>
#include <nbtmap/scalar.hpp>
#include <nbtmap/tag.hpp>

namespace nbtmap {

// How a static type is mapped. Computed once per type, checked in this order.
enum class Shape {
    AlreadyTag,
    Scalar,
    Optional,
    Sequence,
    Map,
    Record,
    Unsupported
};

template<class T>
struct is_optional : std::false_type {};

template<class T>
struct is_optional<std::optional<T>> : std::true_type {};

template<class T>
concept MapLike = requires(T& t) {
    typename T::key_type;
    typename T::mapped_type;
    t.clear();
    t.begin();
    t.end();
    t.size();
};

template<class T>
concept SequenceLike = !MapLike<T> && requires(T& t, typename T::value_type v) {
    t.clear();
    t.begin();
    t.end();
    t.size();
    t.insert(t.end(), std::move(v));
};

template<class T>
constexpr Shape shape_of()
{
    if constexpr (std::is_same_v<T, Tag>) {
        return Shape::AlreadyTag;
    } else if constexpr (is_scalar_v<T>) {
        return Shape::Scalar;
    } else if constexpr (is_optional<T>::value) {
        return Shape::Optional;
    } else if constexpr (SequenceLike<T>) {
        return Shape::Sequence;
    } else if constexpr (MapLike<T>) {
        return Shape::Map;
    } else if constexpr (Mapped<T>) {
        return Shape::Record;
    } else {
        return Shape::Unsupported;
    }
}

template<class T>
inline constexpr Shape shape_v = shape_of<std::remove_cvref_t<T>>();

} // namespace nbtmap
