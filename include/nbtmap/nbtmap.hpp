#pragma once

#include <stdexcept>
#include <string>

#include <nbtmap/errors.hpp>
#include <nbtmap/members.hpp>
#include <nbtmap/options.hpp>
#include <nbtmap/shape.hpp>
#include <nbtmap/tag.hpp>
#include <nbtmap/walker.hpp>

namespace nbtmap {

/*
 * Serialize a record into an unnamed compound tag.
 * A record whose members all elide gives an empty compound. Values that do
 * not map to a compound (scalars, sequences, ...) are rejected.
 */
template<class T>
Tag serialize_object(const T& value, const Options& options = default_options())
{
    constexpr Shape shape = shape_v<T>;

    detail::Walker walker(options);
    auto tag = walker.serialize(std::nullopt, value);

    if (!tag) {
        if constexpr (shape == Shape::Record || shape == Shape::Map) {
            return Tag::compound();
        } else {
            throw TypeMismatchError("root value produced no tag");
        }
    }
    if (!tag->is_compound()) {
        throw TypeMismatchError(std::string("root value maps to a ") + tag_type_name(tag->type()) +
                                " tag, not a Compound");
    }
    return std::move(*tag);
}

template<class T>
Tag serialize_object(T* value, const Options& options = default_options())
{
    if (value == nullptr) {
        throw std::invalid_argument("serialize_object: value is null");
    }
    return serialize_object(*value, options);
}

// Build a fresh T from a tag
template<class T>
T deserialize_object(const Tag& tag, const Options& options = default_options())
{
    detail::Walker walker(options);
    return walker.deserialize<T>(tag);
}

/*
 * Populate an existing object in place. Collections are cleared and
 * refilled, records get the members present in the tag.
 */
template<class T>
void fill_object(T& value, const Tag& tag, const Options& options = default_options())
{
    detail::Walker walker(options);
    walker.fill(value, tag);
}

template<class T>
void fill_object(T* value, const Tag& tag, const Options& options = default_options())
{
    if (value == nullptr) {
        throw std::invalid_argument("fill_object: value is null");
    }
    fill_object(*value, tag, options);
}

} // namespace nbtmap
