#pragma once

#include <zerialize/dynamic.hpp>

#include <nbtmap/nbtmap.hpp>
#include <nbtmap/options.hpp>
#include <nbtmap/tag.hpp>

namespace nbtmap {

/*
 * Bridge between tag trees and zerialize's dynamic values, so a mapped
 * object can be handed to any zerialize protocol and dynamic data can be
 * read back into objects.
 */
zerialize::dyn::Value to_dynamic(const Tag& tag);
Tag from_dynamic(const zerialize::dyn::Value& value);

template<class T>
zerialize::dyn::Value object_to_dynamic(const T& value, const Options& options = default_options())
{
    return to_dynamic(serialize_object(value, options));
}

/*
 * Dynamic values only carry 64-bit numbers, so members are read with
 * widened_numbers set and narrowed back to their own kind.
 */
template<class T>
T object_from_dynamic(const zerialize::dyn::Value& value, const Options& options = default_options())
{
    Options widened = options;
    widened.widened_numbers = true;
    return deserialize_object<T>(from_dynamic(value), widened);
}

} // namespace nbtmap
