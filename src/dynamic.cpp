/*
 * dynamic.cpp
 * Conversion between nbtmap tag trees and zerialize dyn::Value trees
 */

#include <nbtmap/dynamic.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

namespace z = zerialize;

namespace nbtmap {

/*
 * Convert a List tag to a zerialize dyn::Value array
 */
static z::dyn::Value list_to_dynamic(const Tag& tag)
{
    z::dyn::Value::Array result_array;
    result_array.reserve(tag.size());

    for (const Tag& child : tag.children()) {
        result_array.push_back(to_dynamic(child));
    }

    return z::dyn::Value::array(std::move(result_array));
}

/*
 * Convert a Compound tag to a zerialize dyn::Value map, keeping child order
 */
static z::dyn::Value compound_to_dynamic(const Tag& tag)
{
    z::dyn::Value::Map entries;
    entries.reserve(tag.size());

    for (const Tag& child : tag.children()) {
        entries.emplace_back(*child.name(), to_dynamic(child));
    }

    return z::dyn::Value::map(std::move(entries));
}

/*
 * Convert any tag to a zerialize dyn::Value
 */
z::dyn::Value to_dynamic(const Tag& tag)
{
    switch (tag.type()) {
        case TagType::Byte:
            return z::dyn::Value(static_cast<int64_t>(tag.get<std::int8_t>()));

        case TagType::Short:
            return z::dyn::Value(static_cast<int64_t>(tag.get<std::int16_t>()));

        case TagType::Int:
            return z::dyn::Value(static_cast<int64_t>(tag.get<std::int32_t>()));

        case TagType::Long:
            return z::dyn::Value(tag.get<std::int64_t>());

        case TagType::Float:
            return z::dyn::Value(static_cast<double>(tag.get<float>()));

        case TagType::Double:
            return z::dyn::Value(tag.get<double>());

        case TagType::String:
            return z::dyn::Value(tag.get<std::string>());

        case TagType::ByteArray:
        {
            const ByteArray& bytes = tag.get<ByteArray>();
            std::vector<std::byte> blob(bytes.size());
            for (std::size_t i = 0; i < bytes.size(); i++) {
                blob[i] = static_cast<std::byte>(bytes[i]);
            }
            return z::dyn::Value(std::move(blob));
        }

        case TagType::IntArray:
        {
            // No int32 array in dyn::Value, widen element by element
            z::dyn::Value::Array result_array;
            for (std::int32_t value : tag.get<IntArray>()) {
                result_array.emplace_back(static_cast<int64_t>(value));
            }
            return z::dyn::Value::array(std::move(result_array));
        }

        case TagType::List:
            return list_to_dynamic(tag);

        case TagType::Compound:
            return compound_to_dynamic(tag);

        case TagType::End:
            break;
    }

    return z::dyn::Value();  // null value
}

/*
 * Convert a zerialize dyn::Value to a tag. Integers become Long, floating
 * point becomes Double, bool becomes a Byte of 0 or 1.
 * Nulls inside arrays and maps are skipped, there is no null tag.
 */
Tag from_dynamic(const z::dyn::Value& value)
{
    return std::visit([](const auto& arg) -> Tag {
        using T = std::remove_cvref_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            throw TypeMismatchError("null dynamic value has no tag representation");
        } else if constexpr (std::is_same_v<T, bool>) {
            return Tag::make(static_cast<std::int8_t>(arg ? 1 : 0));
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return Tag::make(arg);
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
            return Tag::make(static_cast<std::int64_t>(arg));
        } else if constexpr (std::is_same_v<T, double>) {
            return Tag::make(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return Tag::make(arg);
        } else if constexpr (std::is_same_v<T, std::vector<std::byte>>) {
            ByteArray bytes(arg.size());
            for (std::size_t i = 0; i < arg.size(); i++) {
                bytes[i] = std::to_integer<std::uint8_t>(arg[i]);
            }
            return Tag::make(std::move(bytes));
        } else if constexpr (std::is_same_v<T, z::dyn::Value::Array>) {
            Tag list = Tag::list();
            for (const auto& child : arg) {
                if (std::holds_alternative<std::monostate>(child.storage())) {
                    spdlog::debug("nbtmap: skipping null array element");
                    continue;
                }
                list.add(from_dynamic(child));
            }
            return list;
        } else if constexpr (std::is_same_v<T, z::dyn::Value::Map>) {
            Tag compound = Tag::compound();
            for (const auto& [key, child] : arg) {
                if (std::holds_alternative<std::monostate>(child.storage())) {
                    spdlog::debug("nbtmap: skipping null map entry '{}'", key);
                    continue;
                }
                Tag tag = from_dynamic(child);
                tag.set_name(key);
                compound.add(std::move(tag));
            }
            return compound;
        } else {
            throw UnsupportedTypeError("serializable dynamic values cannot be read into tags");
        }
    }, value.storage());
}

} // namespace nbtmap
