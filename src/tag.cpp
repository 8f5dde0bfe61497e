/*
 * tag.cpp
 * Tag tree node: containers, lookup and equality
 */

#include <nbtmap/tag.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace nbtmap {

const char* tag_type_name(TagType type)
{
    switch (type) {
        case TagType::End:       return "End";
        case TagType::Byte:      return "Byte";
        case TagType::Short:     return "Short";
        case TagType::Int:       return "Int";
        case TagType::Long:      return "Long";
        case TagType::Float:     return "Float";
        case TagType::Double:    return "Double";
        case TagType::ByteArray: return "ByteArray";
        case TagType::String:    return "String";
        case TagType::List:      return "List";
        case TagType::Compound:  return "Compound";
        case TagType::IntArray:  return "IntArray";
    }
    return "Unknown";
}

bool operator==(const ListPayload& a, const ListPayload& b)
{
    return a.element == b.element && a.items == b.items;
}

bool operator==(const CompoundPayload& a, const CompoundPayload& b)
{
    return a.items == b.items;
}

bool operator==(const Tag& a, const Tag& b)
{
    return a.name_ == b.name_ && a.payload_ == b.payload_;
}

Tag Tag::list(TagType element)
{
    Tag tag;
    tag.payload_ = ListPayload{element, {}};
    return tag;
}

Tag Tag::compound()
{
    Tag tag;
    tag.payload_ = CompoundPayload{};
    return tag;
}

TagType Tag::list_type() const
{
    return get<ListPayload>().element;
}

/*
 * Children of either container kind, TagError for scalars
 */
std::vector<Tag>& Tag::items()
{
    if (auto* list = std::get_if<ListPayload>(&payload_)) {
        return list->items;
    }
    if (auto* compound = std::get_if<CompoundPayload>(&payload_)) {
        return compound->items;
    }
    throw TagError(std::string(tag_type_name(type())) + " tag has no children");
}

const std::vector<Tag>& Tag::items() const
{
    if (const auto* list = std::get_if<ListPayload>(&payload_)) {
        return list->items;
    }
    if (const auto* compound = std::get_if<CompoundPayload>(&payload_)) {
        return compound->items;
    }
    throw TagError(std::string(tag_type_name(type())) + " tag has no children");
}

const std::vector<Tag>& Tag::children() const
{
    return items();
}

std::size_t Tag::size() const
{
    return children().size();
}

const Tag& Tag::at(std::size_t index) const
{
    const auto& list = children();
    if (index >= list.size()) {
        throw TagError("child index " + std::to_string(index) + " out of range");
    }
    return list[index];
}

void Tag::add(Tag child)
{
    if (child.type() == TagType::End) {
        throw TagError("End tags cannot be added to a container");
    }

    if (auto* list = std::get_if<ListPayload>(&payload_)) {
        if (list->element == TagType::End && list->items.empty()) {
            list->element = child.type();
        } else if (list->element != child.type()) {
            throw TagError(std::string("list of ") + tag_type_name(list->element) +
                           " cannot hold " + tag_type_name(child.type()));
        }
        child.clear_name();
        list->items.push_back(std::move(child));
        return;
    }

    auto* compound = std::get_if<CompoundPayload>(&payload_);
    if (compound == nullptr) {
        throw TagError(std::string(tag_type_name(type())) + " tag has no children");
    }
    if (!child.name_) {
        throw TagError("compound children must be named");
    }
    if (find(*child.name_) != nullptr) {
        throw TagError("compound already has a child named '" + *child.name_ + "'");
    }
    compound->items.push_back(std::move(child));
}

const Tag* Tag::find(std::string_view name) const
{
    const auto* compound = std::get_if<CompoundPayload>(&payload_);
    if (compound == nullptr) {
        throw TagError(std::string("name lookup on a ") + tag_type_name(type()) + " tag");
    }

    auto it = std::find_if(compound->items.begin(), compound->items.end(),
                           [name](const Tag& child) { return child.name_ && *child.name_ == name; });
    return it == compound->items.end() ? nullptr : &*it;
}

const Tag& Tag::operator[](std::string_view name) const
{
    const Tag* child = find(name);
    if (child == nullptr) {
        throw TagError("no child named '" + std::string(name) + "'");
    }
    return *child;
}

void Tag::clear()
{
    items().clear();
    if (auto* list = std::get_if<ListPayload>(&payload_)) {
        list->element = TagType::End;
    }
}

} // namespace nbtmap
