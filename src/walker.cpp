/*
 * walker.cpp
 * Path tracking, depth limit and diagnostics of the tree walker
 */

#include <nbtmap/walker.hpp>

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace nbtmap::detail {

Walker::Step::Step(Walker& walker, std::string segment)
    : walker_(walker)
{
    if (walker_.path_.size() >= walker_.options_.max_depth) {
        throw DepthLimitError("nesting deeper than " + std::to_string(walker_.options_.max_depth) +
                              " levels at '" + walker_.path() + "'");
    }
    walker_.path_.push_back(std::move(segment));
}

Walker::Step::~Step()
{
    walker_.path_.pop_back();
}

Walker::Step Walker::enter_member(std::string_view name)
{
    return Step(*this, std::string(name));
}

Walker::Step Walker::enter_index(std::size_t index)
{
    return Step(*this, "[" + std::to_string(index) + "]");
}

Walker::Step Walker::enter_key(std::string_view key)
{
    return Step(*this, std::string(key));
}

std::string Walker::path() const
{
    if (path_.empty()) {
        return "<root>";
    }

    std::string result;
    for (const auto& segment : path_) {
        // Indices attach to the segment before them
        if (!result.empty() && (segment.empty() || segment.front() != '[')) {
            result += '.';
        }
        result += segment;
    }
    return result;
}

void Walker::expect(const Tag& tag, TagType type) const
{
    if (tag.type() != type) {
        throw TypeMismatchError("at '" + path() + "': expected " + tag_type_name(type) +
                                " tag, got " + tag_type_name(tag.type()));
    }
}

void Walker::unsupported(std::string_view what) const
{
    throw UnsupportedTypeError("at '" + path() + "': " + std::string(what));
}

void Walker::elided(std::string_view reason) const
{
    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("nbtmap: nothing written for '{}': {}", path(), reason);
    }
}

} // namespace nbtmap::detail
