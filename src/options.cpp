/*
 * options.cpp
 * Default mapper options, read once from the environment
 */

#include <nbtmap/options.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace nbtmap {

static constexpr std::size_t kDefaultMaxDepth = 512;

static std::size_t max_depth_from_env()
{
    const char* raw = std::getenv("NBTMAP_MAX_DEPTH");
    if (raw == nullptr || *raw == '\0') {
        return kDefaultMaxDepth;
    }

    try {
        std::size_t pos = 0;
        unsigned long long value = std::stoull(raw, &pos);
        if (pos == std::string(raw).size() && value > 0) {
            return static_cast<std::size_t>(value);
        }
    } catch (const std::logic_error&) {
        // falls through to the warning below
    }

    spdlog::warn("ignoring NBTMAP_MAX_DEPTH='{}', using {}", raw, kDefaultMaxDepth);
    return kDefaultMaxDepth;
}

const Options& default_options()
{
    static const Options options{max_depth_from_env()};
    return options;
}

} // namespace nbtmap
