#pragma once

#include <cstddef>

namespace nbtmap {

struct Options {
    // Nesting limit for a single serialize/deserialize/fill call
    std::size_t max_depth;

    // Read Long and Double tags into narrower integer and float members,
    // and a list of Longs into an IntArray. Values out of range still fail.
    bool widened_numbers = false;
};

// Built once; NBTMAP_MAX_DEPTH overrides the depth limit
const Options& default_options();

} // namespace nbtmap
