#ifndef SYMALG_CONFIG_HPP
#define SYMALG_CONFIG_HPP

#include <cstddef>

#include <fmt/format.h>

#include <symalg/error.hpp>

#define SYMALG_VERSION_MAJOR 0
#define SYMALG_VERSION_MINOR 1
#define SYMALG_VERSION_PATCH 0

namespace symalg {

// --- Limits shared by every recursive algorithm ---

struct Options {
    // Deepest tree any traversal will descend into.
    std::size_t max_depth{2048};
    // Whole-tree simplification passes before giving up on a fixed point.
    int max_passes{64};
};

namespace detail {

inline void check_depth(std::size_t depth, std::size_t max_depth) {
    if (depth > max_depth)
        throw depth_error(fmt::format(
            "expression is deeper than the limit of {} levels", max_depth));
}

} // namespace detail

} // namespace symalg

#endif // SYMALG_CONFIG_HPP
