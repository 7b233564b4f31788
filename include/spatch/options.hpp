/// @file options.hpp
/// @brief Tunables shared by diff, resolve, apply and render.

#pragma once

#include <cstddef>

namespace spatch {

/// Options accepted by every traversing operation.
///
/// Defaults are suitable for most documents; pass a customised instance
/// by const reference to tighten the depth bound or change how the diff
/// engine spells appends.
struct Options {
    /// Maximum nesting depth walked by diff, resolve and apply.
    /// Deeper documents fail with ErrorKind::depth_limit_exceeded.
    std::size_t max_depth{512};

    /// When true, the diff engine addresses inserts at the current end of
    /// an array with "-" instead of the numeric index.
    bool append_marker{true};

    auto operator==(const Options&) const -> bool = default;
};

}  // namespace spatch
