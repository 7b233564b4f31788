/// @file patch.hpp
/// @brief Patch operation types (RFC 6902 with semantic paths).

#pragma once

#include <spatch/path.hpp>
#include <spatch/value.hpp>

#include <string_view>
#include <variant>
#include <vector>

namespace spatch {

/// Insert `value` at `path` (or overwrite an object member).
struct PatchAdd {
    Path path;    ///< Target; the last segment may be an index, "-" or a selector.
    Value value;  ///< The value to insert.
    auto operator==(const PatchAdd&) const -> bool = default;
};

/// Remove the value at `path`.
struct PatchRemove {
    Path path;
    auto operator==(const PatchRemove&) const -> bool = default;
};

/// Replace the existing value at `path`.
struct PatchReplace {
    Path path;
    Value value;
    auto operator==(const PatchReplace&) const -> bool = default;
};

/// Remove the value at `from` and add it at `path`.
struct PatchMove {
    Path from;  ///< Source; must exist.
    Path path;  ///< Target, evaluated after the removal.
    auto operator==(const PatchMove&) const -> bool = default;
};

/// Add a deep copy of the value at `from` at `path`.
struct PatchCopy {
    Path from;
    Path path;
    auto operator==(const PatchCopy&) const -> bool = default;
};

/// Assert that the value at `path` equals `value`.
struct PatchTest {
    Path path;
    Value value;
    auto operator==(const PatchTest&) const -> bool = default;
};

/// One patch operation.
using PatchOp = std::variant<
    PatchAdd,
    PatchRemove,
    PatchReplace,
    PatchMove,
    PatchCopy,
    PatchTest
>;

/// An ordered list of operations, applied front to back.
using Patch = std::vector<PatchOp>;

/// The RFC 6902 "op" name: "add", "remove", "replace", "move", "copy", "test".
auto op_name(const PatchOp& op) noexcept -> std::string_view;

/// The operation's target path.
auto target_path(const PatchOp& op) noexcept -> const Path&;

}  // namespace spatch
