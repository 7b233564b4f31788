/// @file apply_steps.hpp
/// @brief In-place patch operation steps shared by apply and render.
///
/// Internal header, not installed.

#pragma once

#include <spatch/error.hpp>
#include <spatch/options.hpp>
#include <spatch/patch.hpp>
#include <spatch/result.hpp>
#include <spatch/value.hpp>

#include <optional>

namespace spatch::detail {

class IdentityCache;

// Each step takes an optional IdentityCache that answers its selector
// lookups and is told about the edits it makes.

/// Add `value` at `path` in place.
auto add_value(Value& doc, const Path& path, Value value, const Options& options,
               IdentityCache* cache = nullptr) -> std::optional<Error>;

/// Remove the value at `path` in place and return it.
auto remove_value(Value& doc, const Path& path, const Options& options,
                  IdentityCache* cache = nullptr) -> Result<Value>;

/// Check that moving `from` to `path` is allowed. Returns true when the
/// move leaves the document unchanged.
auto check_move(const Value& doc, const Path& from, const Path& path, const Options& options,
                IdentityCache* cache = nullptr) -> Result<bool>;

/// Apply one operation to `doc` in place. On failure `doc` may be left
/// partially modified; callers work on a private copy.
auto apply_op(Value& doc, const PatchOp& op, const Options& options,
              IdentityCache* cache = nullptr) -> std::optional<Error>;

}  // namespace spatch::detail
