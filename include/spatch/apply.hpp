/// @file apply.hpp
/// @brief Apply a Patch to a document.

#pragma once

#include <spatch/options.hpp>
#include <spatch/patch.hpp>
#include <spatch/result.hpp>
#include <spatch/value.hpp>

namespace spatch {

/// Apply `patch` to a copy of `root` and return the result.
///
/// Operations run in order, each against the result of the previous one.
/// Paths may be plain pointers or semantic paths; selectors are resolved
/// against the document as it stands when their operation runs. The call
/// is all-or-nothing: `root` is never modified and on the first failing
/// operation the error is returned and no document is produced.
///
/// `Patch` is a `std::vector`, so an unqualified two-argument call also
/// finds `std::apply` by argument-dependent lookup. Call it as
/// `spatch::apply` when `using namespace spatch` is in effect.
auto apply(const Value& root, const Patch& patch, const Options& options = {}) -> Result<Value>;

}  // namespace spatch
