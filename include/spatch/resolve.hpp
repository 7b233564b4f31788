/// @file resolve.hpp
/// @brief Resolve plain or semantic paths against a document.

#pragma once

#include <spatch/options.hpp>
#include <spatch/path.hpp>
#include <spatch/result.hpp>
#include <spatch/schema_index.hpp>
#include <spatch/value.hpp>

#include <string_view>

namespace spatch {

/// A resolved location inside a document.
struct Resolved {
    /// The target, pointing into the document passed to resolve().
    const Value* value{nullptr};

    /// The same location written with keys and indices only.
    Path positional;

    /// The same location with identity selectors wherever the schema keys
    /// the traversed array and the element's key value is unique.
    Path semantic;
};

/// Walk `path` through `root`.
///
/// Fails with not_found, ambiguous, type_mismatch, index_out_of_range or
/// invalid_use (Append is only meaningful as the last segment of an add
/// target), and depth_limit_exceeded for paths deeper than
/// `options.max_depth`.
auto resolve(const Value& root, const Path& path,
             const SchemaIndex* schema = nullptr,
             const Options& options = {}) -> Result<Resolved>;

/// A copy of the value at `path`.
auto query(const Value& root, const Path& path,
           const SchemaIndex* schema = nullptr,
           const Options& options = {}) -> Result<Value>;

/// Parse `path` and return a copy of the value there.
auto query(const Value& root, std::string_view path,
           const SchemaIndex* schema = nullptr,
           const Options& options = {}) -> Result<Value>;

/// The value at `path`, or nullptr if it does not resolve.
auto find(const Value& root, const Path& path) -> const Value*;

}  // namespace spatch
