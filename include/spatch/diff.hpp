/// @file diff.hpp
/// @brief Structural diff of two documents into a Patch.

#pragma once

#include <spatch/options.hpp>
#include <spatch/patch.hpp>
#include <spatch/result.hpp>
#include <spatch/schema_index.hpp>
#include <spatch/value.hpp>

namespace spatch {

/// Compute the operations that turn `old_value` into `new_value`.
///
/// Arrays whose Location carries an indexKey in `schema` are matched by
/// identity and addressed with `[field=value]` selectors; all other arrays
/// are compared index by index. The output is deterministic and applying
/// it to `old_value` yields a document JSON-equal to `new_value`.
///
/// Fails with identity_conflict when a keyed array repeats an identity
/// value, and depth_limit_exceeded past `options.max_depth`.
///
/// @code
/// auto old_doc = Value::parse(R"({"a": 1, "b": [1, 2]})");
/// auto new_doc = Value::parse(R"({"a": 2, "b": [1]})");
/// auto ops = compute_diff(old_doc, new_doc).value();
/// // [replace /a 2, remove /b/1]
/// @endcode
auto compute_diff(const Value& old_value, const Value& new_value,
                  const SchemaIndex* schema = nullptr,
                  const Options& options = {}) -> Result<Patch>;

}  // namespace spatch
