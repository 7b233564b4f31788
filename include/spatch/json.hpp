/// @file json.hpp
/// @brief RFC 6902 encoding and decoding, and the JSON-level pipelines.
///
/// Provides ADL serialization (to_json/from_json) for Path, PatchOp and
/// Options, rendering of a Patch as an RFC 6902 document with semantic or
/// positional paths, and decoding of RFC 6902 documents.

#pragma once

#include <spatch/options.hpp>
#include <spatch/patch.hpp>
#include <spatch/path.hpp>
#include <spatch/result.hpp>
#include <spatch/schema_index.hpp>
#include <spatch/value.hpp>

namespace spatch {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================
//
// from_json overloads throw spatch::Exception on malformed input.

void to_json(Value& j, const Path& path);
void from_json(const Value& j, Path& path);

void to_json(Value& j, const PatchOp& op);
void from_json(const Value& j, PatchOp& op);

void to_json(Value& j, const Options& options);
void from_json(const Value& j, Options& options);

// =============================================================================
// RFC 6902 documents
// =============================================================================

/// Render `patch` as an RFC 6902 array.
///
/// The operations are replayed on a copy of `old_value`. Paths naming an
/// existing location are written as the resolver's semantic path when
/// `schema` is given and positionally otherwise; add, move and copy
/// targets get their parent written the same way and keep their final
/// segment. Fails if an operation does not apply to `old_value`.
auto render(const Patch& patch, const SchemaIndex* schema, const Value& old_value,
            const Options& options = {}) -> Result<Value>;

/// Decode an RFC 6902 array. Structural problems are invalid_patch; path
/// syntax errors keep their parse kind.
auto decode(const Value& patch) -> Result<Patch>;

/// compute_diff followed by render.
auto diff_patch(const Value& old_value, const Value& new_value,
                const SchemaIndex* schema = nullptr,
                const Options& options = {}) -> Result<Value>;

/// decode followed by apply.
auto apply_patch(const Value& doc, const Value& patch, const Options& options = {})
    -> Result<Value>;

}  // namespace spatch
