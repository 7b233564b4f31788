/// @file schema_index.hpp
/// @brief SchemaIndex: which arrays are identity-keyed, and by which field.

#pragma once

#include <spatch/result.hpp>
#include <spatch/value.hpp>

#include <compare>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace spatch {

/// Wildcard step standing for "any element of an array".
struct AnyIndex {
    auto operator<=>(const AnyIndex&) const = default;
};

/// One step of a Location: an object member name or AnyIndex.
using LocationStep = std::variant<std::string, AnyIndex>;

/// The schema position of a node: member names plus AnyIndex wildcards.
/// `/list/0/tags` and `/list/5/tags` share the Location `/list/*/tags`.
using Location = std::vector<LocationStep>;

/// Text form of a Location for messages, e.g. "/list/*/tags".
auto to_string(const Location& location) -> std::string;

/// Immutable mapping from Location to identity field name, built once from
/// a JSON Schema whose array nodes may carry `"indexKey": "<field>"`.
///
/// Only `properties` (member schemas) and `items` (single element schema)
/// are followed. Arrays reachable through anything else get no entry and
/// are diffed positionally.
///
/// @code
/// auto schema = Value::parse(R"({
///     "type": "object",
///     "properties": {"list": {"type": "array", "indexKey": "id"}}
/// })");
/// auto index = SchemaIndex::build(schema).value();
/// index.lookup({std::string{"list"}});  // "id"
/// @endcode
class SchemaIndex {
public:
    SchemaIndex() = default;

    /// Walk `schema` and record every indexKey.
    /// Fails with ErrorKind::invalid_index_key if an indexKey is not a
    /// non-empty string or sits on a node whose `type` excludes "array".
    static auto build(const Value& schema) -> Result<SchemaIndex>;

    /// The identity field declared for the array at `location`, if any.
    auto lookup(const Location& location) const -> std::optional<std::string>;

    auto size() const noexcept -> std::size_t { return entries_.size(); }
    auto empty() const noexcept -> bool { return entries_.empty(); }
    auto entries() const noexcept -> const std::map<Location, std::string>& { return entries_; }

    auto operator==(const SchemaIndex&) const -> bool = default;

private:
    std::map<Location, std::string> entries_;
};

}  // namespace spatch
