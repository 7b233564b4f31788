/// @file path.hpp
/// @brief Semantic paths: RFC 6901 JSON Pointers extended with identity selectors.

#pragma once

#include <spatch/result.hpp>
#include <spatch/value.hpp>

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace spatch {

/// An object member name.
struct Key {
    std::string name;
    auto operator==(const Key&) const -> bool = default;
};

/// An array position.
struct Index {
    std::size_t value{0};
    auto operator==(const Index&) const -> bool = default;
};

/// An array element selected by the value of one of its fields,
/// written `[field=value]`. The value is a JSON scalar.
struct Identity {
    std::string field;
    Value value;
    auto operator==(const Identity&) const -> bool = default;
};

/// The array tail marker `-`: the position one past the last element.
struct Append {
    auto operator==(const Append&) const -> bool = default;
};

/// One step of a Path.
using Segment = std::variant<Key, Index, Identity, Append>;

/// Parse an RFC 6901 array index token: "0" or digits without a leading
/// zero. Returns nullopt for anything else, including overflow.
auto try_parse_index(std::string_view token) -> std::optional<std::size_t>;

/// Escape a token for RFC 6901: ~ -> ~0, / -> ~1.
auto escape_token(std::string_view token) -> std::string;

/// True if a segment token is read as an identity selector: it opens with
/// '[' and closes with ']'. Any other '[' is part of a member name. A
/// member whose own name has this form cannot be written in a path.
auto reads_as_selector(std::string_view token) -> bool;

/// Build the segment a member name reads as once written out:
/// "-" is Append, a canonical index is Index, anything else is Key.
auto make_segment(std::string_view key) -> Segment;

/// The encoded text of one segment, without the leading '/'.
auto to_string(const Segment& segment) -> std::string;

/// A sequence of segments addressing a location in a document.
///
/// The empty path addresses the root. Paths are plain values: cheap to
/// copy for typical depths, compared segment by segment.
///
/// @code
/// auto p = Path::parse("/list/[id=item-2]/value");
/// auto q = Path{}.child("list").child(Identity{"id", "item-2"}).child("value");
/// assert(*p == q);
/// @endcode
class Path {
public:
    Path() = default;

    /// Construct from a segment list.
    explicit Path(std::vector<Segment> segments) : segments_{std::move(segments)} {}

    Path(std::initializer_list<Segment> segments) : segments_{segments} {}

    /// Parse the textual form.
    ///
    /// Grammar: "" (root) or ('/' segment)+ where segment is an escaped
    /// key, a canonical index, "-", or "[field=value]".
    static auto parse(std::string_view text) -> Result<Path>;

    /// The textual form; Path::parse(p.to_string()) == p.
    auto to_string() const -> std::string;

    // -- Access ---------------------------------------------------------------

    auto segments() const noexcept -> const std::vector<Segment>& { return segments_; }
    auto size() const noexcept -> std::size_t { return segments_.size(); }
    auto empty() const noexcept -> bool { return segments_.empty(); }
    auto begin() const noexcept { return segments_.begin(); }
    auto end() const noexcept { return segments_.end(); }
    auto operator[](std::size_t i) const -> const Segment& { return segments_[i]; }

    /// The last segment. The path must not be empty.
    auto back() const -> const Segment& { return segments_.back(); }

    /// True if any segment is an identity selector.
    auto has_identity() const -> bool;

    // -- Construction ---------------------------------------------------------

    /// A copy with a member name appended (canonicalized via make_segment).
    auto child(std::string_view key) const -> Path;

    /// A copy with an array index appended.
    auto child(std::size_t index) const -> Path;

    /// A copy with an arbitrary segment appended.
    auto child(Segment segment) const -> Path;

    /// A copy without the last segment; the root's parent is the root.
    auto parent() const -> Path;

    void push_back(Segment segment) { segments_.push_back(std::move(segment)); }
    void pop_back() { segments_.pop_back(); }

    // -- Relations ------------------------------------------------------------

    /// True if this path is a strict ancestor of `other`, comparing the
    /// encoded text of each segment (so Key{"0"} matches Index{0}).
    auto is_proper_prefix_of(const Path& other) const -> bool;

    auto operator==(const Path&) const -> bool = default;

private:
    std::vector<Segment> segments_;
};

auto operator<<(std::ostream& os, const Path& path) -> std::ostream&;

}  // namespace spatch
