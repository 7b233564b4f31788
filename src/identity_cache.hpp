/// @file identity_cache.hpp
/// @brief Identity lookup for arrays edited one operation at a time.
///
/// Internal header, not installed.

#pragma once

#include <spatch/options.hpp>
#include <spatch/path.hpp>
#include <spatch/resolve.hpp>
#include <spatch/result.hpp>
#include <spatch/schema_index.hpp>
#include <spatch/value.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace spatch::detail {

/// Per-array maps from identity value to element position, kept in step
/// with in-place edits so a run of operations can resolve selectors
/// without rescanning the array for each one.
///
/// An array is indexed for a field the second time it is asked about that
/// field; the first lookup scans. Positions are corrected lazily from a log
/// of insertions and erasures, and an index whose log outgrows the square
/// root of the array's length is rebuilt on its next use.
///
/// Every edit of an indexed array, or of anything inside one of its
/// elements, must be reported through the notification calls below or an
/// Edit guard. Arrays are told apart by the address of their storage,
/// which survives moves of the enclosing value.
class IdentityCache {
public:
    /// The elements of `array` matching `id`, as match_identity reports them.
    auto match(const Value& array, const Identity& id) -> std::vector<std::size_t>;

    /// The segment semantic_segment would give element `i` of `array`.
    auto segment(const Value& array, std::size_t i, const std::string& field) -> Segment;

    // -- Notifications --------------------------------------------------------

    /// Element `i` of `array` is about to change in place.
    void changing(const Value& array, std::size_t i);

    /// Element `i` of `array` has changed in place.
    void changed(const Value& array, std::size_t i);

    /// An element has been inserted into `array` at `i`.
    void inserted(const Value& array, std::size_t i);

    /// Element `i` of `array` is about to be erased.
    void erasing(const Value& array, std::size_t i);

    /// `value` is about to be destroyed: drop the indices of the arrays in it.
    void forget(const Value& value);

private:
    static constexpr auto unknown = static_cast<std::size_t>(-1);

    struct Slot {
        std::size_t count{0};
        std::size_t index{unknown};  // meaningful while count == 1
        std::size_t stamp{0};        // log length `index` is current for
    };

    struct Shift {
        std::size_t position;
        bool inserted;
    };

    struct Entry {
        bool built{false};
        std::map<Value, Slot> slots;
        std::vector<Shift> log;
    };

    using Key = std::pair<std::uintptr_t, std::string>;

    static auto address(const Value& array) -> std::uintptr_t;
    static void count_in(Entry& entry, const Value& element, const std::string& field,
                         std::size_t i);
    static void count_out(Entry& entry, const Value& element, const std::string& field);

    auto lookup(const Value& array, const std::string& field) -> Entry*;
    void build(Entry& entry, const Value& array, const std::string& field);
    auto position(Entry& entry, Slot& slot, const Value& array, const Identity& id) -> std::size_t;
    void trim(Entry& entry, const Value& array);

    template <typename F>
    void each_built(const Value& array, F f);

    std::map<Key, Entry> entries_;
};

/// Reports an in-place edit somewhere below `positional` to the cache for
/// every array element the path passes through. Construct it before the
/// edit; its destructor reports the edit as done. A null cache makes it a
/// no-op.
class Edit {
public:
    Edit(const Value& root, const Path& positional, IdentityCache* cache);
    ~Edit();

    Edit(const Edit&) = delete;
    auto operator=(const Edit&) -> Edit& = delete;

private:
    IdentityCache* cache_;
    std::vector<std::pair<const Value*, std::size_t>> elements_;
};

/// resolve(), answering selector and semantic-segment questions from
/// `cache` when it is not null.
auto resolve_cached(const Value& root, const Path& path, const SchemaIndex* schema,
                    const Options& options, IdentityCache* cache) -> Result<Resolved>;

}  // namespace spatch::detail
