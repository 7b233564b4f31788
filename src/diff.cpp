#include <spatch/diff.hpp>

#include <spatch/logging.hpp>

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spatch {

namespace {

// =============================================================================
// Differ
// =============================================================================

class Differ {
public:
    Differ(const SchemaIndex* schema, const Options& options)
        : schema_{schema}, options_{options} {}

    auto run(const Value& a, const Value& b) -> Result<Patch> {
        auto path = Path{};
        auto location = Location{};
        if (auto error = diff(a, b, path, location, 0)) return std::move(*error);
        return std::move(ops_);
    }

private:
    using Failure = std::optional<Error>;

    auto diff(const Value& a, const Value& b, Path& path, Location& location,
              std::size_t depth) -> Failure {
        if (depth > options_.max_depth) {
            return Error{ErrorKind::depth_limit_exceeded,
                         "document nesting exceeds " + std::to_string(options_.max_depth)
                             + " levels at '" + path.to_string() + "'"};
        }

        if (a.is_object() && b.is_object()) return diff_object(a, b, path, location, depth);
        if (a.is_array() && b.is_array()) {
            auto field = schema_ ? schema_->lookup(location) : std::nullopt;
            if (field) return diff_keyed(a, b, *field, path, location, depth);
            return diff_positional(a, b, path, location, depth);
        }

        if (!equal(a, b)) ops_.emplace_back(PatchReplace{path, b});
        return std::nullopt;
    }

    // -- Objects --------------------------------------------------------------

    auto diff_object(const Value& a, const Value& b, Path& path, Location& location,
                     std::size_t depth) -> Failure {
        for (const auto& [key, av] : a.items()) {
            path.push_back(make_segment(key));
            if (auto it = b.find(key); it != b.end()) {
                location.emplace_back(key);
                auto error = diff(av, *it, path, location, depth + 1);
                location.pop_back();
                if (error) return error;
            } else {
                ops_.emplace_back(PatchRemove{path});
            }
            path.pop_back();
        }
        for (const auto& [key, bv] : b.items()) {
            if (a.contains(key)) continue;
            ops_.emplace_back(PatchAdd{path.child(key), bv});
        }
        return std::nullopt;
    }

    // -- Arrays by position ---------------------------------------------------

    auto diff_positional(const Value& a, const Value& b, Path& path, Location& location,
                         std::size_t depth) -> Failure {
        auto common = std::min(a.size(), b.size());

        location.emplace_back(AnyIndex{});
        for (auto i = std::size_t{0}; i < common; ++i) {
            path.push_back(Index{i});
            auto error = diff(a[i], b[i], path, location, depth + 1);
            path.pop_back();
            if (error) return error;
        }
        location.pop_back();

        for (auto i = a.size(); i > b.size(); --i) {
            ops_.emplace_back(PatchRemove{path.child(i - 1)});
        }
        for (auto i = a.size(); i < b.size(); ++i) {
            auto target = options_.append_marker ? path.child(Segment{Append{}}) : path.child(i);
            ops_.emplace_back(PatchAdd{std::move(target), b[i]});
        }
        return std::nullopt;
    }

    // -- Arrays by identity ---------------------------------------------------

    auto keyable(const Value& array, const std::string& field) const -> bool {
        return std::all_of(array.begin(), array.end(), [&](const Value& element) {
            if (!element.is_object()) return false;
            auto it = element.find(field);
            return it != element.end() && is_scalar(*it);
        });
    }

    // Map each identity value to its element index; a repeated value is an error.
    auto index_by(const Value& array, const std::string& field, const Path& path,
                  std::map<Value, std::size_t>& out) const -> Failure {
        for (auto i = std::size_t{0}; i < array.size(); ++i) {
            const auto& id = array[i][field];
            if (!out.emplace(id, i).second) {
                return Error{ErrorKind::identity_conflict,
                             "identity " + field + "=" + id.dump() + " appears more than once"
                                 " in the array at '" + path.to_string() + "'"};
            }
        }
        return std::nullopt;
    }

    auto diff_keyed(const Value& a, const Value& b, const std::string& field, Path& path,
                    Location& location, std::size_t depth) -> Failure {
        if (!keyable(a, field) || !keyable(b, field)) {
            logger()->warn("array at '{}' is keyed by '{}' but not every element carries a "
                           "scalar '{}'; comparing by position", path.to_string(), field, field);
            return diff_positional(a, b, path, location, depth);
        }
        logger()->debug("diffing '{}' by identity field '{}'", path.to_string(), field);

        auto old_ids = std::map<Value, std::size_t>{};
        auto new_ids = std::map<Value, std::size_t>{};
        if (auto error = index_by(a, field, path, old_ids)) return error;
        if (auto error = index_by(b, field, path, new_ids)) return error;

        auto selector = [&](const Value& id) { return path.child(Identity{field, id}); };

        // Elements gone from the new array, in old order. The survivors, in
        // old order, are what the array looks like once they are removed.
        auto survives = std::vector<bool>(a.size(), false);
        auto pending = std::size_t{0};
        for (auto j = std::size_t{0}; j < a.size(); ++j) {
            const auto& id = a[j][field];
            if (new_ids.contains(id)) {
                survives[j] = true;
                ++pending;
            } else {
                ops_.emplace_back(PatchRemove{selector(id)});
            }
        }

        // Bring the array into the new order front to back. Positions before
        // `i` are final; after them come the survivors not yet placed, still
        // in old order, so the element at `i` is the first of those.
        auto placed = std::vector<bool>(a.size(), false);
        auto head = std::size_t{0};
        location.emplace_back(AnyIndex{});
        for (auto i = std::size_t{0}; i < b.size(); ++i) {
            const auto& element = b[i];
            const auto& id = element[field];

            auto matched = old_ids.find(id);
            if (matched == old_ids.end()) {
                auto target = pending == 0 && options_.append_marker
                                  ? path.child(Segment{Append{}})
                                  : path.child(i);
                ops_.emplace_back(PatchAdd{std::move(target), element});
                continue;
            }

            while (head < a.size() && (!survives[head] || placed[head])) ++head;
            if (matched->second != head) {
                ops_.emplace_back(PatchMove{selector(id), path.child(i)});
            }
            placed[matched->second] = true;
            --pending;

            path.push_back(Identity{field, id});
            auto error = diff(a[matched->second], element, path, location, depth + 1);
            path.pop_back();
            if (error) return error;
        }
        location.pop_back();
        return std::nullopt;
    }

    const SchemaIndex* schema_;
    const Options& options_;
    Patch ops_;
};

}  // namespace

auto compute_diff(const Value& old_value, const Value& new_value, const SchemaIndex* schema,
                  const Options& options) -> Result<Patch> {
    return Differ{schema, options}.run(old_value, new_value);
}

}  // namespace spatch
