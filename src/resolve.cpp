#include <spatch/resolve.hpp>

#include <spatch/logging.hpp>

#include "identity_cache.hpp"
#include "selectors.hpp"

#include <string>
#include <utility>

namespace spatch {

namespace {

auto mismatch(std::string_view expected, const Value& found, const Path& at) -> std::string {
    return "expected " + std::string{expected} + ", found " + std::string{kind_name(found)}
           + " at '" + at.to_string() + "'";
}

}  // namespace

namespace detail {

auto resolve_cached(const Value& root, const Path& path, const SchemaIndex* schema,
                    const Options& options, IdentityCache* cache) -> Result<Resolved> {
    if (path.size() > options.max_depth) {
        return Error{ErrorKind::depth_limit_exceeded,
                     "path has " + std::to_string(path.size()) + " segments, limit is "
                         + std::to_string(options.max_depth)};
    }

    auto out = Resolved{&root, {}, {}};
    auto location = Location{};
    auto walked = Path{};

    auto fail = [&](ErrorKind kind, std::string message) -> Error {
        logger()->debug("resolve '{}' failed: {}", path.to_string(), message);
        return Error{kind, std::move(message)};
    };

    // Descend into member `name` of the current object.
    auto member = [&](const std::string& name) -> bool {
        auto it = out.value->find(name);
        if (it == out.value->end()) return false;
        out.value = &*it;
        out.positional.push_back(make_segment(name));
        out.semantic.push_back(make_segment(name));
        location.emplace_back(name);
        return true;
    };

    // Descend into element `i` of the current array.
    auto element = [&](std::size_t i) {
        const auto& array = *out.value;
        auto field = schema ? schema->lookup(location) : std::nullopt;
        if (!field) {
            out.semantic.push_back(Index{i});
        } else {
            out.semantic.push_back(cache ? cache->segment(array, i, *field)
                                         : semantic_segment(array, i, *field));
        }
        out.positional.push_back(Index{i});
        out.value = &array[i];
        location.emplace_back(AnyIndex{});
    };

    for (const auto& segment : path) {
        walked.push_back(segment);
        const auto& current = *out.value;

        auto error = std::visit(overload{
            [&](const Key& k) -> std::optional<Error> {
                if (!current.is_object()) {
                    return fail(ErrorKind::not_found, mismatch("object", current, walked));
                }
                if (!member(k.name)) {
                    return fail(ErrorKind::not_found,
                                "no member '" + k.name + "' at '" + walked.to_string() + "'");
                }
                return std::nullopt;
            },
            [&](const Index& idx) -> std::optional<Error> {
                if (current.is_object()) {
                    if (!member(std::to_string(idx.value))) {
                        return fail(ErrorKind::not_found,
                                    "no member '" + std::to_string(idx.value) + "' at '"
                                        + walked.to_string() + "'");
                    }
                    return std::nullopt;
                }
                if (!current.is_array()) {
                    return fail(ErrorKind::not_found, mismatch("array", current, walked));
                }
                if (idx.value >= current.size()) {
                    return fail(ErrorKind::index_out_of_range,
                                "index " + std::to_string(idx.value) + " is out of range for "
                                    "array of length " + std::to_string(current.size())
                                    + " at '" + walked.to_string() + "'");
                }
                element(idx.value);
                return std::nullopt;
            },
            [&](const Identity& id) -> std::optional<Error> {
                if (!current.is_array()) {
                    return fail(ErrorKind::type_mismatch, mismatch("array", current, walked));
                }
                auto matches = cache ? cache->match(current, id) : match_identity(current, id);
                if (matches.empty()) {
                    return fail(ErrorKind::not_found,
                                "no element matches '" + to_string(segment) + "' at '"
                                    + walked.to_string() + "'");
                }
                if (matches.size() > 1) {
                    return fail(ErrorKind::ambiguous,
                                "more than one element matches '" + to_string(segment)
                                    + "' at '" + walked.to_string() + "'");
                }
                element(matches.front());
                return std::nullopt;
            },
            [&](const Append&) -> std::optional<Error> {
                if (current.is_object()) {
                    if (!member("-")) {
                        return fail(ErrorKind::not_found,
                                    "no member '-' at '" + walked.to_string() + "'");
                    }
                    return std::nullopt;
                }
                if (current.is_array()) {
                    return fail(ErrorKind::invalid_use,
                                "'-' names no existing element at '" + walked.to_string() + "'");
                }
                return fail(ErrorKind::not_found, mismatch("array", current, walked));
            },
        }, segment);

        if (error) return std::move(*error);
    }

    return out;
}

}  // namespace detail

auto resolve(const Value& root, const Path& path, const SchemaIndex* schema,
             const Options& options) -> Result<Resolved> {
    return detail::resolve_cached(root, path, schema, options, nullptr);
}

auto query(const Value& root, const Path& path, const SchemaIndex* schema,
           const Options& options) -> Result<Value> {
    auto resolved = resolve(root, path, schema, options);
    if (!resolved) return std::move(resolved).error();
    return *resolved->value;
}

auto query(const Value& root, std::string_view path, const SchemaIndex* schema,
           const Options& options) -> Result<Value> {
    auto parsed = Path::parse(path);
    if (!parsed) return std::move(parsed).error();
    return query(root, *parsed, schema, options);
}

auto find(const Value& root, const Path& path) -> const Value* {
    auto resolved = resolve(root, path);
    return resolved ? resolved->value : nullptr;
}

}  // namespace spatch
