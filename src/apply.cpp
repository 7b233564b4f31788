#include <spatch/apply.hpp>

#include <spatch/logging.hpp>
#include <spatch/resolve.hpp>

#include "apply_steps.hpp"
#include "identity_cache.hpp"
#include "selectors.hpp"

#include <string>
#include <utility>

namespace spatch {

namespace detail {

namespace {

using Failure = std::optional<Error>;

// The object member a non-selector segment names.
auto member_name(const Segment& segment) -> std::string {
    return std::visit(overload{
        [](const Key& k) { return k.name; },
        [](const Index& i) { return std::to_string(i.value); },
        [](const Identity& id) { return to_string(Segment{id}); },
        [](const Append&) { return std::string{"-"}; },
    }, segment);
}

// Follow a positional path (keys and indices only, as produced by resolve)
// to the mutable value it names.
auto locate(Value& root, const Path& positional) -> Value& {
    auto* current = &root;
    for (const auto& segment : positional) {
        if (current->is_array()) {
            current = &(*current)[std::get<Index>(segment).value];
        } else {
            current = &(*current)[member_name(segment)];
        }
    }
    return *current;
}

auto at(const Path& path) -> std::string {
    return " at '" + path.to_string() + "'";
}

// -- Add ----------------------------------------------------------------------

auto add_at(Value& doc, const Path& path, Value value, const Options& options,
            IdentityCache* cache) -> Failure {
    if (path.empty()) {
        if (cache) cache->forget(doc);
        doc = std::move(value);
        return std::nullopt;
    }

    auto parent = resolve_cached(doc, path.parent(), nullptr, options, cache);
    if (!parent) return std::move(parent).error();
    auto edit = Edit{doc, parent->positional, cache};
    auto& container = locate(doc, parent->positional);
    const auto& last = path.back();

    if (container.is_object()) {
        if (std::holds_alternative<Identity>(last)) {
            return Error{ErrorKind::type_mismatch,
                         "selector needs an array, found object" + at(path)};
        }
        auto name = member_name(last);
        if (auto it = container.find(name); it != container.end() && cache) cache->forget(*it);
        container[name] = std::move(value);
        return std::nullopt;
    }

    if (!container.is_array()) {
        return Error{ErrorKind::type_mismatch,
                     "cannot add into " + std::string{kind_name(container)} + at(path)};
    }

    auto insert = [&](std::size_t i) {
        container.insert(container.begin() + static_cast<std::ptrdiff_t>(i), std::move(value));
        if (cache) cache->inserted(container, i);
    };

    return std::visit(overload{
        [&](const Index& i) -> Failure {
            if (i.value > container.size()) {
                return Error{ErrorKind::index_out_of_range,
                             "index " + std::to_string(i.value) + " is past the end of array "
                                 "of length " + std::to_string(container.size()) + at(path)};
            }
            insert(i.value);
            return std::nullopt;
        },
        [&](const Append&) -> Failure {
            insert(container.size());
            return std::nullopt;
        },
        [&](const Key& k) -> Failure {
            return Error{ErrorKind::type_mismatch,
                         "'" + k.name + "' is not an array index" + at(path)};
        },
        [&](const Identity& id) -> Failure {
            auto matches = cache ? cache->match(container, id) : match_identity(container, id);
            if (matches.size() > 1) {
                return Error{ErrorKind::ambiguous,
                             "more than one element matches the selector" + at(path)};
            }
            if (matches.size() == 1) {
                auto i = matches.front();
                if (cache) {
                    cache->changing(container, i);
                    cache->forget(container[i]);
                }
                container[i] = std::move(value);
                if (cache) cache->changed(container, i);
                return std::nullopt;
            }
            auto carried = Value(Value::value_t::array);
            carried.push_back(value);
            if (match_identity(carried, id).empty()) {
                return Error{ErrorKind::invalid_use,
                             "value added by selector must be an object with "
                                 + id.field + "=" + id.value.dump() + at(path)};
            }
            insert(container.size());
            return std::nullopt;
        },
    }, last);
}

// -- Remove -------------------------------------------------------------------

auto remove_at(Value& doc, const Path& path, const Options& options, IdentityCache* cache)
    -> Result<Value> {
    if (path.empty()) {
        return Error{ErrorKind::invalid_use, "cannot remove the document root"};
    }
    auto target = resolve_cached(doc, path, nullptr, options, cache);
    if (!target) return std::move(target).error();

    const auto parent = target->positional.parent();
    auto edit = Edit{doc, parent, cache};
    auto& container = locate(doc, parent);
    const auto& last = target->positional.back();
    auto removed = Value{};
    if (container.is_array()) {
        auto i = std::get<Index>(last).value;
        if (cache) cache->erasing(container, i);
        removed = std::move(container[i]);
        container.erase(i);
    } else {
        auto name = member_name(last);
        removed = std::move(container[name]);
        container.erase(name);
    }
    return removed;
}

}  // namespace

// -- Steps --------------------------------------------------------------------

auto add_value(Value& doc, const Path& path, Value value, const Options& options,
               IdentityCache* cache) -> std::optional<Error> {
    return add_at(doc, path, std::move(value), options, cache);
}

auto remove_value(Value& doc, const Path& path, const Options& options, IdentityCache* cache)
    -> Result<Value> {
    return remove_at(doc, path, options, cache);
}

auto check_move(const Value& doc, const Path& from, const Path& path, const Options& options,
                IdentityCache* cache) -> Result<bool> {
    auto into_self = [&] {
        return Error{ErrorKind::move_into_self,
                     "cannot move '" + from.to_string() + "' into its own child '"
                         + path.to_string() + "'"};
    };
    if (from.is_proper_prefix_of(path)) return into_self();

    auto source = resolve_cached(doc, from, nullptr, options, cache);
    if (!source) return std::move(source).error();

    if (!path.empty()) {
        if (auto parent = resolve_cached(doc, path.parent(), nullptr, options, cache)) {
            const auto& src = source->positional;
            const auto& dst = parent->positional;
            if (src == dst || src.is_proper_prefix_of(dst)) return into_self();
        }
    }
    auto same = resolve_cached(doc, path, nullptr, options, cache);
    return same && same->positional == source->positional;
}

auto apply_op(Value& doc, const PatchOp& op, const Options& options, IdentityCache* cache)
    -> std::optional<Error> {
    return std::visit(overload{
        [&](const PatchAdd& o) -> Failure { return add_at(doc, o.path, o.value, options, cache); },
        [&](const PatchRemove& o) -> Failure {
            auto removed = remove_at(doc, o.path, options, cache);
            if (!removed) return std::move(removed).error();
            if (cache) cache->forget(*removed);
            return std::nullopt;
        },
        [&](const PatchReplace& o) -> Failure {
            auto target = resolve_cached(doc, o.path, nullptr, options, cache);
            if (!target) return std::move(target).error();
            auto edit = Edit{doc, target->positional, cache};
            auto& slot = locate(doc, target->positional);
            if (cache) cache->forget(slot);
            slot = o.value;
            return std::nullopt;
        },
        [&](const PatchMove& o) -> Failure {
            auto noop = check_move(doc, o.from, o.path, options, cache);
            if (!noop) return std::move(noop).error();
            if (*noop) return std::nullopt;
            auto value = remove_at(doc, o.from, options, cache);
            if (!value) return std::move(value).error();
            return add_at(doc, o.path, std::move(*value), options, cache);
        },
        [&](const PatchCopy& o) -> Failure {
            auto source = resolve_cached(doc, o.from, nullptr, options, cache);
            if (!source) return std::move(source).error();
            return add_at(doc, o.path, *source->value, options, cache);
        },
        [&](const PatchTest& o) -> Failure {
            auto target = resolve_cached(doc, o.path, nullptr, options, cache);
            if (!target) return std::move(target).error();
            if (!equal(*target->value, o.value)) {
                return Error{ErrorKind::test_failed,
                             "value" + at(o.path) + " is " + target->value->dump()
                                 + ", expected " + o.value.dump()};
            }
            return std::nullopt;
        },
    }, op);
}

}  // namespace detail

auto apply(const Value& root, const Patch& patch, const Options& options) -> Result<Value> {
    auto doc = root;
    auto cache = detail::IdentityCache{};
    for (auto i = std::size_t{0}; i < patch.size(); ++i) {
        const auto& op = patch[i];
        logger()->debug("applying {} '{}'", op_name(op), target_path(op).to_string());
        if (auto error = detail::apply_op(doc, op, options, &cache)) {
            logger()->debug("operation {} failed: {}", i, error->describe());
            return Error{error->kind,
                         "operation " + std::to_string(i) + " (" + std::string{op_name(op)}
                             + "): " + error->message};
        }
    }
    return doc;
}

}  // namespace spatch
