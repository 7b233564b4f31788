#include <spatch/json.hpp>

#include <spatch/apply.hpp>
#include <spatch/diff.hpp>
#include <spatch/logging.hpp>
#include <spatch/resolve.hpp>

#include "apply_steps.hpp"
#include "identity_cache.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace spatch {

namespace {

auto malformed(std::size_t i, const std::string& message) -> Error {
    return Error{ErrorKind::invalid_patch,
                 "operation " + std::to_string(i) + ": " + message};
}

auto read_path(const Value& op, const char* field, std::size_t i) -> Result<Path> {
    auto it = op.find(field);
    if (it == op.end()) return malformed(i, std::string{"missing \""} + field + "\"");
    if (!it->is_string()) {
        return malformed(i, std::string{"\""} + field + "\" must be a string, found "
                                + std::string{kind_name(*it)});
    }
    auto path = Path::parse(it->get_ref<const std::string&>());
    if (!path) {
        const auto& error = path.error();
        return Error{error.kind, "operation " + std::to_string(i) + " \"" + field
                                     + "\": " + error.message};
    }
    return path;
}

auto read_value(const Value& op, std::size_t i) -> Result<Value> {
    auto it = op.find("value");
    if (it == op.end()) return malformed(i, "missing \"value\"");
    return *it;
}

auto decode_op(const Value& j, std::size_t i) -> Result<PatchOp> {
    if (!j.is_object()) {
        return malformed(i, "expected object, found " + std::string{kind_name(j)});
    }
    auto name_it = j.find("op");
    if (name_it == j.end()) return malformed(i, "missing \"op\"");
    if (!name_it->is_string()) return malformed(i, "\"op\" must be a string");
    const auto& name = name_it->get_ref<const std::string&>();

    auto path = read_path(j, "path", i);
    if (!path) return std::move(path).error();

    if (name == "remove") return PatchOp{PatchRemove{std::move(*path)}};

    if (name == "add" || name == "replace" || name == "test") {
        auto value = read_value(j, i);
        if (!value) return std::move(value).error();
        if (name == "add") return PatchOp{PatchAdd{std::move(*path), std::move(*value)}};
        if (name == "replace") return PatchOp{PatchReplace{std::move(*path), std::move(*value)}};
        return PatchOp{PatchTest{std::move(*path), std::move(*value)}};
    }

    if (name == "move" || name == "copy") {
        auto from = read_path(j, "from", i);
        if (!from) return std::move(from).error();
        if (name == "move") return PatchOp{PatchMove{std::move(*from), std::move(*path)}};
        return PatchOp{PatchCopy{std::move(*from), std::move(*path)}};
    }

    return malformed(i, "unknown op \"" + name + "\"");
}

// A member named like "[...]" reads back as a selector, so a path through
// it cannot be written.
auto unwritable(const Path& path) -> std::optional<Error> {
    for (const auto& segment : path) {
        const auto* key = std::get_if<Key>(&segment);
        if (key && reads_as_selector(key->name)) {
            return Error{ErrorKind::invalid_use,
                         "member name '" + key->name + "' would read back as a selector in '"
                             + path.to_string() + "'"};
        }
    }
    return std::nullopt;
}

auto unwritable(const PatchOp& op) -> std::optional<Error> {
    if (auto error = unwritable(target_path(op))) return error;
    if (const auto* move = std::get_if<PatchMove>(&op)) return unwritable(move->from);
    if (const auto* copy = std::get_if<PatchCopy>(&op)) return unwritable(copy->from);
    return std::nullopt;
}

// =============================================================================
// Renderer
// =============================================================================
//
// Replays the patch on a private copy of the old document. The identity
// cache keeps selector lookups on keyed arrays from rescanning the array
// for every operation.

class Renderer {
public:
    Renderer(const SchemaIndex* schema, const Value& old_value, const Options& options)
        : schema_{schema}, doc_(old_value), options_{options} {}

    auto render(const PatchOp& op) -> Result<PatchOp> {
        return std::visit(overload{
            [&](const PatchAdd& o) -> Result<PatchOp> {
                auto path = insertion(o.path);
                if (!path) return std::move(path).error();
                return step(op, PatchAdd{std::move(*path), o.value});
            },
            [&](const PatchRemove& o) -> Result<PatchOp> {
                auto path = existing(o.path);
                if (!path) return std::move(path).error();
                return step(op, PatchRemove{std::move(*path)});
            },
            [&](const PatchReplace& o) -> Result<PatchOp> {
                auto path = existing(o.path);
                if (!path) return std::move(path).error();
                return step(op, PatchReplace{std::move(*path), o.value});
            },
            [&](const PatchTest& o) -> Result<PatchOp> {
                auto path = existing(o.path);
                if (!path) return std::move(path).error();
                return step(op, PatchTest{std::move(*path), o.value});
            },
            [&](const PatchCopy& o) -> Result<PatchOp> {
                auto from = existing(o.from);
                if (!from) return std::move(from).error();
                auto path = insertion(o.path);
                if (!path) return std::move(path).error();
                return step(op, PatchCopy{std::move(*from), std::move(*path)});
            },
            [&](const PatchMove& o) -> Result<PatchOp> { return render_move(o); },
        }, op);
    }

private:
    // The written form of a path that names an existing location.
    auto existing(const Path& path) -> Result<Path> {
        auto resolved = detail::resolve_cached(doc_, path, schema_, options_, &cache_);
        if (!resolved) return std::move(resolved).error();
        return schema_ ? std::move(resolved->semantic) : std::move(resolved->positional);
    }

    // The written form of an add-like target: its parent as an existing
    // location, followed by the original insertion segment.
    auto insertion(const Path& path) -> Result<Path> {
        if (path.empty()) return path;
        auto parent = existing(path.parent());
        if (!parent) return std::move(parent).error();
        return parent->child(path.back());
    }

    // Apply the original operation and hand back its rendered form.
    auto step(const PatchOp& original, PatchOp rendered) -> Result<PatchOp> {
        if (auto error = detail::apply_op(doc_, original, options_, &cache_)) return std::move(*error);
        return rendered;
    }

    auto render_move(const PatchMove& o) -> Result<PatchOp> {
        auto from = existing(o.from);
        if (!from) return std::move(from).error();

        auto noop = detail::check_move(doc_, o.from, o.path, options_, &cache_);
        if (!noop) return std::move(noop).error();
        if (*noop) {
            auto path = insertion(o.path);
            if (!path) return std::move(path).error();
            return PatchOp{PatchMove{std::move(*from), std::move(*path)}};
        }

        auto value = detail::remove_value(doc_, o.from, options_, &cache_);
        if (!value) return std::move(value).error();
        auto path = insertion(o.path);
        if (!path) return std::move(path).error();
        if (auto error = detail::add_value(doc_, o.path, std::move(*value), options_, &cache_)) {
            return std::move(*error);
        }
        return PatchOp{PatchMove{std::move(*from), std::move(*path)}};
    }

    const SchemaIndex* schema_;
    Value doc_;
    const Options& options_;
    detail::IdentityCache cache_;
};

}  // namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(Value& j, const Path& path) {
    j = path.to_string();
}

void from_json(const Value& j, Path& path) {
    if (!j.is_string()) {
        throw Exception{Error{ErrorKind::invalid_patch,
                              "path must be a string, found " + std::string{kind_name(j)}}};
    }
    path = Path::parse(j.get_ref<const std::string&>()).value();
}

void to_json(Value& j, const PatchOp& op) {
    j = Value::object();
    j["op"] = std::string{op_name(op)};
    std::visit(overload{
        [&](const PatchAdd& o) { j["path"] = o.path; j["value"] = o.value; },
        [&](const PatchRemove& o) { j["path"] = o.path; },
        [&](const PatchReplace& o) { j["path"] = o.path; j["value"] = o.value; },
        [&](const PatchMove& o) { j["from"] = o.from; j["path"] = o.path; },
        [&](const PatchCopy& o) { j["from"] = o.from; j["path"] = o.path; },
        [&](const PatchTest& o) { j["path"] = o.path; j["value"] = o.value; },
    }, op);
}

void from_json(const Value& j, PatchOp& op) {
    op = decode_op(j, 0).value();
}

void to_json(Value& j, const Options& options) {
    j = Value{{"max_depth", options.max_depth}, {"append_marker", options.append_marker}};
}

void from_json(const Value& j, Options& options) {
    if (auto it = j.find("max_depth"); it != j.end()) it->get_to(options.max_depth);
    if (auto it = j.find("append_marker"); it != j.end()) it->get_to(options.append_marker);
}

// =============================================================================
// RFC 6902 documents
// =============================================================================

auto render(const Patch& patch, const SchemaIndex* schema, const Value& old_value,
            const Options& options) -> Result<Value> {
    auto renderer = Renderer{schema, old_value, options};
    auto out = Value::array();
    for (auto i = std::size_t{0}; i < patch.size(); ++i) {
        auto rendered = renderer.render(patch[i]);
        if (rendered) {
            if (auto error = unwritable(*rendered)) rendered = std::move(*error);
        }
        if (!rendered) {
            const auto& error = rendered.error();
            return Error{error.kind, "operation " + std::to_string(i) + " ("
                                         + std::string{op_name(patch[i])} + "): " + error.message};
        }
        out.push_back(Value(*rendered));
    }
    logger()->debug("rendered {} operation(s) with {} paths", patch.size(),
                    schema ? "semantic" : "positional");
    return out;
}

auto decode(const Value& patch) -> Result<Patch> {
    if (!patch.is_array()) {
        return Error{ErrorKind::invalid_patch,
                     "patch must be an array, found " + std::string{kind_name(patch)}};
    }
    auto out = Patch{};
    out.reserve(patch.size());
    for (auto i = std::size_t{0}; i < patch.size(); ++i) {
        auto op = decode_op(patch[i], i);
        if (!op) return std::move(op).error();
        out.push_back(std::move(*op));
    }
    return out;
}

auto diff_patch(const Value& old_value, const Value& new_value, const SchemaIndex* schema,
                const Options& options) -> Result<Value> {
    auto ops = compute_diff(old_value, new_value, schema, options);
    if (!ops) return std::move(ops).error();
    return render(*ops, schema, old_value, options);
}

auto apply_patch(const Value& doc, const Value& patch, const Options& options)
    -> Result<Value> {
    auto ops = decode(patch);
    if (!ops) return std::move(ops).error();
    return apply(doc, *ops, options);
}

}  // namespace spatch
