#include <spatch/path.hpp>

#include <algorithm>
#include <charconv>
#include <limits>

namespace spatch {

namespace {

// -- Token helpers ------------------------------------------------------------

auto at(std::size_t pos) -> std::string {
    return " at position " + std::to_string(pos);
}

// Decode RFC 6901 escapes. `offset` is the token's position in the full
// text, used for error messages.
auto unescape(std::string_view raw, std::size_t offset) -> Result<std::string> {
    auto out = std::string{};
    out.reserve(raw.size());
    for (auto i = std::size_t{0}; i < raw.size(); ++i) {
        if (raw[i] != '~') {
            out += raw[i];
            continue;
        }
        if (i + 1 >= raw.size()) {
            return Error{ErrorKind::unterminated_escape,
                         "'~' at end of segment" + at(offset + i)};
        }
        switch (raw[i + 1]) {
            case '0': out += '~'; break;
            case '1': out += '/'; break;
            default:
                return Error{ErrorKind::invalid_escape,
                             std::string{"'~"} + raw[i + 1] + "' is not a valid escape"
                                 + at(offset + i)};
        }
        ++i;
    }
    return out;
}

// True if `text` matches the JSON number grammar exactly:
// -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
auto reads_as_number(std::string_view text) -> bool {
    auto i = std::size_t{0};
    auto digits = [&] {
        auto start = i;
        while (i < text.size() && text[i] >= '0' && text[i] <= '9') ++i;
        return i - start;
    };
    if (i < text.size() && text[i] == '-') ++i;
    if (i >= text.size()) return false;
    if (text[i] == '0') {
        ++i;
    } else if (digits() == 0) {
        return false;
    }
    if (i < text.size() && text[i] == '.') {
        ++i;
        if (digits() == 0) return false;
    }
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;
        if (digits() == 0) return false;
    }
    return i == text.size();
}

// A string identity value must be quoted when its bare form would read
// back as something else.
auto needs_quoting(std::string_view s) -> bool {
    return s.empty() || s == "true" || s == "false" || s.front() == '"' || reads_as_number(s);
}

auto parse_identity_value(std::string_view text, std::size_t offset) -> Result<Value> {
    if (text == "true") return Value(true);
    if (text == "false") return Value(false);
    if (reads_as_number(text)) {
        auto parsed = Value::parse(text, nullptr, false);
        if (parsed.is_discarded()) {
            return Error{ErrorKind::malformed_selector,
                         "selector number is out of range" + at(offset)};
        }
        return parsed;
    }
    if (!text.empty() && text.front() == '"') {
        auto parsed = Value::parse(text, nullptr, false);
        if (!parsed.is_string()) {
            return Error{ErrorKind::malformed_selector,
                         "quoted selector value is not a valid JSON string" + at(offset)};
        }
        return parsed;
    }
    return Value(std::string{text});
}

auto parse_selector(std::string_view raw, std::size_t offset) -> Result<Segment> {
    auto inner = raw.substr(1, raw.size() - 2);
    auto eq = inner.find('=');
    if (eq == std::string_view::npos) {
        return Error{ErrorKind::malformed_selector,
                     "selector has no '=' between field and value" + at(offset)};
    }
    auto field_raw = inner.substr(0, eq);
    auto value_raw = inner.substr(eq + 1);
    if (field_raw.empty()) {
        return Error{ErrorKind::malformed_selector, "selector field is empty" + at(offset)};
    }
    if (value_raw.empty()) {
        return Error{ErrorKind::malformed_selector, "selector value is empty" + at(offset)};
    }

    auto field = unescape(field_raw, offset + 1);
    if (!field) return std::move(field).error();
    auto value_text = unescape(value_raw, offset + 1 + eq + 1);
    if (!value_text) return std::move(value_text).error();

    auto value = parse_identity_value(*value_text, offset + 1 + eq + 1);
    if (!value) return std::move(value).error();
    return Segment{Identity{std::move(*field), std::move(*value)}};
}

auto parse_segment(std::string_view raw, std::size_t offset) -> Result<Segment> {
    if (raw.empty()) {
        return Error{ErrorKind::empty_segment, "empty segment" + at(offset)};
    }
    if (reads_as_selector(raw)) return parse_selector(raw, offset);
    if (raw == "-") return Segment{Append{}};
    if (auto idx = try_parse_index(raw)) return Segment{Index{*idx}};

    auto name = unescape(raw, offset);
    if (!name) return std::move(name).error();
    return Segment{Key{std::move(*name)}};
}

auto selector_value_text(const Value& v) -> std::string {
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        return escape_token(needs_quoting(s) ? v.dump() : s);
    }
    return escape_token(v.dump());
}

}  // namespace

// -- Free functions -----------------------------------------------------------

auto try_parse_index(std::string_view token) -> std::optional<std::size_t> {
    if (token.empty()) return std::nullopt;
    if (token.size() > 1 && token[0] == '0') return std::nullopt;
    if (!std::all_of(token.begin(), token.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    auto out = std::size_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
    if (ec != std::errc{} || ptr != token.data() + token.size()) return std::nullopt;
    return out;
}

auto reads_as_selector(std::string_view token) -> bool {
    return token.size() >= 2 && token.front() == '[' && token.back() == ']';
}

auto escape_token(std::string_view token) -> std::string {
    auto out = std::string{};
    out.reserve(token.size());
    for (auto c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

auto make_segment(std::string_view key) -> Segment {
    if (key == "-") return Append{};
    if (auto idx = try_parse_index(key)) return Index{*idx};
    return Key{std::string{key}};
}

auto to_string(const Segment& segment) -> std::string {
    return std::visit(overload{
        [](const Key& k) { return escape_token(k.name); },
        [](const Index& i) { return std::to_string(i.value); },
        [](const Identity& id) {
            return "[" + escape_token(id.field) + "=" + selector_value_text(id.value) + "]";
        },
        [](const Append&) { return std::string{"-"}; },
    }, segment);
}

// -- Path ---------------------------------------------------------------------

auto Path::parse(std::string_view text) -> Result<Path> {
    auto path = Path{};
    if (text.empty()) return path;
    if (text.front() != '/') {
        return Error{ErrorKind::missing_leading_slash,
                     "path must be empty or start with '/'"};
    }

    auto pos = std::size_t{1};
    while (true) {
        auto next = text.find('/', pos);
        auto raw = text.substr(pos, next == std::string_view::npos ? std::string_view::npos
                                                                   : next - pos);
        auto segment = parse_segment(raw, pos);
        if (!segment) return std::move(segment).error();
        path.segments_.push_back(std::move(*segment));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return path;
}

auto Path::to_string() const -> std::string {
    auto out = std::string{};
    for (const auto& seg : segments_) {
        out += '/';
        out += spatch::to_string(seg);
    }
    return out;
}

auto Path::has_identity() const -> bool {
    return std::any_of(segments_.begin(), segments_.end(), [](const Segment& s) {
        return std::holds_alternative<Identity>(s);
    });
}

auto Path::child(std::string_view key) const -> Path {
    return child(make_segment(key));
}

auto Path::child(std::size_t index) const -> Path {
    return child(Segment{Index{index}});
}

auto Path::child(Segment segment) const -> Path {
    auto out = *this;
    out.segments_.push_back(std::move(segment));
    return out;
}

auto Path::parent() const -> Path {
    if (segments_.empty()) return {};
    auto out = *this;
    out.segments_.pop_back();
    return out;
}

auto Path::is_proper_prefix_of(const Path& other) const -> bool {
    if (segments_.size() >= other.segments_.size()) return false;
    for (auto i = std::size_t{0}; i < segments_.size(); ++i) {
        if (segments_[i] == other.segments_[i]) continue;
        if (spatch::to_string(segments_[i]) != spatch::to_string(other.segments_[i])) {
            return false;
        }
    }
    return true;
}

auto operator<<(std::ostream& os, const Path& path) -> std::ostream& {
    return os << '"' << path.to_string() << '"';
}

}  // namespace spatch
