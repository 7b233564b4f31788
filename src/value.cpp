#include <spatch/value.hpp>

#include <utility>
#include <vector>

namespace spatch {

auto kind_name(const Value& v) noexcept -> std::string_view {
    switch (v.type()) {
        case Value::value_t::null: return "null";
        case Value::value_t::boolean: return "boolean";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float: return "number";
        case Value::value_t::string: return "string";
        case Value::value_t::array: return "array";
        case Value::value_t::object: return "object";
        case Value::value_t::binary: return "binary";
        case Value::value_t::discarded: return "discarded";
    }
    return "unknown";
}

auto describe(const Value& v) -> std::string {
    if (v.is_null()) return "null";
    if (is_container(v)) return std::string{kind_name(v)};
    return std::string{kind_name(v)} + "(" + v.dump() + ")";
}

auto equal(const Value& a, const Value& b) -> bool {
    auto work = std::vector<std::pair<const Value*, const Value*>>{{&a, &b}};
    while (!work.empty()) {
        auto [x, y] = work.back();
        work.pop_back();

        if (x->is_number() && y->is_number()) {
            if (*x != *y) return false;
            continue;
        }
        if (x->type() != y->type()) return false;

        switch (x->type()) {
            case Value::value_t::array:
                if (x->size() != y->size()) return false;
                for (auto i = std::size_t{0}; i < x->size(); ++i) {
                    work.emplace_back(&(*x)[i], &(*y)[i]);
                }
                break;
            case Value::value_t::object:
                if (x->size() != y->size()) return false;
                for (const auto& [key, member] : x->items()) {
                    auto it = y->find(key);
                    if (it == y->end()) return false;
                    work.emplace_back(&member, &*it);
                }
                break;
            default:
                if (*x != *y) return false;
                break;
        }
    }
    return true;
}

}  // namespace spatch
