#include <spatch/schema_index.hpp>

#include <spatch/logging.hpp>

#include <algorithm>
#include <utility>

namespace spatch {

namespace {

auto allows_array(const Value& type) -> bool {
    if (type.is_string()) return type.get_ref<const std::string&>() == "array";
    if (type.is_array()) {
        return std::any_of(type.begin(), type.end(), [](const Value& t) {
            return t.is_string() && t.get_ref<const std::string&>() == "array";
        });
    }
    return true;
}

}  // namespace

auto to_string(const Location& location) -> std::string {
    auto out = std::string{};
    for (const auto& step : location) {
        out += '/';
        std::visit(overload{
            [&](const std::string& name) { out += name; },
            [&](const AnyIndex&) { out += '*'; },
        }, step);
    }
    return out;
}

auto SchemaIndex::build(const Value& schema) -> Result<SchemaIndex> {
    auto index = SchemaIndex{};

    struct Pending {
        const Value* node;
        Location location;
    };
    auto work = std::vector<Pending>{{&schema, {}}};

    while (!work.empty()) {
        auto [node, location] = std::move(work.back());
        work.pop_back();
        if (!node->is_object()) continue;

        if (auto key = node->find("indexKey"); key != node->end()) {
            if (!key->is_string() || key->get_ref<const std::string&>().empty()) {
                return Error{ErrorKind::invalid_index_key,
                             "indexKey at " + to_string(location)
                                 + " must be a non-empty string, found " + describe(*key)};
            }
            if (key->get_ref<const std::string&>().find('=') != std::string::npos) {
                return Error{ErrorKind::invalid_index_key,
                             "indexKey at " + to_string(location) + " is " + key->dump()
                                 + "; a selector field cannot contain '='"};
            }
            if (auto type = node->find("type"); type != node->end() && !allows_array(*type)) {
                return Error{ErrorKind::invalid_index_key,
                             "indexKey at " + to_string(location)
                                 + " is declared on a node of type " + type->dump()};
            }
            index.entries_.emplace(location, key->get<std::string>());
        }

        if (auto props = node->find("properties"); props != node->end() && props->is_object()) {
            for (const auto& [name, member] : props->items()) {
                auto child = location;
                child.emplace_back(name);
                work.push_back({&member, std::move(child)});
            }
        }
        if (auto items = node->find("items"); items != node->end() && items->is_object()) {
            auto child = location;
            child.emplace_back(AnyIndex{});
            work.push_back({&*items, std::move(child)});
        }
    }

    logger()->debug("schema index built with {} keyed array(s)", index.size());
    return index;
}

auto SchemaIndex::lookup(const Location& location) const -> std::optional<std::string> {
    if (auto it = entries_.find(location); it != entries_.end()) return it->second;
    return std::nullopt;
}

}  // namespace spatch
