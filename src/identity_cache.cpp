#include "identity_cache.hpp"

#include "selectors.hpp"

#include <cmath>
#include <variant>

namespace spatch::detail {

namespace {

// The identity value `element` carries under `field`, if it is a scalar.
auto key_of(const Value& element, const std::string& field) -> const Value* {
    if (!element.is_object()) return nullptr;
    auto it = element.find(field);
    if (it == element.end() || !is_scalar(*it)) return nullptr;
    return &*it;
}

auto holds(const Value& array, std::size_t i, const Identity& id) -> bool {
    if (i >= array.size()) return false;
    const auto* key = key_of(array[i], id.field);
    return key && kind_name(*key) == kind_name(id.value) && *key == id.value;
}

}  // namespace

// =============================================================================
// IdentityCache
// =============================================================================

auto IdentityCache::address(const Value& array) -> std::uintptr_t {
    return reinterpret_cast<std::uintptr_t>(&array.get_ref<const Value::array_t&>());
}

void IdentityCache::count_in(Entry& entry, const Value& element, const std::string& field,
                             std::size_t i) {
    const auto* key = key_of(element, field);
    if (!key) return;
    auto& slot = entry.slots[*key];
    if (++slot.count == 1) {
        slot.index = i;
        slot.stamp = entry.log.size();
    }
}

void IdentityCache::count_out(Entry& entry, const Value& element, const std::string& field) {
    const auto* key = key_of(element, field);
    if (!key) return;
    auto it = entry.slots.find(*key);
    if (it == entry.slots.end()) return;
    if (--it->second.count == 0) {
        entry.slots.erase(it);
    } else if (it->second.count == 1) {
        it->second.index = unknown;
    }
}

auto IdentityCache::lookup(const Value& array, const std::string& field) -> Entry* {
    auto [it, fresh] = entries_.try_emplace(Key{address(array), field});
    if (fresh) return nullptr;
    if (!it->second.built) build(it->second, array, field);
    return &it->second;
}

void IdentityCache::build(Entry& entry, const Value& array, const std::string& field) {
    entry.slots.clear();
    entry.log.clear();
    for (auto i = std::size_t{0}; i < array.size(); ++i) count_in(entry, array[i], field, i);
    entry.built = true;
}

auto IdentityCache::position(Entry& entry, Slot& slot, const Value& array, const Identity& id)
    -> std::size_t {
    if (slot.index != unknown) {
        for (auto k = slot.stamp; k < entry.log.size(); ++k) {
            const auto& shift = entry.log[k];
            if (shift.inserted) {
                if (slot.index >= shift.position) ++slot.index;
            } else if (slot.index > shift.position) {
                --slot.index;
            }
        }
    }
    slot.stamp = entry.log.size();
    if (!holds(array, slot.index, id)) {
        auto found = match_identity(array, id);
        slot.index = found.size() == 1 ? found.front() : unknown;
    }
    return slot.index;
}

void IdentityCache::trim(Entry& entry, const Value& array) {
    auto limit = std::size_t{16} + static_cast<std::size_t>(std::sqrt(static_cast<double>(array.size())));
    if (entry.log.size() <= limit) return;
    entry.built = false;
    entry.slots.clear();
    entry.log.clear();
}

template <typename F>
void IdentityCache::each_built(const Value& array, F f) {
    if (entries_.empty()) return;
    const auto at = address(array);
    for (auto it = entries_.lower_bound(Key{at, std::string{}});
         it != entries_.end() && it->first.first == at; ++it) {
        if (it->second.built) f(it->first.second, it->second);
    }
}

auto IdentityCache::match(const Value& array, const Identity& id) -> std::vector<std::size_t> {
    if (!is_scalar(id.value)) return match_identity(array, id);
    auto* entry = lookup(array, id.field);
    if (!entry) return match_identity(array, id);

    auto it = entry->slots.find(id.value);
    if (it == entry->slots.end()) return {};
    if (it->second.count > 1) return match_identity(array, id);

    auto i = position(*entry, it->second, array, id);
    if (i != unknown) return {i};
    build(*entry, array, id.field);
    return match_identity(array, id);
}

auto IdentityCache::segment(const Value& array, std::size_t i, const std::string& field)
    -> Segment {
    const auto* key = key_of(array[i], field);
    if (!key) return Index{i};
    auto* entry = lookup(array, field);
    if (!entry) return semantic_segment(array, i, field);

    auto it = entry->slots.find(*key);
    if (it != entry->slots.end() && it->second.count == 1) return Identity{field, *key};
    return Index{i};
}

void IdentityCache::changing(const Value& array, std::size_t i) {
    each_built(array, [&](const std::string& field, Entry& entry) {
        count_out(entry, array[i], field);
    });
}

void IdentityCache::changed(const Value& array, std::size_t i) {
    each_built(array, [&](const std::string& field, Entry& entry) {
        count_in(entry, array[i], field, i);
    });
}

void IdentityCache::inserted(const Value& array, std::size_t i) {
    each_built(array, [&](const std::string& field, Entry& entry) {
        entry.log.push_back(Shift{i, true});
        count_in(entry, array[i], field, i);
        trim(entry, array);
    });
}

void IdentityCache::erasing(const Value& array, std::size_t i) {
    each_built(array, [&](const std::string& field, Entry& entry) {
        count_out(entry, array[i], field);
        entry.log.push_back(Shift{i, false});
        trim(entry, array);
    });
}

void IdentityCache::forget(const Value& value) {
    if (entries_.empty()) return;
    auto work = std::vector<const Value*>{&value};
    while (!work.empty()) {
        const auto* current = work.back();
        work.pop_back();
        if (current->is_array()) {
            const auto at = address(*current);
            auto first = entries_.lower_bound(Key{at, std::string{}});
            auto last = first;
            while (last != entries_.end() && last->first.first == at) ++last;
            entries_.erase(first, last);
        }
        if (is_container(*current)) {
            for (const auto& child : *current) work.push_back(&child);
        }
    }
}

// =============================================================================
// Edit
// =============================================================================

Edit::Edit(const Value& root, const Path& positional, IdentityCache* cache) : cache_{cache} {
    if (!cache_) return;
    const auto* current = &root;
    for (const auto& segment : positional) {
        if (current->is_array()) {
            auto i = std::get<Index>(segment).value;
            elements_.emplace_back(current, i);
            current = &(*current)[i];
            continue;
        }
        auto name = std::visit(overload{
            [](const Key& k) { return k.name; },
            [](const Index& i) { return std::to_string(i.value); },
            [](const Append&) { return std::string{"-"}; },
            [](const Identity& id) { return to_string(Segment{id}); },
        }, segment);
        auto it = current->find(name);
        if (it == current->end()) break;
        current = &*it;
    }
    for (const auto& [array, i] : elements_) cache_->changing(*array, i);
}

Edit::~Edit() {
    for (const auto& [array, i] : elements_) cache_->changed(*array, i);
}

}  // namespace spatch::detail
