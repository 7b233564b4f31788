/// @file selectors.hpp
/// @brief Identity selector matching shared by resolve, diff and apply.
///
/// Internal header, not installed.

#pragma once

#include <spatch/path.hpp>
#include <spatch/value.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace spatch::detail {

/// Indices of the elements of `array` that are objects whose `id.field`
/// equals `id.value`. Scanning stops after the second match, which is
/// enough to tell unique from ambiguous.
inline auto match_identity(const Value& array, const Identity& id) -> std::vector<std::size_t> {
    auto matches = std::vector<std::size_t>{};
    for (auto i = std::size_t{0}; i < array.size() && matches.size() < 2; ++i) {
        const auto& element = array[i];
        if (!element.is_object()) continue;
        auto it = element.find(id.field);
        if (it != element.end() && kind_name(*it) == kind_name(id.value) && *it == id.value) {
            matches.push_back(i);
        }
    }
    return matches;
}

/// The segment naming element `i` of `array` when the array is keyed by
/// `field`: an Identity when the element has a scalar key value no other
/// element shares, Index otherwise.
inline auto semantic_segment(const Value& array, std::size_t i, const std::string& field) -> Segment {
    const auto& element = array[i];
    if (element.is_object()) {
        auto it = element.find(field);
        if (it != element.end() && is_scalar(*it)) {
            auto id = Identity{field, *it};
            if (match_identity(array, id).size() == 1) return id;
        }
    }
    return Index{i};
}

}  // namespace spatch::detail
