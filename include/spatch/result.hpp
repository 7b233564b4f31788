/// @file result.hpp
/// @brief Result<T>: a value or an Error.

#pragma once

#include <spatch/error.hpp>

#include <type_traits>
#include <utility>
#include <variant>

namespace spatch {

/// The outcome of a fallible operation: either a T or an Error.
///
/// Every fallible library call returns a Result so that failures are part
/// of the signature and each ErrorKind can be branched on by the caller.
///
/// @code
/// auto path = Path::parse("/list/[id=item-1]/value");
/// if (!path) {
///     std::fprintf(stderr, "%s\n", path.error().describe().c_str());
///     return;
/// }
/// auto value = query(doc, *path);
/// @endcode
template <typename T>
class Result {
    static_assert(!std::is_same_v<T, Error>, "Result<Error> is not meaningful");

public:
    /// A successful result.
    Result(T value) : inner_{std::in_place_index<0>, std::move(value)} {}

    /// A failed result.
    Result(Error error) : inner_{std::in_place_index<1>, std::move(error)} {}

    /// True if this result holds a value.
    auto has_value() const noexcept -> bool { return inner_.index() == 0; }

    explicit operator bool() const noexcept { return has_value(); }

    /// The held value.
    /// @throws Exception if this result holds an error.
    auto value() & -> T& {
        check();
        return std::get<0>(inner_);
    }

    auto value() const& -> const T& {
        check();
        return std::get<0>(inner_);
    }

    auto value() && -> T&& {
        check();
        return std::get<0>(std::move(inner_));
    }

    /// The held error. Only valid when has_value() is false.
    auto error() const& -> const Error& { return std::get<1>(inner_); }

    auto error() && -> Error&& { return std::get<1>(std::move(inner_)); }

    auto operator*() & -> T& { return value(); }
    auto operator*() const& -> const T& { return value(); }
    auto operator*() && -> T&& { return std::move(*this).value(); }

    auto operator->() -> T* { return &value(); }
    auto operator->() const -> const T* { return &value(); }

    auto operator==(const Result& other) const -> bool = default;

private:
    void check() const {
        if (!has_value()) throw Exception{std::get<1>(inner_)};
    }

    std::variant<T, Error> inner_;
};

}  // namespace spatch
