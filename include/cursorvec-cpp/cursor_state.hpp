/// @file cursor_state.hpp
/// @brief CursorStatus and CursorState: the outcome of a cursor read.

#pragma once

#include <concepts>
#include <cstdint>
#include <string_view>

namespace cursorvec_cpp {

/// Where a cursor read landed.
enum class CursorStatus : std::uint8_t {
    min_out,          ///< A bounded move tried to go before the first element.
    empty_container,  ///< The container holds no elements.
    valid,            ///< The cursor points at an element.
    out_of_range,     ///< The index is stale (container changed, not resynced).
    max_out,          ///< A bounded move tried to go past the last element.
};

/// Convert a CursorStatus to its string representation.
constexpr auto to_string_view(CursorStatus status) noexcept -> std::string_view {
    switch (status) {
        case CursorStatus::min_out:         return "min_out";
        case CursorStatus::empty_container: return "empty_container";
        case CursorStatus::valid:           return "valid";
        case CursorStatus::out_of_range:    return "out_of_range";
        case CursorStatus::max_out:         return "max_out";
    }
    return "unknown";
}

/// The result of reading through a cursor: a status, plus a reference to
/// the element when the status is `valid`.
///
/// The referenced element belongs to the container it was read from and
/// stays valid until that container is next mutated.
///
/// @code
/// if (const auto* track = playlist.move_next_and_get().value()) {
///     play(*track);
/// }
/// @endcode
template <typename T>
class CursorState {
public:
    /// A `valid` state referring to `value`.
    static auto valid(const T& value) -> CursorState {
        return CursorState{CursorStatus::valid, &value};
    }

    static auto min_out() -> CursorState { return CursorState{CursorStatus::min_out, nullptr}; }
    static auto max_out() -> CursorState { return CursorState{CursorStatus::max_out, nullptr}; }
    static auto out_of_range() -> CursorState { return CursorState{CursorStatus::out_of_range, nullptr}; }
    static auto empty_container() -> CursorState {
        return CursorState{CursorStatus::empty_container, nullptr};
    }

    auto status() const -> CursorStatus { return status_; }
    auto is_valid() const -> bool { return status_ == CursorStatus::valid; }

    /// The element, or nullptr unless the state is `valid`.
    auto value() const -> const T* { return value_; }

    /// Equal when the statuses match and, for `valid` states, the
    /// referenced elements compare equal.
    friend auto operator==(const CursorState& a, const CursorState& b) -> bool
        requires std::equality_comparable<T>
    {
        if (a.status_ != b.status_) return false;
        if (a.value_ == nullptr || b.value_ == nullptr) return a.value_ == b.value_;
        return *a.value_ == *b.value_;
    }

private:
    CursorState(CursorStatus status, const T* value)
        : status_{status}, value_{value} {}

    CursorStatus status_;
    const T* value_;
};

}  // namespace cursorvec_cpp
