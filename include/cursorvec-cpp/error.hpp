/// @file error.hpp
/// @brief Error types for the cursorvec-cpp library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace cursorvec_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    empty_container,      ///< The operation needs at least one element.
    cursor_out_of_range,  ///< The requested cursor position is not reachable.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::empty_container:     return "empty_container";
        case ErrorKind::cursor_out_of_range: return "cursor_out_of_range";
    }
    return "unknown";
}

/// The human-readable description attached to an error of the given kind.
constexpr auto describe(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::empty_container:     return "Empty container";
        case ErrorKind::cursor_out_of_range: return "Cursor out of range";
    }
    return "Unknown error";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    /// Construct an Error carrying the default description of its kind.
    explicit Error(ErrorKind k)
        : kind{k}, message{describe(k)} {}

    auto operator==(const Error& other) const -> bool = default;
};

}  // namespace cursorvec_cpp
