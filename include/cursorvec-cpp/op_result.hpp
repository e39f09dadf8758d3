/// @file op_result.hpp
/// @brief The failure-signaling policy shared by every fallible operation.
///
/// The policy is chosen once, at build time, through the
/// CURSORVEC_CPP_STRICT macro (set by the CMake option of the same name):
///
///  - strict (1, the default): OpResult is Outcome, which carries an Error
///    describing why the operation failed;
///  - boolean (0): OpResult is a plain bool.
///
/// Code that must work under either policy should build results with ok()
/// and fail() and inspect them with is_ok() and error_of().

#pragma once

#include <cursorvec-cpp/error.hpp>

#include <optional>
#include <utility>

#ifndef CURSORVEC_CPP_STRICT
#define CURSORVEC_CPP_STRICT 1
#endif

namespace cursorvec_cpp {

/// True when OpResult carries a structured Error.
inline constexpr bool strict_op_results = (CURSORVEC_CPP_STRICT != 0);

/// Success, or an Error describing a failed operation.
///
/// @code
/// if (auto r = vec.move_next(); !r) {
///     std::printf("%s\n", r.error()->message.c_str());
/// }
/// @endcode
class Outcome {
public:
    /// A successful outcome.
    Outcome() = default;

    /// A failed outcome carrying the given error.
    explicit Outcome(Error error) : error_{std::move(error)} {}

    /// Check if the operation succeeded.
    auto is_ok() const -> bool { return !error_.has_value(); }

    explicit operator bool() const { return is_ok(); }

    /// The error of a failed outcome, or nullptr on success.
    auto error() const -> const Error* {
        return error_ ? &*error_ : nullptr;
    }

    auto operator==(const Outcome&) const -> bool = default;

private:
    std::optional<Error> error_;
};

#if CURSORVEC_CPP_STRICT
using OpResult = Outcome;
#else
using OpResult = bool;
#endif

/// A successful OpResult.
auto ok() -> OpResult;

/// A failed OpResult of the given kind.
auto fail(ErrorKind kind) -> OpResult;

/// Check if an OpResult reports success.
auto is_ok(const OpResult& result) -> bool;

/// The error carried by a failed OpResult.
/// Always nullopt under the boolean policy.
auto error_of(const OpResult& result) -> std::optional<Error>;

}  // namespace cursorvec_cpp
