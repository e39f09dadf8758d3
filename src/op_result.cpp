#include <cursorvec-cpp/op_result.hpp>

namespace cursorvec_cpp {

#if CURSORVEC_CPP_STRICT

auto ok() -> OpResult { return Outcome{}; }

auto fail(ErrorKind kind) -> OpResult { return Outcome{Error{kind}}; }

auto is_ok(const OpResult& result) -> bool { return result.is_ok(); }

auto error_of(const OpResult& result) -> std::optional<Error> {
    if (const auto* err = result.error()) return *err;
    return std::nullopt;
}

#else

auto ok() -> OpResult { return true; }

auto fail(ErrorKind) -> OpResult { return false; }

auto is_ok(const OpResult& result) -> bool { return result; }

auto error_of(const OpResult&) -> std::optional<Error> { return std::nullopt; }

#endif

}  // namespace cursorvec_cpp
