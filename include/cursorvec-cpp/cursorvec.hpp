/// @file cursorvec.hpp
/// @brief Umbrella header for the cursorvec-cpp library.
///
/// Include this single header for access to all public types:
/// CursorVec, Cursor, CursorState, CursorStatus, OpResult, Outcome
/// and Error.

#pragma once

#include <cursorvec-cpp/cursor.hpp>
#include <cursorvec-cpp/cursor_state.hpp>
#include <cursorvec-cpp/cursor_vec.hpp>
#include <cursorvec-cpp/error.hpp>
#include <cursorvec-cpp/op_result.hpp>
