/// @file cursor.hpp
/// @brief Bounded index that advances and retreats within a capacity.

#pragma once

#include <cursorvec-cpp/op_result.hpp>

#include <cstddef>

namespace cursorvec_cpp {

/// A position marker over a sequence of `capacity()` elements.
///
/// The cursor never looks at the sequence itself; it only knows how many
/// elements there are. Whenever the capacity is non-zero the index is a
/// valid subscript, `0 <= index() < capacity()`. With a capacity of zero
/// the index sits at 0 and every move fails.
///
/// With rotation enabled, stepping past either end wraps to the other end
/// instead of failing.
///
/// @code
/// auto cur = Cursor{3};
/// cur.set_rotation(true);
/// cur.decrease();  // index() == 2
/// @endcode
class Cursor {
public:
    /// Construct a cursor over an empty sequence.
    Cursor() = default;

    /// Construct a cursor at index 0 over `capacity` elements.
    explicit Cursor(std::size_t capacity) : capacity_{capacity} {}

    auto capacity() const -> std::size_t { return capacity_; }
    auto rotation() const -> bool { return rotation_; }

    /// The current index. Meaningless when capacity() is 0.
    auto index() const -> std::size_t { return index_; }

    /// Enable or disable wraparound at both ends.
    void set_rotation(bool rotation) { rotation_ = rotation; }

    /// Set the capacity, clamping the index to the new last slot.
    /// A capacity of 0 resets the index to 0.
    void set_capacity(std::size_t capacity);

    /// Jump to `index`. Fails without moving unless `index < capacity()`.
    auto set_index(std::size_t index) -> OpResult;

    /// Step forward one slot, wrapping to 0 from the last slot if rotating.
    auto increase() -> OpResult;

    /// Step back one slot, wrapping to the last slot from 0 if rotating.
    auto decrease() -> OpResult;

    auto operator==(const Cursor&) const -> bool = default;

private:
    std::size_t capacity_{0};
    bool rotation_{false};
    std::size_t index_{0};
};

}  // namespace cursorvec_cpp
