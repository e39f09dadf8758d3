/// @file cursor_vec.hpp
/// @brief CursorVec: a vector paired with a bounded cursor.

#pragma once

#include <cursorvec-cpp/cursor.hpp>
#include <cursorvec-cpp/cursor_state.hpp>
#include <cursorvec-cpp/op_result.hpp>

#include <concepts>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace cursorvec_cpp {

/// A vector with a built-in cursor marking the "current" element.
///
/// Cursor moves through CursorVec always respect the bounds of the
/// container: a bounded cursor stops at either end (reporting max_out or
/// min_out), a rotating cursor wraps around.
///
/// The backing vector is reachable through container(), begin()/end() and
/// operator[] for any standard vector operation. Changing its length that
/// way does not update the cursor: call update_cursor() afterwards, or do
/// the edit inside modify(), which resynchronizes automatically. Until
/// then a read may report out_of_range.
///
/// @code
/// auto vec = CursorVec<std::string>{}
///     .with_container({"first", "second", "third"});
///
/// vec.move_next_and_get();          // valid("second")
/// vec.move_next_nth_and_get(5);     // max_out, cursor stays on "third"
///
/// vec.modify([](auto& v) { v.pop_back(); });
/// *vec.get_current().value();       // "second"
/// @endcode
template <typename T>
class CursorVec {
public:
    using container_type = std::vector<T>;
    using value_type = T;
    using size_type = std::size_t;
    using iterator = typename container_type::iterator;
    using const_iterator = typename container_type::const_iterator;

    /// Construct an empty container with a bounded cursor.
    CursorVec() = default;

    /// Construct over `container`, cursor at the first element.
    explicit CursorVec(container_type container)
        : container_{std::move(container)} {
        update_cursor();
    }

    // -- Builder --------------------------------------------------------------

    /// Replace the container (chainable).
    auto with_container(container_type container) & -> CursorVec& {
        set_container(std::move(container));
        return *this;
    }

    /// Replace the container (chainable, on a temporary).
    auto with_container(container_type container) && -> CursorVec {
        set_container(std::move(container));
        return std::move(*this);
    }

    /// Enable or disable cursor rotation (chainable).
    auto rotatable(bool rotatable) & -> CursorVec& {
        set_rotatable(rotatable);
        return *this;
    }

    /// Enable or disable cursor rotation (chainable, on a temporary).
    auto rotatable(bool rotatable) && -> CursorVec {
        set_rotatable(rotatable);
        return std::move(*this);
    }

    // -- Configuration --------------------------------------------------------

    void set_rotatable(bool rotatable) { cursor_.set_rotation(rotatable); }
    auto is_rotatable() const -> bool { return cursor_.rotation(); }

    /// Replace the container and resynchronize the cursor.
    /// The cursor keeps its index if it is still in range, otherwise it is
    /// clamped to the new last element.
    void set_container(container_type container) {
        container_ = std::move(container);
        update_cursor();
    }

    // -- Resynchronization ----------------------------------------------------

    /// Recompute the cursor's bounds from the container's current size.
    void update_cursor() { cursor_.set_capacity(container_.size()); }

    /// Edit the container in place, then resynchronize the cursor.
    ///
    /// The cursor is resynchronized even if `fn` throws.
    ///
    /// @code
    /// vec.modify([](auto& v) { std::erase_if(v, [](int n) { return n % 2; }); });
    /// @endcode
    template <typename Fn>
        requires std::invocable<Fn, container_type&> &&
                 std::is_void_v<std::invoke_result_t<Fn, container_type&>>
    void modify(Fn&& fn) {
        auto resync = ResyncGuard{*this};
        std::forward<Fn>(fn)(container_);
    }

    /// Edit the container in place, resynchronize the cursor and return
    /// the result of `fn`.
    ///
    /// @code
    /// auto removed = vec.modify([](auto& v) { return std::erase(v, 0); });
    /// @endcode
    template <typename Fn>
        requires std::invocable<Fn, container_type&> &&
                 (!std::is_void_v<std::invoke_result_t<Fn, container_type&>>)
    auto modify(Fn&& fn) -> std::invoke_result_t<Fn, container_type&> {
        auto resync = ResyncGuard{*this};
        return std::forward<Fn>(fn)(container_);
    }

    // -- Reading --------------------------------------------------------------

    /// The element under the cursor.
    auto get_current() const -> CursorState<T> {
        if (container_.empty()) return CursorState<T>::empty_container();
        return read_cursor();
    }

    // -- Move and read --------------------------------------------------------

    /// Move to the next element and read it.
    /// Returns max_out, leaving the cursor in place, if there is no next
    /// element and rotation is off.
    auto move_next_and_get() -> CursorState<T> {
        return move_nth_and_get(Direction::next, 1);
    }

    /// Move to the previous element and read it.
    /// Returns min_out, leaving the cursor in place, if there is no previous
    /// element and rotation is off.
    auto move_prev_and_get() -> CursorState<T> {
        return move_nth_and_get(Direction::prev, 1);
    }

    /// Move forward `amount` times and read the element reached.
    /// Stops at the first step that fails and returns max_out; the cursor
    /// stays where the last successful step left it.
    auto move_next_nth_and_get(std::size_t amount) -> CursorState<T> {
        return move_nth_and_get(Direction::next, amount);
    }

    /// Move back `amount` times and read the element reached.
    /// Stops at the first step that fails and returns min_out.
    auto move_prev_nth_and_get(std::size_t amount) -> CursorState<T> {
        return move_nth_and_get(Direction::prev, amount);
    }

    // -- Move and always read -------------------------------------------------

    /// Try to move to the next element and read whatever the cursor points
    /// at afterwards. Returns nullptr only for an empty container.
    auto move_next_and_get_always() -> const T* {
        return move_nth_and_get_always(Direction::next, 1);
    }

    /// Try to move to the previous element and read whatever the cursor
    /// points at afterwards. Returns nullptr only for an empty container.
    auto move_prev_and_get_always() -> const T* {
        return move_nth_and_get_always(Direction::prev, 1);
    }

    /// Try to move forward `amount` times, giving up at the first failed
    /// step, and read the element reached.
    auto move_next_nth_and_get_always(std::size_t amount) -> const T* {
        return move_nth_and_get_always(Direction::next, amount);
    }

    /// Try to move back `amount` times, giving up at the first failed
    /// step, and read the element reached.
    auto move_prev_nth_and_get_always(std::size_t amount) -> const T* {
        return move_nth_and_get_always(Direction::prev, amount);
    }

    // -- Plain moves ----------------------------------------------------------

    auto move_next() -> OpResult {
        if (container_.empty()) return fail(ErrorKind::empty_container);
        return cursor_.increase();
    }

    auto move_prev() -> OpResult {
        if (container_.empty()) return fail(ErrorKind::empty_container);
        return cursor_.decrease();
    }

    // -- Manual cursor access -------------------------------------------------

    /// The cursor index, or nullopt if the container is empty.
    auto get_cursor() const -> std::optional<std::size_t> {
        if (container_.empty()) return std::nullopt;
        return cursor_.index();
    }

    /// Place the cursor at `index`. Fails without moving unless `index` is
    /// below the cursor's current bound.
    auto set_cursor(std::size_t index) -> OpResult {
        if (container_.empty()) return fail(ErrorKind::empty_container);
        return cursor_.set_index(index);
    }

    /// The cursor itself, for inspection.
    auto cursor() const -> const Cursor& { return cursor_; }

    // -- Backing container ----------------------------------------------------

    /// Direct access to the backing vector.
    /// Length changes made here require update_cursor().
    auto container() -> container_type& { return container_; }
    auto container() const -> const container_type& { return container_; }

    /// Move the backing vector out, leaving this CursorVec unusable.
    auto take_container() && -> container_type { return std::move(container_); }

    auto size() const -> std::size_t { return container_.size(); }
    auto empty() const -> bool { return container_.empty(); }

    auto operator[](std::size_t index) -> T& { return container_[index]; }
    auto operator[](std::size_t index) const -> const T& { return container_[index]; }

    auto begin() -> iterator { return container_.begin(); }
    auto end() -> iterator { return container_.end(); }
    auto begin() const -> const_iterator { return container_.begin(); }
    auto end() const -> const_iterator { return container_.end(); }

private:
    enum class Direction { next, prev };

    /// Calls update_cursor() when leaving modify(), normally or not.
    struct ResyncGuard {
        CursorVec& owner;

        explicit ResyncGuard(CursorVec& o) : owner{o} {}
        ~ResyncGuard() { owner.update_cursor(); }

        ResyncGuard(const ResyncGuard&) = delete;
        auto operator=(const ResyncGuard&) -> ResyncGuard& = delete;
    };

    auto step(Direction dir) -> bool {
        return is_ok(dir == Direction::next ? cursor_.increase() : cursor_.decrease());
    }

    /// Take up to `amount` steps; false at the first step that fails.
    auto step_nth(Direction dir, std::size_t amount) -> bool {
        for (std::size_t i = 0; i < amount; ++i) {
            if (!step(dir)) return false;
        }
        return true;
    }

    auto move_nth_and_get(Direction dir, std::size_t amount) -> CursorState<T> {
        if (container_.empty()) return CursorState<T>::empty_container();
        if (!step_nth(dir, amount)) {
            return dir == Direction::next ? CursorState<T>::max_out()
                                          : CursorState<T>::min_out();
        }
        return read_cursor();
    }

    auto move_nth_and_get_always(Direction dir, std::size_t amount) -> const T* {
        if (container_.empty()) return nullptr;
        step_nth(dir, amount);
        return element_at_cursor();
    }

    auto element_at_cursor() const -> const T* {
        const auto index = cursor_.index();
        if (index >= container_.size()) return nullptr;
        return &container_[index];
    }

    auto read_cursor() const -> CursorState<T> {
        if (const auto* value = element_at_cursor()) {
            return CursorState<T>::valid(*value);
        }
        return CursorState<T>::out_of_range();
    }

    container_type container_;
    Cursor cursor_;
};

}  // namespace cursorvec_cpp
