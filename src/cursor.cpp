#include <cursorvec-cpp/cursor.hpp>

namespace cursorvec_cpp {

void Cursor::set_capacity(std::size_t capacity) {
    capacity_ = capacity;
    if (capacity_ == 0) {
        index_ = 0;
    } else if (index_ >= capacity_) {
        index_ = capacity_ - 1;
    }
}

auto Cursor::set_index(std::size_t index) -> OpResult {
    if (index >= capacity_) {
        return fail(ErrorKind::cursor_out_of_range);
    }
    index_ = index;
    return ok();
}

auto Cursor::increase() -> OpResult {
    if (capacity_ == 0) {
        return fail(ErrorKind::empty_container);
    }
    if (index_ == capacity_ - 1) {
        if (!rotation_) {
            return fail(ErrorKind::cursor_out_of_range);
        }
        index_ = 0;
        return ok();
    }
    ++index_;
    return ok();
}

auto Cursor::decrease() -> OpResult {
    if (capacity_ == 0) {
        return fail(ErrorKind::empty_container);
    }
    if (index_ == 0) {
        if (!rotation_) {
            return fail(ErrorKind::cursor_out_of_range);
        }
        index_ = capacity_ - 1;
        return ok();
    }
    --index_;
    return ok();
}

}  // namespace cursorvec_cpp
