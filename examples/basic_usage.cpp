// basic_usage — demonstrates core cursorvec-cpp API
//
// Shows builder-style construction, strict and "always" cursor moves,
// rotation, manual cursor placement, and keeping the cursor in sync with
// the container through update_cursor() and modify().
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <cursorvec-cpp/cursorvec.hpp>

#include <cstdio>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cv = cursorvec_cpp;

template <typename T>
static void print_state(const char* label, const cv::CursorState<T>& state) {
    const auto status = cv::to_string_view(state.status());
    if (const auto* value = state.value()) {
        if constexpr (std::is_same_v<T, std::string>) {
            std::printf("%-28s %.*s(\"%s\")\n", label,
                        static_cast<int>(status.size()), status.data(), value->c_str());
        } else {
            std::printf("%-28s %.*s(%d)\n", label,
                        static_cast<int>(status.size()), status.data(), *value);
        }
    } else {
        std::printf("%-28s %.*s\n", label, static_cast<int>(status.size()), status.data());
    }
}

int main() {
    auto words = cv::CursorVec<std::string>{}
        .with_container({"first", "second", "third", "fourth", "fifth"});

    // -- Strict moves: report max_out / min_out at the ends -------------------
    print_state("get_current()", words.get_current());
    print_state("move_next_and_get()", words.move_next_and_get());
    print_state("move_next_nth_and_get(3)", words.move_next_nth_and_get(3));
    print_state("move_next_and_get()", words.move_next_and_get());

    print_state("move_prev_and_get()", words.move_prev_and_get());
    print_state("move_prev_nth_and_get(3)", words.move_prev_nth_and_get(3));
    print_state("move_prev_and_get()", words.move_prev_and_get());

    // -- "Always" moves: read whatever the cursor ends up on ------------------
    if (auto r = words.set_cursor(0); !cv::is_ok(r)) {
        std::printf("set_cursor(0) failed\n");
        return 1;
    }
    if (const auto* last = words.move_next_nth_and_get_always(10000)) {
        std::printf("%-28s %s\n", "move_next_nth_and_get_always", last->c_str());
    }
    if (const auto* first = words.move_prev_nth_and_get_always(10000)) {
        std::printf("%-28s %s\n", "move_prev_nth_and_get_always", first->c_str());
    }

    // -- Errors from plain moves ----------------------------------------------
    if (auto r = words.move_prev(); !cv::is_ok(r)) {
        if (auto err = cv::error_of(r)) {
            std::printf("move_prev() failed: %s\n", err->message.c_str());
        } else {
            std::printf("move_prev() failed\n");
        }
    }

    // -- Rotating cursor ------------------------------------------------------
    auto numbers = cv::CursorVec<int>{}
        .rotatable(true)
        .with_container({1, 2, 3, 4, 5, 6, 7, 8});

    print_state("move_next_nth_and_get(10)", numbers.move_next_nth_and_get(10));
    if (const auto* n = numbers.move_next_nth_and_get_always(4)) {
        std::printf("%-28s %d\n", "move_next_nth_and_get_always", *n);
    }

    // -- Direct edits need update_cursor() ------------------------------------
    numbers.container().resize(5);
    numbers.update_cursor();
    print_state("after resize + update", numbers.get_current());

    numbers.container().resize(1);
    print_state("after resize, no update", numbers.get_current());
    numbers.update_cursor();
    print_state("after update_cursor()", numbers.get_current());

    // -- modify() resynchronizes automatically --------------------------------
    numbers.set_container({1, 2, 3, 4, 5, 6, 7, 8});
    if (!cv::is_ok(numbers.set_cursor(6))) return 1;
    print_state("set_cursor(6)", numbers.get_current());

    numbers.modify([](std::vector<int>& v) {
        std::erase_if(v, [](int n) { return n % 2 != 0; });
    });
    print_state("after modify (evens only)", numbers.get_current());
    std::printf("cursor index: %zu of %zu\n", *numbers.get_cursor(), numbers.size());

    return 0;
}
