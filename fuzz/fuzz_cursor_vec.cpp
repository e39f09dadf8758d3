// Fuzz target for CursorVec — replays an arbitrary stream of cursor moves
// and container edits and checks the cursor never escapes the container
// after a resynchronizing call.

#include <cursorvec-cpp/cursorvec.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

namespace {

void check(bool condition) {
    if (!condition) std::abort();
}

// Every mutation made through CursorVec's own API leaves a valid cursor.
void check_synced(const cursorvec_cpp::CursorVec<std::uint8_t>& vec) {
    check(vec.cursor().capacity() == vec.size());
    if (vec.empty()) {
        check(!vec.get_cursor().has_value());
        check(vec.get_current().status() == cursorvec_cpp::CursorStatus::empty_container);
    } else {
        check(*vec.get_cursor() < vec.size());
        check(vec.get_current().is_valid());
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::span<const std::uint8_t>(data, size);
    auto vec = cursorvec_cpp::CursorVec<std::uint8_t>{};
    auto stale = false;

    for (std::size_t i = 0; i < input.size(); ++i) {
        const auto op = input[i] % 12;
        const auto arg = static_cast<std::size_t>(input[i] / 12);

        switch (op) {
            case 0: vec.move_next(); break;
            case 1: vec.move_prev(); break;
            case 2: (void)vec.move_next_nth_and_get(arg); break;
            case 3: (void)vec.move_prev_nth_and_get(arg); break;
            case 4: (void)vec.move_next_nth_and_get_always(arg); break;
            case 5: (void)vec.move_prev_nth_and_get_always(arg); break;
            case 6: vec.set_cursor(arg); break;
            case 7: vec.set_rotatable(!vec.is_rotatable()); break;
            case 8:
                vec.modify([&](auto& v) { v.push_back(input[i]); });
                stale = false;
                break;
            case 9:
                vec.modify([&](auto& v) { v.resize(v.size() > arg ? v.size() - arg : 0); });
                stale = false;
                break;
            case 10:
                // Unsynchronized edit: reads may report out_of_range until resync.
                vec.container().resize(arg);
                stale = true;
                break;
            case 11:
                vec.update_cursor();
                stale = false;
                break;
        }

        if (!stale) check_synced(vec);
    }
    return 0;
}
