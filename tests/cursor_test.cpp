#include <cursorvec-cpp/cursor.hpp>

#include <gtest/gtest.h>

using namespace cursorvec_cpp;

// -- Construction -------------------------------------------------------------

TEST(Cursor, default_constructed_is_empty_and_bounded) {
    const auto cur = Cursor{};
    EXPECT_EQ(cur.capacity(), 0u);
    EXPECT_EQ(cur.index(), 0u);
    EXPECT_FALSE(cur.rotation());
}

TEST(Cursor, constructed_with_capacity_starts_at_zero) {
    const auto cur = Cursor{5};
    EXPECT_EQ(cur.capacity(), 5u);
    EXPECT_EQ(cur.index(), 0u);
}

TEST(Cursor, set_rotation_toggles) {
    auto cur = Cursor{3};
    cur.set_rotation(true);
    EXPECT_TRUE(cur.rotation());
    cur.set_rotation(false);
    EXPECT_FALSE(cur.rotation());
}

// -- set_capacity -------------------------------------------------------------

TEST(Cursor, growing_capacity_keeps_index) {
    auto cur = Cursor{3};
    ASSERT_TRUE(is_ok(cur.set_index(2)));
    cur.set_capacity(10);
    EXPECT_EQ(cur.index(), 2u);
}

TEST(Cursor, shrinking_capacity_clamps_index_to_last_slot) {
    auto cur = Cursor{10};
    ASSERT_TRUE(is_ok(cur.set_index(8)));
    cur.set_capacity(4);
    EXPECT_EQ(cur.capacity(), 4u);
    EXPECT_EQ(cur.index(), 3u);
}

TEST(Cursor, shrinking_capacity_keeps_index_still_in_range) {
    auto cur = Cursor{10};
    ASSERT_TRUE(is_ok(cur.set_index(2)));
    cur.set_capacity(4);
    EXPECT_EQ(cur.index(), 2u);
}

TEST(Cursor, zero_capacity_resets_index_without_underflow) {
    auto cur = Cursor{6};
    ASSERT_TRUE(is_ok(cur.set_index(5)));
    cur.set_capacity(0);
    EXPECT_EQ(cur.capacity(), 0u);
    EXPECT_EQ(cur.index(), 0u);
}

TEST(Cursor, zero_capacity_from_default_stays_at_zero) {
    auto cur = Cursor{};
    cur.set_capacity(0);
    EXPECT_EQ(cur.index(), 0u);
}

TEST(Cursor, set_capacity_is_idempotent) {
    auto cur = Cursor{9};
    ASSERT_TRUE(is_ok(cur.set_index(7)));
    cur.set_capacity(3);
    const auto once = cur;
    cur.set_capacity(3);
    EXPECT_EQ(cur, once);
}

// -- set_index ----------------------------------------------------------------

TEST(Cursor, set_index_within_bounds_succeeds) {
    auto cur = Cursor{4};
    EXPECT_TRUE(is_ok(cur.set_index(0)));
    EXPECT_TRUE(is_ok(cur.set_index(3)));
    EXPECT_EQ(cur.index(), 3u);
}

TEST(Cursor, set_index_equal_to_capacity_is_rejected) {
    auto cur = Cursor{4};
    ASSERT_TRUE(is_ok(cur.set_index(1)));

    const auto r = cur.set_index(4);
    EXPECT_FALSE(is_ok(r));
    EXPECT_EQ(cur.index(), 1u);
    if constexpr (strict_op_results) {
        const auto err = error_of(r);
        ASSERT_TRUE(err.has_value());
        EXPECT_EQ(err->kind, ErrorKind::cursor_out_of_range);
        EXPECT_EQ(err->message, "Cursor out of range");
    }
}

TEST(Cursor, set_index_beyond_capacity_is_rejected) {
    auto cur = Cursor{4};
    EXPECT_FALSE(is_ok(cur.set_index(100)));
    EXPECT_EQ(cur.index(), 0u);
}

TEST(Cursor, set_index_on_zero_capacity_is_rejected) {
    auto cur = Cursor{};
    EXPECT_FALSE(is_ok(cur.set_index(0)));
    EXPECT_EQ(cur.index(), 0u);
}

// -- increase -----------------------------------------------------------------

TEST(Cursor, increase_steps_forward) {
    auto cur = Cursor{3};
    EXPECT_TRUE(is_ok(cur.increase()));
    EXPECT_EQ(cur.index(), 1u);
    EXPECT_TRUE(is_ok(cur.increase()));
    EXPECT_EQ(cur.index(), 2u);
}

TEST(Cursor, increase_at_last_slot_fails_when_bounded) {
    auto cur = Cursor{3};
    ASSERT_TRUE(is_ok(cur.set_index(2)));

    const auto r = cur.increase();
    EXPECT_FALSE(is_ok(r));
    EXPECT_EQ(cur.index(), 2u);
    if constexpr (strict_op_results) {
        const auto err = error_of(r);
        ASSERT_TRUE(err.has_value());
        EXPECT_EQ(err->kind, ErrorKind::cursor_out_of_range);
    }
}

TEST(Cursor, increase_at_last_slot_wraps_when_rotating) {
    auto cur = Cursor{3};
    cur.set_rotation(true);
    ASSERT_TRUE(is_ok(cur.set_index(2)));
    EXPECT_TRUE(is_ok(cur.increase()));
    EXPECT_EQ(cur.index(), 0u);
}

TEST(Cursor, increase_on_zero_capacity_fails) {
    auto cur = Cursor{};
    cur.set_rotation(true);

    const auto r = cur.increase();
    EXPECT_FALSE(is_ok(r));
    EXPECT_EQ(cur.index(), 0u);
    if constexpr (strict_op_results) {
        const auto err = error_of(r);
        ASSERT_TRUE(err.has_value());
        EXPECT_EQ(err->kind, ErrorKind::empty_container);
    }
}

TEST(Cursor, single_slot_rotation_stays_put) {
    auto cur = Cursor{1};
    cur.set_rotation(true);
    EXPECT_TRUE(is_ok(cur.increase()));
    EXPECT_EQ(cur.index(), 0u);
    EXPECT_TRUE(is_ok(cur.decrease()));
    EXPECT_EQ(cur.index(), 0u);
}

// -- decrease -----------------------------------------------------------------

TEST(Cursor, decrease_steps_back) {
    auto cur = Cursor{3};
    ASSERT_TRUE(is_ok(cur.set_index(2)));
    EXPECT_TRUE(is_ok(cur.decrease()));
    EXPECT_EQ(cur.index(), 1u);
}

TEST(Cursor, decrease_at_zero_fails_when_bounded) {
    auto cur = Cursor{3};
    EXPECT_FALSE(is_ok(cur.decrease()));
    EXPECT_EQ(cur.index(), 0u);
}

TEST(Cursor, decrease_at_zero_wraps_when_rotating) {
    auto cur = Cursor{3};
    cur.set_rotation(true);
    EXPECT_TRUE(is_ok(cur.decrease()));
    EXPECT_EQ(cur.index(), 2u);
}

TEST(Cursor, decrease_on_zero_capacity_fails) {
    auto cur = Cursor{};
    const auto r = cur.decrease();
    EXPECT_FALSE(is_ok(r));
    if constexpr (strict_op_results) {
        const auto err = error_of(r);
        ASSERT_TRUE(err.has_value());
        EXPECT_EQ(err->kind, ErrorKind::empty_container);
    }
}

TEST(Cursor, full_rotation_returns_to_start) {
    auto cur = Cursor{5};
    cur.set_rotation(true);
    ASSERT_TRUE(is_ok(cur.set_index(3)));
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(is_ok(cur.increase()));
    }
    EXPECT_EQ(cur.index(), 3u);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(is_ok(cur.decrease()));
    }
    EXPECT_EQ(cur.index(), 3u);
}
