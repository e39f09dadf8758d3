#include <cursorvec-cpp/error.hpp>

#include <gtest/gtest.h>

using namespace cursorvec_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::empty_container),     "empty_container");
    EXPECT_EQ(to_string_view(ErrorKind::cursor_out_of_range), "cursor_out_of_range");
}

TEST(ErrorKind, describe_gives_readable_messages) {
    EXPECT_EQ(describe(ErrorKind::empty_container),     "Empty container");
    EXPECT_EQ(describe(ErrorKind::cursor_out_of_range), "Cursor out of range");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::empty_container, "nothing here"};
    const auto e2 = Error{ErrorKind::empty_container, "nothing here"};
    const auto e3 = Error{ErrorKind::cursor_out_of_range, "nothing here"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::cursor_out_of_range, "foo"};
    const auto e2 = Error{ErrorKind::cursor_out_of_range, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Error, kind_only_constructor_uses_description) {
    const auto e = Error{ErrorKind::cursor_out_of_range};

    EXPECT_EQ(e.kind, ErrorKind::cursor_out_of_range);
    EXPECT_EQ(e.message, "Cursor out of range");
}
