#include "frequency.hh"

#include <gtest/gtest.h>

TEST(letters_only, strips_non_letters)
{
    EXPECT_EQ(caesar::letters_only(""), "");
    EXPECT_EQ(caesar::letters_only("123 !?"), "");
    EXPECT_EQ(caesar::letters_only("a1 B-c"), "aBc");
    EXPECT_EQ(caesar::letters_only("Gr\xc3\xbc\xc3\x9f" "e"), "Gre");
}

TEST(letter_frequencies, empty)
{
    EXPECT_TRUE(caesar::letter_frequencies("").empty());
    EXPECT_TRUE(caesar::letter_frequencies("123 !?").empty());
}

TEST(letter_frequencies, case_folded)
{
    auto const expected = caesar::frequency_table{
        {'D', 1}, {'E', 1}, {'H', 1}, {'L', 3}, {'O', 2}, {'R', 1}, {'W', 1},
    };
    EXPECT_EQ(caesar::letter_frequencies("Hello, World!"), expected);
}

TEST(letter_frequencies, absent_letters_have_no_entry)
{
    auto const table = caesar::letter_frequencies("aAbB");
    EXPECT_EQ(table.size(), 2u);
    EXPECT_EQ(table.at('A'), 2u);
    EXPECT_EQ(table.at('B'), 2u);
    EXPECT_FALSE(table.contains('C'));
    EXPECT_FALSE(table.contains('a'));
}

TEST(frequency_order, empty)
{
    EXPECT_EQ(caesar::frequency_order({}), "");
}

TEST(frequency_order, descending)
{
    auto const table = caesar::frequency_table{{'A', 1}, {'B', 5}, {'C', 3}};
    EXPECT_EQ(caesar::frequency_order(table), "BCA");
}

TEST(frequency_order, ties_alphabetical)
{
    EXPECT_EQ(caesar::frequency_order(caesar::letter_frequencies("Hello, World!")), "LODEHRW");
    EXPECT_EQ(caesar::frequency_order(caesar::letter_frequencies("zyxcba")), "ABCXYZ");
}
