#include "score.hh"

#include <gtest/gtest.h>

#include <string>

TEST(common_words, membership)
{
    EXPECT_TRUE(caesar::is_common_word("THE"));
    EXPECT_TRUE(caesar::is_common_word("the"));
    EXPECT_TRUE(caesar::is_common_word("With"));
    EXPECT_TRUE(caesar::is_common_word("a"));
    EXPECT_FALSE(caesar::is_common_word(""));
    EXPECT_FALSE(caesar::is_common_word("THEN"));
    EXPECT_FALSE(caesar::is_common_word("TH"));
}

TEST(space_ratio, empty)
{
    EXPECT_EQ(caesar::space_ratio(""), 0.0);
}

TEST(space_ratio, counts_only_spaces)
{
    EXPECT_DOUBLE_EQ(caesar::space_ratio("a b c d"), 3.0 / 7.0);
    EXPECT_EQ(caesar::space_ratio("a\tb\nc"), 0.0);
}

TEST(space_ratio, counts_code_points)
{
    // two-byte 'é' counts as one character
    std::string const e_acute = "\xc3\xa9";
    EXPECT_EQ(caesar::character_count(e_acute + " " + e_acute), 3u);
    EXPECT_DOUBLE_EQ(caesar::space_ratio(e_acute + " " + e_acute), 1.0 / 3.0);
}

TEST(score, empty)
{
    EXPECT_EQ(caesar::score(""), 0.0);
    EXPECT_EQ(caesar::score("   "), 0.0);
}

TEST(score, common_words_counted)
{
    EXPECT_EQ(caesar::score("the"), 1.0);
    EXPECT_EQ(caesar::score("THE"), 1.0);
    EXPECT_EQ(caesar::score("the\tand\nof"), 3.0);
    EXPECT_EQ(caesar::score("thethe"), 0.0);
}

TEST(score, punctuation_stripped)
{
    EXPECT_EQ(caesar::score("(the)"), 1.0);
    EXPECT_EQ(caesar::score("\"and,\""), 1.0);
    // "it's" becomes ITS, which is not a common word
    EXPECT_EQ(caesar::score("it's"), 0.0);
}

TEST(score, space_bonus)
{
    EXPECT_EQ(caesar::score("zzzzzzz z"), 2.0);     // 1/9
    EXPECT_EQ(caesar::score("zzz z"), 2.0);         // 1/5
}

TEST(score, space_bonus_bounds_exclusive)
{
    EXPECT_EQ(caesar::score("zzzzzzzz z"), 0.0);    // exactly 0.1
    EXPECT_EQ(caesar::score("zz z"), 0.0);          // exactly 0.25
    EXPECT_EQ(caesar::score("z z z"), 0.0);         // too many spaces
}

TEST(score, space_bonus_uses_code_points)
{
    // 9 characters but 17 bytes, 1 space
    std::string text;
    for (int i = 0;  i < 7;  ++i) {
        text += "\xc3\xa9";
    }
    text += " \xc3\xa9";
    EXPECT_EQ(caesar::score(text), 2.0);
}

TEST(score, english_beats_gibberish)
{
    EXPECT_EQ(caesar::score("THE AND OF"), 5.0);
    EXPECT_EQ(caesar::score("ZQX VWK PLM"), 2.0);
    EXPECT_GT(caesar::score("THE AND OF"), caesar::score("ZQX VWK PLM"));
}

TEST(leading_space, ascii)
{
    EXPECT_EQ(caesar::leading_space(""), 0u);
    EXPECT_EQ(caesar::leading_space("a b"), 0u);
    for (auto const* s: {" x", "\tx", "\nx", "\vx", "\fx", "\rx"}) {
        EXPECT_EQ(caesar::leading_space(s), 1u);
    }
}

TEST(leading_space, unicode)
{
    EXPECT_EQ(caesar::leading_space("\xc2\x85"), 2u);           // NEL
    EXPECT_EQ(caesar::leading_space("\xc2\xa0" "x"), 2u);       // no-break space
    EXPECT_EQ(caesar::leading_space("\xe2\x80\x83"), 3u);       // em space
    EXPECT_EQ(caesar::leading_space("\xe2\x80\xa8"), 3u);       // line separator
    EXPECT_EQ(caesar::leading_space("\xe3\x80\x80"), 3u);       // ideographic space
    EXPECT_EQ(caesar::leading_space("\xc3\xa9"), 0u);           // e acute
    EXPECT_EQ(caesar::leading_space("\xe2\x80\x8b"), 0u);       // zero-width space
    EXPECT_EQ(caesar::leading_space("\xc2"), 0u);               // truncated
}

TEST(score, unicode_whitespace_separates_words)
{
    EXPECT_EQ(caesar::score("THE\xc2\xa0" "AND"), 2.0);
    EXPECT_EQ(caesar::score("the\xc2\x85" "of"), 2.0);
    EXPECT_EQ(caesar::score("to\xe3\x80\x80" "be"), 2.0);
    // other multibyte characters are stripped from the word
    EXPECT_EQ(caesar::score("THE\xc3\xa9"), 1.0);
}

TEST(score, unicode_whitespace_not_counted_as_space)
{
    // only ' ' counts towards the space bonus
    EXPECT_EQ(caesar::score("zzz\xc2\xa0" "z"), 0.0);
}
