#include "shift.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <climits>
#include <format>
#include <ios>
#include <sstream>
#include <streambuf>
#include <string>

namespace test
{
    // Accepts nothing at all.
    struct full_buffer : std::streambuf
    {
        int_type overflow(int_type) override { return traits_type::eof(); }
    };

    // Accepts characters but can't deliver them.
    struct unsyncable_buffer : std::stringbuf
    {
        int sync() override { return -1; }
    };
}

TEST(normalise_shift, in_range)
{
    for (int i = 0;  i < 26;  ++i) {
        EXPECT_EQ(caesar::normalise_shift(i), i);
    }
}

TEST(normalise_shift, out_of_range)
{
    EXPECT_EQ(caesar::normalise_shift(26), 0);
    EXPECT_EQ(caesar::normalise_shift(27), 1);
    EXPECT_EQ(caesar::normalise_shift(-1), 25);
    EXPECT_EQ(caesar::normalise_shift(-26), 0);
    EXPECT_EQ(caesar::normalise_shift(-27), 25);
    EXPECT_EQ(caesar::normalise_shift(INT_MAX), 23);
    EXPECT_EQ(caesar::normalise_shift(INT_MIN), 2);
}

TEST(inverse_shift, complements)
{
    EXPECT_EQ(caesar::inverse_shift(0), 0);
    EXPECT_EQ(caesar::inverse_shift(1), 25);
    EXPECT_EQ(caesar::inverse_shift(13), 13);
    EXPECT_EQ(caesar::inverse_shift(-3), 3);
    EXPECT_EQ(caesar::inverse_shift(INT_MIN), 24);
}

TEST(encode, empty)
{
    for (int s: {-100, -1, 0, 1, 25, 26, 1000}) {
        EXPECT_EQ(caesar::encode("", s), "");
    }
}

TEST(encode, lowercase)
{
    EXPECT_EQ(caesar::encode("abc", 1), "bcd");
    EXPECT_EQ(caesar::encode("xyz", 3), "abc");
}

TEST(encode, uppercase)
{
    EXPECT_EQ(caesar::encode("ABC", 1), "BCD");
    EXPECT_EQ(caesar::encode("XYZ", 3), "ABC");
}

TEST(encode, preserves_case_and_punctuation)
{
    EXPECT_EQ(caesar::encode("Hello, World!", 3), "Khoor, Zruog!");
    EXPECT_EQ(caesar::encode("a1 B2\tc3\n", 13), "n1 O2\tp3\n");
}

TEST(encode, negative_shift)
{
    EXPECT_EQ(caesar::encode("Khoor", -3), "Hello");
    EXPECT_EQ(caesar::encode("abc", -1), "zab");
}

TEST(encode, multibyte_untouched)
{
    // "Grüße!" in UTF-8
    std::string const text = "Gr\xc3\xbc\xc3\x9f" "e!";
    std::string const expected = "Hs\xc3\xbc\xc3\x9f" "f!";
    EXPECT_EQ(caesar::encode(text, 1), expected);
}

TEST(encode, shift_equivalence)
{
    std::string const text = "The Quick Brown Fox Jumps Over The Lazy Dog.";
    for (int s = -30;  s <= 30;  ++s) {
        SCOPED_TRACE(std::format("shift {}", s));
        auto const expected = caesar::encode(text, s);
        EXPECT_EQ(caesar::encode(text, s + 26), expected);
        EXPECT_EQ(caesar::encode(text, s - 26), expected);
    }
}

TEST(decode, known_shift)
{
    EXPECT_EQ(caesar::decode("Khoor, Zruog!", 3), "Hello, World!");
    EXPECT_EQ(caesar::decode("abc", 0), "abc");
    EXPECT_EQ(caesar::decode("abc", 26), "abc");
}

TEST(decode, round_trip)
{
    std::string const text = "Sphinx of black quartz, judge my vow! 0123 Gr\xc3\xbc\xc3\x9f" "e";
    for (int s = -60;  s <= 60;  ++s) {
        SCOPED_TRACE(std::format("shift {}", s));
        auto const ciphertext = caesar::encode(text, s);
        ASSERT_EQ(ciphertext.size(), text.size());
        EXPECT_EQ(caesar::decode(ciphertext, s), text);
    }
}

TEST(shift_text, structure_preserved)
{
    std::string const text = "Mixed CASE, with 42 digits & symbols ~";
    for (int s = 1;  s < 26;  ++s) {
        SCOPED_TRACE(std::format("shift {}", s));
        auto const shifted = caesar::shift_text(text, s);
        ASSERT_EQ(shifted.size(), text.size());
        for (std::size_t i = 0;  i < text.size();  ++i) {
            auto const c = text[i];
            auto const d = shifted[i];
            if (c >= 'a' && c <= 'z') {
                EXPECT_TRUE(d >= 'a' && d <= 'z');
                EXPECT_NE(c, d);
            } else if (c >= 'A' && c <= 'Z') {
                EXPECT_TRUE(d >= 'A' && d <= 'Z');
                EXPECT_NE(c, d);
            } else {
                EXPECT_EQ(c, d);
            }
        }
    }
}

TEST(rotator, transform_algorithm)
{
    std::string s = "Why did the chicken cross the road?";
    std::ranges::transform(s, s.begin(), caesar::rotator{13});
    EXPECT_EQ(s, "Jul qvq gur puvpxra pebff gur ebnq?");
    std::ranges::transform(s, s.begin(), caesar::rotator{13});
    EXPECT_EQ(s, "Why did the chicken cross the road?");
}

TEST(rotator, identity_for_non_letters)
{
    auto const r = caesar::rotator{5};
    for (int i = 0;  i <= UCHAR_MAX;  ++i) {
        auto const c = static_cast<char>(i);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')) {
            continue;
        }
        EXPECT_EQ(r(c), c) << "char code " << i;
    }
}

TEST(rotate_stream, copies_and_shifts)
{
    std::istringstream in{"Hello, World!\nline two\n"};
    std::ostringstream out;
    caesar::rotate_stream(in, out, 3);
    EXPECT_EQ(out.str(), "Khoor, Zruog!\nolqh wzr\n");
}

TEST(rotate_stream, empty_input)
{
    std::istringstream in{""};
    std::ostringstream out;
    caesar::rotate_stream(in, out, 3);
    EXPECT_EQ(out.str(), "");
}

TEST(rotate_stream, write_failure_throws)
{
    std::istringstream in{"some text that can't be written"};
    test::full_buffer buf;
    std::ostream out{&buf};
    EXPECT_THROW(caesar::rotate_stream(in, out, 1), std::ios_base::failure);
}

TEST(rotate_stream, large_write_failure_throws)
{
    std::istringstream in{std::string(100'000, 'a')};
    test::full_buffer buf;
    std::ostream out{&buf};
    EXPECT_THROW(caesar::rotate_stream(in, out, 1), std::ios_base::failure);
}

TEST(rotate_stream, flush_failure_throws)
{
    std::istringstream in{"hi\n"};
    test::unsyncable_buffer buf;
    std::ostream out{&buf};
    EXPECT_THROW(caesar::rotate_stream(in, out, 1), std::ios_base::failure);
    // the stream itself carries no exception mask
    EXPECT_EQ(out.exceptions(), std::ios::goodbit);
}
