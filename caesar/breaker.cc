#include "breaker.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <numeric>
#include <ranges>
#include <string>

namespace test
{
    // Check that `shifts` holds each of 0..25 exactly once.
    void expect_every_shift_once(caesar::shift_sequence shifts)
    {
        std::ranges::sort(shifts);
        caesar::shift_sequence expected;
        std::iota(expected.begin(), expected.end(), 0);
        EXPECT_EQ(shifts, expected);
    }

    std::string const fox = "THE QUICK BROWN FOX";
}

TEST(break_brute_force, empty)
{
    auto const result = caesar::break_brute_force("");
    EXPECT_EQ(result, (caesar::decryption{"", 0}));
}

TEST(break_brute_force, recovers_shift)
{
    auto const ciphertext = caesar::encode(test::fox, 7);
    EXPECT_EQ(ciphertext, "AOL XBPJR IYVDU MVE");
    auto const result = caesar::break_brute_force(ciphertext);
    EXPECT_EQ(result.shift, 7);
    EXPECT_EQ(result.plaintext, test::fox);
}

TEST(break_brute_force, preserves_case)
{
    auto const result = caesar::break_brute_force("Aol xbpjr iyvdu mve");
    EXPECT_EQ(result, (caesar::decryption{"The quick brown fox", 7}));
}

TEST(break_brute_force, longer_text)
{
    std::string const plaintext = "Meet me at the park at noon, and do not be late";
    for (int s: {1, 11, 25}) {
        SCOPED_TRACE(std::format("shift {}", s));
        auto const result = caesar::break_brute_force(caesar::encode(plaintext, s));
        EXPECT_EQ(result, (caesar::decryption{plaintext, s}));
    }
}

TEST(break_brute_force, unshifted_input)
{
    EXPECT_EQ(caesar::break_brute_force(test::fox), (caesar::decryption{test::fox, 0}));
}

TEST(break_brute_force, first_best_wins_ties)
{
    // nothing scores, so every shift ties at zero
    EXPECT_EQ(caesar::break_brute_force("zzz"), (caesar::decryption{"zzz", 0}));
    EXPECT_EQ(caesar::break_brute_force("12345"), (caesar::decryption{"12345", 0}));
}

TEST(shift_priority, every_shift_once)
{
    for (auto const* text: {"", "!!!", "eeeee", "HHHHH", "AOL XBPJR IYVDU MVE", "abcdefghijklmnopqrstuvwxyz"}) {
        SCOPED_TRACE(text);
        test::expect_every_shift_once(caesar::shift_priority(text));
    }
}

TEST(shift_priority, preferred_first)
{
    // 'H' is three past 'E'
    auto const shifts = caesar::shift_priority("HHHHH");
    EXPECT_EQ(shifts[0], 3);
    EXPECT_EQ(shifts[1], 0);
    EXPECT_EQ(shifts[2], 1);
    EXPECT_EQ(shifts[3], 2);
    EXPECT_EQ(shifts[4], 4);
    EXPECT_EQ(shifts[25], 25);
}

TEST(shift_priority, preferred_before_e)
{
    // 'A' is 22 past 'E' (mod 26)
    auto const shifts = caesar::shift_priority("aaaab");
    EXPECT_EQ(shifts[0], 22);
    EXPECT_EQ(shifts[22], 21);
    EXPECT_EQ(shifts[23], 23);
}

TEST(shift_priority, preferred_zero_not_repeated)
{
    caesar::shift_sequence expected;
    std::iota(expected.begin(), expected.end(), 0);
    EXPECT_EQ(caesar::shift_priority("eeeee"), expected);
}

TEST(shift_priority, no_letters)
{
    caesar::shift_sequence expected;
    std::iota(expected.begin(), expected.end(), 0);
    EXPECT_EQ(caesar::shift_priority("1234 !"), expected);
}

TEST(break_frequency_analysis, empty)
{
    EXPECT_EQ(caesar::break_frequency_analysis(""), (caesar::decryption{"", 0}));
}

TEST(break_frequency_analysis, short_input_falls_back)
{
    for (auto const* text: {"AB!", "a b c d", "Khor", "1234567890"}) {
        SCOPED_TRACE(text);
        EXPECT_EQ(caesar::break_frequency_analysis(text), caesar::break_brute_force(text));
    }
    EXPECT_EQ(caesar::break_frequency_analysis("AB!"), (caesar::decryption{"AB!", 0}));
}

TEST(break_frequency_analysis, recovers_shift)
{
    auto const result = caesar::break_frequency_analysis(caesar::encode(test::fox, 7));
    EXPECT_EQ(result, (caesar::decryption{test::fox, 7}));
}

TEST(break_frequency_analysis, agrees_with_brute_force)
{
    std::string const plaintext = "Meet me at the park at noon, and do not be late";
    for (int s = 0;  s < 26;  ++s) {
        SCOPED_TRACE(std::format("shift {}", s));
        auto const ciphertext = caesar::encode(plaintext, s);
        auto const expected = caesar::decryption{plaintext, s};
        EXPECT_EQ(caesar::break_brute_force(ciphertext), expected);
        EXPECT_EQ(caesar::break_frequency_analysis(ciphertext), expected);
    }
}

TEST(break_frequency_analysis, first_best_wins_ties)
{
    // All shifts score zero, so the frequency hint decides.
    EXPECT_EQ(caesar::break_frequency_analysis("HHHHH"), (caesar::decryption{"EEEEE", 3}));
    EXPECT_EQ(caesar::break_brute_force("HHHHH"), (caesar::decryption{"HHHHH", 0}));
}

TEST(rank_shifts, all_shifts_best_first)
{
    auto const ranked = caesar::rank_shifts(caesar::encode(test::fox, 7));
    ASSERT_EQ(ranked.size(), 26u);

    EXPECT_EQ(ranked[0].shift, 7);
    EXPECT_EQ(ranked[0].plaintext, test::fox);
    EXPECT_EQ(ranked[0].score, 3.0);

    // the rest tie on the space bonus, in order of shift
    EXPECT_EQ(ranked[1].shift, 0);
    EXPECT_EQ(ranked[1].score, 2.0);
    EXPECT_EQ(ranked[25].shift, 25);

    EXPECT_TRUE(std::ranges::is_sorted(ranked, std::ranges::greater{}, &caesar::candidate::score));

    auto shifts = caesar::shift_sequence{};
    std::ranges::transform(ranked, shifts.begin(), &caesar::candidate::shift);
    test::expect_every_shift_once(shifts);
}

TEST(rank_shifts, agrees_with_brute_force)
{
    for (auto const* text: {"", "AB!", "Aol xbpjr iyvdu mve", "HHHHH"}) {
        SCOPED_TRACE(text);
        auto const best = caesar::rank_shifts(text).front();
        EXPECT_EQ((caesar::decryption{best.plaintext, best.shift}), caesar::break_brute_force(text));
    }
}

TEST(external_interface, same_as_breakers)
{
    auto const ciphertext = caesar::encode("To be or not to be, that is the question", 19);
    EXPECT_EQ(caesar::decode_brute_force(ciphertext), caesar::break_brute_force(ciphertext));
    EXPECT_EQ(caesar::decode_frequency_guided(ciphertext), caesar::break_frequency_analysis(ciphertext));
    EXPECT_EQ(caesar::decode_brute_force(ciphertext).shift, 19);
}
