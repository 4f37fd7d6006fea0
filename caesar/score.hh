#ifndef CAESAR_SCORE_H
#define CAESAR_SCORE_H

#include "frequency.hh"

#include <algorithm>
#include <array>
#include <cstddef>
#include <ranges>
#include <string>
#include <string_view>

namespace caesar
{
    // Common short English words, sorted for binary search.
    constexpr auto common_words = std::to_array<std::string_view>({
        "A", "AND", "AS", "AT", "BE", "DO", "FOR", "HAVE", "HE", "I",
        "IN", "IT", "NOT", "OF", "ON", "THAT", "THE", "TO", "WITH", "YOU",
    });
    static_assert(std::ranges::is_sorted(common_words));

    constexpr double common_word_weight = 1.0;
    constexpr double space_bonus = 2.0;
    constexpr double min_space_ratio = 0.10;
    constexpr double max_space_ratio = 0.25;

    inline bool is_common_word(std::string_view word)
    {
        auto const upper = word
            | std::views::transform(ascii_upper)
            | std::ranges::to<std::string>();
        return std::ranges::binary_search(common_words, std::string_view{upper});
    }

    // Number of Unicode code points in UTF-8 text.
    constexpr std::size_t character_count(std::string_view text) noexcept
    {
        auto is_continuation = [](char c) {
            return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
        };
        return text.size() - static_cast<std::size_t>(std::ranges::count_if(text, is_continuation));
    }

    inline double space_ratio(std::string_view text) noexcept
    {
        auto const total = character_count(text);
        if (!total) {
            return 0.0;
        }
        return static_cast<double>(std::ranges::count(text, ' ')) / static_cast<double>(total);
    }

    // Length in bytes of the whitespace character that begins UTF-8
    // `text`, or 0 if it doesn't begin with whitespace.  Recognises the
    // ASCII space characters and the Unicode White_Space code points.
    constexpr std::size_t leading_space(std::string_view text) noexcept
    {
        if (text.empty()) {
            return 0;
        }
        auto const b0 = static_cast<unsigned char>(text[0]);
        if (b0 < 0x80) {
            return b0 == ' ' || (b0 >= '\t' && b0 <= '\r');
        }
        if (text.size() >= 2 && b0 == 0xC2) {
            auto const b1 = static_cast<unsigned char>(text[1]);
            return b1 == 0x85 || b1 == 0xA0 ? 2 : 0;           // NEL, NBSP
        }
        if (text.size() >= 3) {
            auto const b1 = static_cast<unsigned char>(text[1]);
            auto const b2 = static_cast<unsigned char>(text[2]);
            bool const space =
                (b0 == 0xE1 && b1 == 0x9A && b2 == 0x80)            // U+1680
                || (b0 == 0xE2 && b1 == 0x80 && b2 >= 0x80 && b2 <= 0x8A) // U+2000..200A
                || (b0 == 0xE2 && b1 == 0x80 && (b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF))
                || (b0 == 0xE2 && b1 == 0x81 && b2 == 0x9F)         // U+205F
                || (b0 == 0xE3 && b1 == 0x80 && b2 == 0x80);        // U+3000
            return space ? 3 : 0;
        }
        return 0;
    }

    // How plausible it is that `text` is English; higher is better.
    inline double score(std::string_view text)
    {
        double result = 0.0;

        // whitespace-separated tokens, with non-letters removed
        std::string word;
        auto count_word = [&] {
            if (is_common_word(word)) {
                result += common_word_weight;
            }
            word.clear();
        };
        for (auto rest = text;  !rest.empty();  ) {
            if (auto const n = leading_space(rest)) {
                count_word();
                rest.remove_prefix(n);
            } else {
                if (is_ascii_letter(rest.front())) {
                    word += rest.front();
                }
                rest.remove_prefix(1);
            }
        }
        count_word();

        auto const ratio = space_ratio(text);
        if (ratio > min_space_ratio && ratio < max_space_ratio) {
            result += space_bonus;
        }
        return result;
    }
}

#endif
