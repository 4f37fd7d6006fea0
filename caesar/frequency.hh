#ifndef CAESAR_FREQUENCY_H
#define CAESAR_FREQUENCY_H

#include <algorithm>
#include <cstddef>
#include <map>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace caesar
{
    // Occurrences of each uppercase letter.  Letters that don't appear
    // have no entry.
    using frequency_table = std::map<char, std::size_t>;

    constexpr bool is_ascii_letter(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    constexpr char ascii_upper(char c) noexcept
    {
        return c >= 'a' && c <= 'z' ? static_cast<char>(c - 'a' + 'A') : c;
    }

    inline std::string letters_only(std::string_view text)
    {
        return text
            | std::views::filter(is_ascii_letter)
            | std::ranges::to<std::string>();
    }

    inline frequency_table letter_frequencies(std::string_view text)
    {
        frequency_table table;
        for (char c: text | std::views::filter(is_ascii_letter)) {
            ++table[ascii_upper(c)];
        }
        return table;
    }

    // Letters from most to least frequent.  Equal counts remain in
    // alphabetical order.
    inline std::string frequency_order(frequency_table const& table)
    {
        auto pairs = std::vector<std::pair<char, std::size_t>>(table.begin(), table.end());
        std::ranges::stable_sort(pairs, std::ranges::greater{},
                                 &std::pair<char, std::size_t>::second);
        return pairs
            | std::views::keys
            | std::ranges::to<std::string>();
    }
}

#endif
