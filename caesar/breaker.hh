#ifndef CAESAR_BREAKER_H
#define CAESAR_BREAKER_H

#include "frequency.hh"
#include "score.hh"
#include "shift.hh"

#include <algorithm>
#include <array>
#include <bitset>
#include <cstddef>
#include <numeric>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/*
  Recovering the shift of a Caesar ciphertext.

  * caesar::break_brute_force(text)         // scores every shift in turn

  * caesar::break_frequency_analysis(text)  // tries the shift suggested by
                                            // letter frequencies first

  Both return the plaintext and shift of the best-scoring decoding (see
  score.hh).  When several shifts share the best score, the first one
  tried wins.  Because the frequency method still tries every shift, the
  two methods can only disagree when the best score is tied.
 */

namespace caesar
{
    struct decryption
    {
        std::string plaintext;
        int shift;

        bool operator==(decryption const&) const = default;
    };

    struct candidate
    {
        int shift;
        std::string plaintext;
        double score;
    };

    // Below this many letters, frequencies tell us nothing useful.
    constexpr std::size_t min_frequency_sample = 5;

    // The letter we expect to be most frequent in the plaintext.
    constexpr char expected_commonest = 'E';

    using shift_sequence = std::array<int, alphabet_size>;

    namespace detail
    {
        // Decode with each shift in order and keep the first best one.
        template<std::ranges::input_range Shifts>
        decryption best_decoding(std::string_view ciphertext, Shifts const& shifts)
        {
            auto best = decryption{std::string{}, 0};
            auto best_score = -1.0;      // lower than any real score
            for (int shift: shifts) {
                auto plaintext = decode(ciphertext, shift);
                auto const s = score(plaintext);
                if (s > best_score) {
                    best_score = s;
                    best = {std::move(plaintext), shift};
                }
            }
            return best;
        }

        constexpr shift_sequence all_shifts() noexcept
        {
            shift_sequence shifts;
            std::iota(shifts.begin(), shifts.end(), 0);
            return shifts;
        }
    }

    // The order in which break_frequency_analysis() tries shifts: the
    // one that maps the commonest letter onto 'E', then all the others in
    // ascending order.  Every shift appears exactly once.
    inline shift_sequence shift_priority(std::string_view ciphertext)
    {
        auto const order = frequency_order(letter_frequencies(ciphertext));
        if (order.empty()) {
            return detail::all_shifts();
        }

        shift_sequence shifts;
        std::bitset<alphabet_size> placed;
        auto out = shifts.begin();

        auto const preferred = normalise_shift(order.front() - expected_commonest);
        *out++ = preferred;
        placed.set(static_cast<std::size_t>(preferred));

        for (int shift = 0;  shift < alphabet_size;  ++shift) {
            if (!placed.test(static_cast<std::size_t>(shift))) {
                *out++ = shift;
                placed.set(static_cast<std::size_t>(shift));
            }
        }
        return shifts;
    }

    inline decryption break_brute_force(std::string_view ciphertext)
    {
        return detail::best_decoding(ciphertext, detail::all_shifts());
    }

    inline decryption break_frequency_analysis(std::string_view ciphertext)
    {
        auto const letters = letters_only(ciphertext);
        if (letters.size() < min_frequency_sample) {
            return break_brute_force(ciphertext);
        }
        return detail::best_decoding(ciphertext, shift_priority(letters));
    }

    // Every shift with its decoding, best score first.  Equal scores are
    // listed in ascending order of shift.
    inline std::vector<candidate> rank_shifts(std::string_view ciphertext)
    {
        auto const shifts = detail::all_shifts();
        auto candidates = shifts
            | std::views::transform([ciphertext](int shift) {
                auto plaintext = decode(ciphertext, shift);
                auto const s = score(plaintext);
                return candidate{shift, std::move(plaintext), s};
            })
            | std::ranges::to<std::vector>();
        std::ranges::stable_sort(candidates, std::ranges::greater{}, &candidate::score);
        return candidates;
    }

    // Names for the library's external interface.
    inline decryption decode_brute_force(std::string_view ciphertext)
    {
        return break_brute_force(ciphertext);
    }

    inline decryption decode_frequency_guided(std::string_view ciphertext)
    {
        return break_frequency_analysis(ciphertext);
    }
}

#endif
