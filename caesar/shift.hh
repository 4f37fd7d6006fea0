#ifndef CAESAR_SHIFT_H
#define CAESAR_SHIFT_H

#include <algorithm>
#include <array>
#include <climits>
#include <ios>
#include <istream>
#include <iterator>
#include <numeric>
#include <ostream>
#include <string>
#include <string_view>

namespace caesar
{
    constexpr int alphabet_size = 26;

    // Reduce any integer to the equivalent shift in [0, 25].
    constexpr int normalise_shift(int shift) noexcept
    {
        // the remainder is in (-26, 26), so this cannot overflow
        int const r = shift % alphabet_size;
        return r < 0 ? r + alphabet_size : r;
    }

    // The shift that undoes `shift`.
    constexpr int inverse_shift(int shift) noexcept
    {
        return normalise_shift(alphabet_size - normalise_shift(shift));
    }

    // Maps each char to its rotated equivalent.  ASCII letters move
    // within their own case; every other value (including the bytes of
    // multibyte UTF-8 sequences) maps to itself.
    class rotator
    {
        using char_table = std::array<char, UCHAR_MAX+1>;
        const char_table table;

    public:
        explicit rotator(int shift) noexcept
            : table{create_table(normalise_shift(shift))}
        {}

        char operator()(char c) const noexcept
        {
            return table[static_cast<unsigned char>(c)];
        }

    private:
        static char_table create_table(int shift) noexcept
        {
            static constexpr std::string_view upper2 =
                "ABCDEFGHIJKLMNOPQRSTUVWXYZABCDEFGHIJKLMNOPQRSTUVWXYZ";
            static constexpr std::string_view lower2 =
                "abcdefghijklmnopqrstuvwxyzabcdefghijklmnopqrstuvwxyz";

            char_table table;
            // begin with a identity mapping
            std::iota(table.begin(), table.end(), 0);
            for (auto i = 0;  i < alphabet_size;  ++i) {
                table[static_cast<unsigned char>(upper2[i])] = upper2[i+shift];
                table[static_cast<unsigned char>(lower2[i])] = lower2[i+shift];
            }
            return table;
        }
    };

    // Apply a cyclic alphabetic shift, preserving case.
    inline std::string shift_text(std::string_view text, int shift)
    {
        std::string result(text.size(), '\0');
        std::ranges::transform(text, result.begin(), rotator{shift});
        return result;
    }

    inline std::string encode(std::string_view plaintext, int shift)
    {
        return shift_text(plaintext, shift);
    }

    inline std::string decode(std::string_view ciphertext, int shift)
    {
        return shift_text(ciphertext, inverse_shift(shift));
    }

    // Copy `in` to `out`, shifting letters as it goes.  Throws
    // std::ios_base::failure if any output can't be written.
    inline void rotate_stream(std::istream& in, std::ostream& out, int shift)
    {
        // ostreambuf_iterator bypasses the stream state, so check the
        // iterator rather than `out`
        auto const last = std::transform(std::istreambuf_iterator<char>{in},
                                         std::istreambuf_iterator<char>{},
                                         std::ostreambuf_iterator<char>{out},
                                         rotator{shift});
        if (last.failed() || !out.flush()) {
            throw std::ios_base::failure{"Write error"};
        }
    }
}

#endif
