#include "caesar/breaker.hh"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <print>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

static void usage(std::string_view program)
{
    std::println(std::cerr,
            "Usage: {} [-a] [TEXT...]\n"
            "Recover the shift of Caesar-enciphered TEXT (default: first line of standard input).\n"
            "  -a  also list every shift, best first",
            program);
}

static void print_result(std::string_view method, caesar::decryption const& result)
{
    std::println("Results from {} method:", method);
    std::println("Shift used: {}", result.shift);
    std::println("Plaintext: {}", result.plaintext);
}

int main(int argc, char **argv)
{
    std::string_view const program = *argv ? *argv : "caesar-decipher";

    bool list_all = false;
    std::vector<std::string_view> words;
    for (int i = 1;  i < argc;  ++i) {
        std::string_view const arg = argv[i];
        if (arg == "-a" && words.empty()) {
            list_all = true;
        } else if (arg.starts_with('-') && arg.size() > 1 && words.empty()) {
            usage(program);
            return EXIT_FAILURE;
        } else {
            words.push_back(arg);
        }
    }

    try {
        std::string ciphertext;
        if (words.empty()) {
            std::getline(std::cin, ciphertext);
            if (std::cin.bad()) {
                std::println(std::cerr, "Failed to read standard input");
                return EXIT_FAILURE;
            }
        } else {
            ciphertext = words
                | std::views::join_with(' ')
                | std::ranges::to<std::string>();
        }

        auto const brute = caesar::break_brute_force(ciphertext);
        auto const freq = caesar::break_frequency_analysis(ciphertext);

        print_result("brute force", brute);
        std::println("");
        print_result("frequency analysis", freq);
        std::println("");

        if (brute.shift == freq.shift) {
            std::println("Both methods found the same shift value, which increases confidence in the result.");
        } else {
            std::println("The methods found different shift values. Review both results to determine which is correct.");
        }

        if (list_all) {
            std::println("\nAll shifts:");
            for (auto const& c: caesar::rank_shifts(ciphertext)) {
                std::println("{:2} {:5.1f} {}", c.shift, c.score, c.plaintext);
            }
        }
    } catch (std::exception& e) {
        std::println(std::cerr, "{}", e.what());
        return EXIT_FAILURE;
    }
}
