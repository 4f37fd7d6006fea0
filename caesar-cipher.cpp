#include "caesar/shift.hh"

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <print>
#include <stdexcept>
#include <string>

static int parse_shift(std::string const& arg)
{
    std::size_t end;
    auto const shift = std::stoi(arg, &end);
    if (end != arg.size()) {
        throw std::invalid_argument{arg};
    }
    return shift;
}

int main(int argc, char **argv)
{
    constexpr int default_shift = 13;
    // Parse arguments
    int shift = default_shift;
    if (argc == 2) {
        try {
            shift = parse_shift(argv[1]);
        } catch (std::exception&) {
            std::println(std::cerr, "Invalid Caesar shift value: {} (integer required)", argv[1]);
            return EXIT_FAILURE;
        }
    } else if (argc > 2) {
        std::println(std::cerr,
                     "Usage: {} [NUMBER]\n"
                     "Caesar-shift letters in standard input by NUMBER places (default {})",
                     *argv ? *argv : "caesar-cipher", default_shift);
        return EXIT_FAILURE;
    }

    // Now filter the input
    try {
        caesar::rotate_stream(std::cin, std::cout, shift);
    } catch (std::exception& e) {
        std::println(std::cerr, "{}", e.what());
        return EXIT_FAILURE;
    }
}
