#pragma once

#include <array>
#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace aibridge::core::utils {

enum class Color {
    Default,
    Red,
    Green,
    Yellow,
    Magenta,
    Cyan,
    Gray,
    BrightGreen,
    BrightCyan
};

// ANSI colored output for the interactive hosts. Colors are dropped when stdout is not a tty.
class Terminal {
public:
    static bool colors_enabled() {
        static const bool enabled = ::isatty(STDOUT_FILENO) != 0;
        return enabled;
    }

    // SGR sequence for a color, indexed by the enum value.
    static std::string_view sgr(Color color) {
        static constexpr std::array<std::string_view, 9> kSequences{
            "\033[0m", "\033[31m", "\033[32m", "\033[33m", "\033[35m",
            "\033[36m", "\033[90m", "\033[92m", "\033[96m"};
        const auto index = static_cast<std::size_t>(color);
        return index < kSequences.size() ? kSequences[index] : kSequences[0];
    }

    static std::string colored(std::string_view text, Color color) {
        if (color == Color::Default || !colors_enabled()) {
            return std::string{text};
        }
        std::string out;
        out.reserve(text.size() + 10);
        out.append(sgr(color)).append(text).append(sgr(Color::Default));
        return out;
    }

    static void print(std::string_view text, Color color = Color::Default) {
        std::cout << colored(text, color) << std::flush;
    }

    static void println(std::string_view text, Color color = Color::Default) {
        std::cout << colored(text, color) << std::endl;
    }

    static void prompt(std::string_view text) {
        print(text, Color::BrightGreen);
    }
};

}  // namespace aibridge::core::utils
