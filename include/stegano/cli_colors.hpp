#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace stegano::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* BOLD_RED = "\033[1;31m";

    constexpr const char* BRIGHT_GREEN = "\033[0;92m";
    constexpr const char* BRIGHT_BLUE = "\033[0;94m";
    constexpr const char* ORANGE = "\033[38;5;214m";
    constexpr const char* GREY = "\033[38;5;7m";
}

// Colors are on only for a terminal stdout/stderr, unless disabled.
bool ColorsEnabled(std::ostream& os = std::cout);

// --no-color, STEGANO_NO_COLOR and NO_COLOR all end up here
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Green(const std::string& text, std::ostream& os = std::cout) {
    return Colorize(text, color::BRIGHT_GREEN, os);
}
inline std::string Yellow(const std::string& text, std::ostream& os = std::cout) {
    return Colorize(text, color::YELLOW, os);
}
inline std::string Orange(const std::string& text, std::ostream& os = std::cout) {
    return Colorize(text, color::ORANGE, os);
}
inline std::string BoldRed(const std::string& text, std::ostream& os = std::cout) {
    return Colorize(text, color::BOLD_RED, os);
}

}  // namespace stegano::cli
