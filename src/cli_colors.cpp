#include "stegano/cli_colors.hpp"

#include "stegano/env.hpp"

#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace stegano::cli {

namespace {
    bool g_colors_forced_off = false;
    bool g_colors_checked = false;
    bool g_stdout_tty = false;
    bool g_stderr_tty = false;

    void DetectTerminals() {
        if (g_colors_checked) {
            return;
        }
        g_stdout_tty = isatty(fileno(stdout)) != 0;
        g_stderr_tty = isatty(fileno(stderr)) != 0;
        if (env::ColorsDisabled()) {
            g_colors_forced_off = true;
        }
        g_colors_checked = true;
    }
}

bool ColorsEnabled(std::ostream& os) {
    DetectTerminals();
    if (g_colors_forced_off) {
        return false;
    }
    if (&os == &std::cout) {
        return g_stdout_tty;
    }
    if (&os == &std::cerr) {
        return g_stderr_tty;
    }
    // String streams and files never get escape codes
    return false;
}

void SetColorsEnabled(bool enabled) {
    DetectTerminals();
    g_colors_forced_off = !enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace stegano::cli
