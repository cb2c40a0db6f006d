#pragma once

#include <cstddef>
#include <iostream>
#include <ostream>
#include <string>

namespace stegano {

enum class Level {
    Info,
    Warn,
    Error,
};

// Sink for everything the engine reports. Core functions take it by
// reference and never print on their own.
class Diagnostics {
public:
    explicit Diagnostics(std::ostream& out = std::cout, std::ostream& err = std::cerr, bool quiet = false)
        : out_(out), err_(err), quiet_(quiet) {}

    void Report(Level level, const std::string& message);

    void Info(const std::string& message) { Report(Level::Info, message); }
    void Warn(const std::string& message) { Report(Level::Warn, message); }
    void Error(const std::string& message) { Report(Level::Error, message); }

    // Headline output of a run (offsets, checksums, recovered secret).
    // Printed even in quiet mode.
    void Result(const std::string& label, const std::string& value);

    // Raw access for multi-column dumps; nullptr when quiet.
    std::ostream* Detail() { return quiet_ ? nullptr : &out_; }

    bool quiet() const noexcept { return quiet_; }
    void set_quiet(bool quiet) noexcept { quiet_ = quiet; }
    std::size_t warnings() const noexcept { return warnings_; }

private:
    std::ostream& out_;
    std::ostream& err_;
    bool quiet_ = false;
    std::size_t warnings_ = 0;
};

}  // namespace stegano
