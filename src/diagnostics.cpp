#include "stegano/diagnostics.hpp"

#include "stegano/cli_colors.hpp"

namespace stegano {

void Diagnostics::Report(Level level, const std::string& message) {
    switch (level) {
        case Level::Info:
            if (!quiet_) {
                out_ << message << "\n";
            }
            break;
        case Level::Warn:
            ++warnings_;
            if (!quiet_) {
                err_ << cli::Yellow("WARN: ", err_) << message << "\n";
            }
            break;
        case Level::Error:
            err_ << cli::BoldRed("Error: ", err_) << message << "\n";
            break;
    }
}

void Diagnostics::Result(const std::string& label, const std::string& value) {
    out_ << cli::Colorize(label + ":", cli::color::GREY, out_) << " "
         << cli::Orange(value, out_) << "\n";
}

}  // namespace stegano
