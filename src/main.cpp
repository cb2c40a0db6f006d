#include "stegano/cipher.hpp"
#include "stegano/cli_colors.hpp"
#include "stegano/constants.hpp"
#include "stegano/diagnostics.hpp"
#include "stegano/env.hpp"
#include "stegano/errors.hpp"
#include "stegano/format.hpp"
#include "stegano/inspect.hpp"
#include "stegano/jpeg.hpp"
#include "stegano/splice.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void PrintUsage() {
    std::cout << stegano::cli::Orange("The ultimate steganography swiss knife army tool.") << "\n\n";
    std::cout << "Usage:\n";
    std::cout << "  stegano encrypt -i <input.png> [-o <output.png>] [-k <key>] [-p <payload>] [-f <offset|auto>] [-a <xor|aes>] [-t <type>] [-s]\n";
    std::cout << "  stegano decrypt -i <input.png> [-o <output.png>] [-k <key>] [-f <offset|auto>] [-a <xor|aes>] [-t <type>] [-s]\n";
    std::cout << "  stegano show-meta -i <input.png> [-n <count>] [-c <start>] [-u <end>] [-x] [-s]\n";
    std::cout << "  stegano show-jpeg -i <input.jpg> [-n <count>] [-s]\n";
    std::cout << "\nCommon flags: --no-color, -h/--help, -V/--version\n";
}

struct Args {
    std::string input;
    std::string output = std::string(stegano::constants::kDefaultOutput);
    std::string key = std::string(stegano::constants::kDefaultKey);
    std::string payload = std::string(stegano::constants::kDefaultPayload);
    std::string algorithm = std::string(stegano::constants::kDefaultAlgorithm);
    std::string type;
    stegano::locator::OffsetRequest offset;
    std::size_t count = 10;
    std::size_t start = 1;
    std::size_t end = 11;
    bool hex_dump = false;
    bool suppress = false;
};

std::size_t ParseCount(const std::string& flag, const std::string& value) {
    try {
        std::size_t pos = 0;
        unsigned long long parsed = std::stoull(value, &pos);
        if (pos != value.size() || value.front() == '-') {
            throw std::invalid_argument(value);
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw stegano::ConfigError("Invalid value for " + flag + ": " + value);
    }
}

// "auto" and -1 both mean: place the chunk automatically.
stegano::locator::OffsetRequest ParseOffset(const std::string& value) {
    if (value == "auto" || value == "-1") {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(ParseCount("--offset", value));
}

Args ParseArgs(int argc, char** argv, int start_index) {
    Args opts;
    int idx = start_index;
    auto value_of = [&](const std::string& flag) -> std::string {
        if (idx + 1 >= argc) {
            throw stegano::ConfigError("Missing value for " + flag);
        }
        return argv[idx + 1];
    };
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-i" || flag == "--input") {
            opts.input = value_of(flag);
            idx += 2;
        } else if (flag == "-o" || flag == "--output") {
            opts.output = value_of(flag);
            idx += 2;
        } else if (flag == "-k" || flag == "--key") {
            opts.key = value_of(flag);
            idx += 2;
        } else if (flag == "-p" || flag == "--payload") {
            opts.payload = value_of(flag);
            idx += 2;
        } else if (flag == "-f" || flag == "--offset") {
            opts.offset = ParseOffset(value_of(flag));
            idx += 2;
        } else if (flag == "-a" || flag == "--algo") {
            opts.algorithm = value_of(flag);
            idx += 2;
        } else if (flag == "-t" || flag == "--type") {
            opts.type = value_of(flag);
            idx += 2;
        } else if (flag == "-n" || flag == "--nb-chunks") {
            opts.count = ParseCount(flag, value_of(flag));
            idx += 2;
        } else if (flag == "-c" || flag == "--start") {
            opts.start = ParseCount(flag, value_of(flag));
            idx += 2;
        } else if (flag == "-u" || flag == "--end") {
            opts.end = ParseCount(flag, value_of(flag));
            idx += 2;
        } else if (flag == "-x" || flag == "--hex") {
            opts.hex_dump = true;
            idx += 1;
        } else if (flag == "-s" || flag == "--suppress") {
            opts.suppress = true;
            idx += 1;
        } else if (flag == "--no-color") {
            stegano::cli::SetColorsEnabled(false);
            idx += 1;
        } else {
            throw stegano::ConfigError("Unknown flag: " + flag);
        }
    }
    if (opts.input.empty()) {
        throw stegano::ConfigError("Missing input path (-i)");
    }
    return opts;
}

stegano::splice::Options SpliceOptions(const Args& args) {
    stegano::splice::Options options;
    options.offset = args.offset;
    options.key = args.key;
    // Resolved once here; the pipelines only see the enum.
    options.algorithm = stegano::cipher::ParseAlgorithm(args.algorithm);
    if (options.algorithm == stegano::cipher::Algorithm::Unsupported) {
        throw stegano::ConfigError("Unsupported algorithm: " + args.algorithm + " (expected xor or aes)");
    }
    if (!args.type.empty()) {
        options.type = stegano::TypeTagFromString(args.type);
    }
    options.scan_limit = stegano::env::ScanLimit();
    return options;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    if (command == "-h" || command == "--help") {
        PrintUsage();
        return 0;
    }
    if (command == "-V" || command == "--version") {
        std::cout << "stegano " << stegano::constants::kVersion << "\n";
        return 0;
    }

    stegano::Diagnostics diag;
    try {
        if (command == "encrypt") {
            Args args = ParseArgs(argc, argv, 2);
            diag.set_quiet(args.suppress);
            stegano::splice::Options options = SpliceOptions(args);
            diag.Info(std::string("Algorithm: ") + stegano::cipher::AlgorithmName(options.algorithm));
            auto result = stegano::splice::EncodeFile(args.input, args.output, args.payload, options, diag);
            diag.Info("Encoded bytes " + stegano::format::HexBytes(result.ciphertext));
            diag.Result("Chunk offset", std::to_string(result.offset));
            diag.Result("Chunk size", std::to_string(result.record_size));
            diag.Result("Chunk crc", stegano::format::Hex32(result.checksum));
            diag.Info("Image encoded and written successfully!");
            return 0;
        }
        if (command == "decrypt") {
            Args args = ParseArgs(argc, argv, 2);
            diag.set_quiet(args.suppress);
            stegano::splice::Options options = SpliceOptions(args);
            auto result = stegano::splice::DecodeFile(args.input, args.output, options, diag);
            diag.Result("Chunk offset", std::to_string(result.offset));
            diag.Result("Chunk size", std::to_string(result.record_size));
            diag.Result("Chunk crc", stegano::format::Hex32(result.checksum)
                                         + (result.checksum_ok ? "" : " (mismatch)"));
            diag.Result("Your decoded secret is",
                        "\"" + std::string(result.plaintext.begin(), result.plaintext.end()) + "\"");
            return 0;
        }
        if (command == "show-meta") {
            Args args = ParseArgs(argc, argv, 2);
            diag.set_quiet(args.suppress);
            stegano::inspect::Options options;
            options.start = args.start;
            options.end = args.end;
            options.count = args.count;
            options.hex_dump = args.hex_dump;
            stegano::inspect::InspectFile(args.input, options, diag);
            return 0;
        }
        if (command == "show-jpeg") {
            Args args = ParseArgs(argc, argv, 2);
            diag.set_quiet(args.suppress);
            stegano::jpeg::InspectFile(args.input, diag, args.count);
            return 0;
        }
        PrintUsage();
        return 2;
    } catch (const stegano::ConfigError& exc) {
        diag.Error(exc.what());
        return 2;
    } catch (const std::exception& exc) {
        diag.Error(exc.what());
        return 1;
    }
}
