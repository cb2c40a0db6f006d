#include "stegano/splice.hpp"

#include "stegano/checksum.hpp"
#include "stegano/cursor.hpp"
#include "stegano/errors.hpp"
#include "stegano/format.hpp"
#include "stegano/stream.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace stegano::splice {

namespace {

void ValidateOptions(const Options& options) {
    cipher::Require(options.algorithm);
    if (options.algorithm == cipher::Algorithm::Xor && options.key.empty()) {
        throw ConfigError("XOR key must not be empty");
    }
}

std::filesystem::path NormalizePathForCompare(const std::filesystem::path& path) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return abs.lexically_normal();
}

bool PathsEqual(const std::filesystem::path& lhs, const std::filesystem::path& rhs) {
    return NormalizePathForCompare(lhs) == NormalizePathForCompare(rhs);
}

std::ifstream OpenCheckedInput(const std::string& input_path, const std::string& output_path) {
    if (PathsEqual(input_path, output_path)) {
        throw ConfigError("Refusing to overwrite input file; choose a different output path");
    }
    std::ifstream input = stream::OpenInput(input_path);
    // A bad signature must stop the run before the output file exists.
    ReadSignature(input);
    stream::Seek(input, 0);
    return input;
}

template <typename Run>
auto RunToFile(const std::string& output_path, Run&& run) {
    std::ofstream output = stream::OpenOutput(output_path);
    try {
        auto result = run(output);
        output.flush();
        if (!output) {
            throw IoError("Failed to write output file: " + output_path);
        }
        return result;
    } catch (...) {
        output.close();
        std::error_code ec;
        std::filesystem::remove(output_path, ec);
        throw;
    }
}

}  // namespace

EncodeResult Encode(std::istream& input,
                    std::ostream& output,
                    const Bytes& payload,
                    const Options& options,
                    Diagnostics& diag) {
    ValidateOptions(options);
    StreamCursor cursor(input, diag);
    diag.Info("It is a valid PNG file. Let's process it!");

    std::uint64_t offset = locator::ResolveOffset(cursor, options.offset, options.scan_limit);

    EncodeResult result;
    result.offset = offset;
    result.ciphertext = cipher::Encrypt(options.algorithm, options.key, payload);
    if (result.ciphertext.size() > constants::kMaxSyntheticPayload) {
        throw ConfigError("Encrypted payload is " + std::to_string(result.ciphertext.size())
                          + " bytes; a synthetic chunk holds at most "
                          + std::to_string(constants::kMaxSyntheticPayload));
    }
    result.checksum = checksum::Compute(constants::kStandardChecksumSeed, options.type, result.ciphertext);
    result.record_size = static_cast<std::uint32_t>(result.ciphertext.size());
    Record record = MakeRecord(options.type, result.ciphertext, result.checksum);

    WriteSignature(cursor.signature(), output);
    stream::CopyExact(input, output, offset - constants::kPrefixBackoff);
    WriteSyntheticRecord(record, output);
    stream::CopyRemaining(input, output);
    return result;
}

DecodeResult Decode(std::istream& input,
                    std::ostream& output,
                    const Options& options,
                    Diagnostics& diag) {
    ValidateOptions(options);
    StreamCursor cursor(input, diag);
    diag.Info("It is a valid PNG file. Let's process it!");

    std::uint64_t offset = options.offset
                               ? locator::ResolveOffset(cursor, options.offset, options.scan_limit)
                               : locator::LocateSyntheticRecord(cursor, options.type);

    WriteSignature(cursor.signature(), output);
    stream::CopyExact(input, output, offset - constants::kPrefixBackoff);
    Record record = ReadSyntheticRecord(input);
    if (record.type != options.type) {
        diag.Warn("Chunk at offset " + std::to_string(offset) + " has type \"" + TypeTagToLabel(record)
                  + "\", expected \"" + TypeTagToLabel(options.type) + "\"");
    }

    DecodeResult result;
    result.offset = offset;
    result.record_size = record.length;
    result.checksum = record.checksum;
    result.checksum_ok = checksum::Verify(record);
    if (!result.checksum_ok) {
        diag.Warn("CRC mismatch on embedded chunk (stored " + format::Hex32(record.checksum) + ")");
    }
    result.plaintext = cipher::Decrypt(options.algorithm, options.key, record.payload);
    if (options.algorithm == cipher::Algorithm::Aes128) {
        result.plaintext = cipher::TrimZeroPadding(std::move(result.plaintext));
    }

    stream::CopyRemaining(input, output);
    return result;
}

EncodeResult EncodeFile(const std::string& input_path,
                        const std::string& output_path,
                        const std::string& payload,
                        const Options& options,
                        Diagnostics& diag) {
    ValidateOptions(options);
    std::ifstream input = OpenCheckedInput(input_path, output_path);
    Bytes payload_bytes(payload.begin(), payload.end());
    return RunToFile(output_path, [&](std::ostream& output) {
        return Encode(input, output, payload_bytes, options, diag);
    });
}

DecodeResult DecodeFile(const std::string& input_path,
                        const std::string& output_path,
                        const Options& options,
                        Diagnostics& diag) {
    ValidateOptions(options);
    std::ifstream input = OpenCheckedInput(input_path, output_path);
    return RunToFile(output_path, [&](std::ostream& output) {
        return Decode(input, output, options, diag);
    });
}

}  // namespace stegano::splice
