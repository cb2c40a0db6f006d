#include "test_support.hpp"

#include "stegano/diagnostics.hpp"
#include "stegano/errors.hpp"
#include "stegano/splice.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

using namespace stegano;
using stegano::test::Check;
using stegano::test::CheckThrows;

namespace {

namespace fs = std::filesystem;

struct Run {
    std::ostringstream log;
    Diagnostics diag{log, log};
};

Bytes EncodeBytes(const Bytes& png, const std::string& secret, const splice::Options& options,
                  splice::EncodeResult* result = nullptr) {
    Run run;
    auto input = test::InputOf(png);
    std::ostringstream output;
    splice::EncodeResult encoded = splice::Encode(input, output, test::ToBytes(secret), options, run.diag);
    if (result) {
        *result = encoded;
    }
    return test::OutputOf(output);
}

splice::DecodeResult DecodeBytes(const Bytes& spliced, const splice::Options& options, Bytes* restored = nullptr,
                                 std::size_t* warnings = nullptr) {
    Run run;
    auto input = test::InputOf(spliced);
    std::ostringstream output;
    splice::DecodeResult decoded = splice::Decode(input, output, options, run.diag);
    if (restored) {
        *restored = test::OutputOf(output);
    }
    if (warnings) {
        *warnings = run.diag.warnings();
    }
    return decoded;
}

void XorAuto() {
    std::cout << "xor, automatic offset:\n";
    Bytes png = test::ScenarioPng();
    splice::Options options;
    splice::EncodeResult encoded;
    Bytes spliced = EncodeBytes(png, "hello", options, &encoded);
    Check(encoded.offset == 989, "placed 11 bytes before IEND");
    Check(encoded.record_size == 5, "record size");
    Check(encoded.ciphertext == Bytes({0x03, 0x00, 0x15, 0x07, 0x0a}), "ciphertext");
    Check(spliced.size() == png.size() + 14, "output grows by the framed record");
    Check(Bytes(spliced.begin(), spliced.begin() + 989) == Bytes(png.begin(), png.begin() + 989),
          "prefix copied verbatim");
    Check(spliced[989] == 5 && spliced[990] == 's' && spliced[993] == 'g', "record framing at offset");
    Check(Bytes(spliced.begin() + 1003, spliced.end()) == Bytes(png.begin() + 989, png.end()),
          "suffix copied verbatim");

    Bytes restored;
    splice::DecodeResult decoded = DecodeBytes(spliced, options, &restored);
    Check(decoded.offset == 989, "decoder finds the record");
    Check(decoded.checksum_ok && decoded.checksum == encoded.checksum, "checksum verified");
    Check(test::ToString(decoded.plaintext) == "hello", "secret recovered");
    Check(restored == png, "record removed from the decoded image");
}

void TerminalTagInPayload() {
    std::cout << "terminal tag inside the payload:\n";
    Bytes png = test::ScenarioPng();
    splice::Options options;
    const std::string secret = "*$8*$8keyk,<%!8*$8*$";
    splice::EncodeResult encoded;
    Bytes spliced = EncodeBytes(png, secret, options, &encoded);
    Check(encoded.offset == 989, "placed 11 bytes before IEND");
    Check(test::ToString(Bytes(encoded.ciphertext.begin() + 10, encoded.ciphertext.begin() + 14)) == "IEND",
          "ciphertext spells the terminal tag");

    Bytes restored;
    splice::DecodeResult decoded = DecodeBytes(spliced, options, &restored);
    Check(decoded.offset == 989, "decoder finds the record");
    Check(test::ToString(decoded.plaintext) == secret, "secret recovered");
    Check(restored == png, "decoded image matches the original");
}

void AesAuto() {
    std::cout << "aes-128, automatic offset:\n";
    Bytes png = test::ScenarioPng();
    splice::Options options;
    options.algorithm = cipher::Algorithm::Aes128;
    options.key = "correct horse";
    const std::string secret = "attack at dawn, bring snacks";
    splice::EncodeResult encoded;
    Bytes spliced = EncodeBytes(png, secret, options, &encoded);
    Check(encoded.record_size == 32, "padded to two blocks");
    Check(spliced.size() == png.size() + 41, "output grows by the framed record");

    Bytes restored;
    splice::DecodeResult decoded = DecodeBytes(spliced, options, &restored);
    Check(test::ToString(decoded.plaintext) == secret, "secret recovered with padding trimmed");
    Check(restored == png, "decoded image matches the original");

    options.key = "wrong horse";
    Check(test::ToString(DecodeBytes(spliced, options).plaintext) != secret, "wrong key gives other bytes");

    splice::Options xor_options;
    Bytes xor_spliced = EncodeBytes(png, "hello", xor_options);
    xor_options.algorithm = cipher::Algorithm::Aes128;
    CheckThrows<ConfigError>([&] { DecodeBytes(xor_spliced, xor_options); },
                             "xor record decoded as aes is a configuration error");
}

void ExplicitOffsets() {
    std::cout << "explicit offsets:\n";
    Bytes png = test::ScenarioPng();
    for (std::uint64_t offset : {8u, 33u, 500u, 1012u}) {
        splice::Options options;
        options.offset = offset;
        options.key = "k3y";
        Bytes spliced = EncodeBytes(png, "offset test", options);
        Bytes restored;
        splice::DecodeResult decoded = DecodeBytes(spliced, options, &restored);
        std::string label = "offset " + std::to_string(offset);
        Check(decoded.offset == offset, label + " decoded at the same place");
        Check(test::ToString(decoded.plaintext) == "offset test", label + " round trip");
        Check(restored == png, label + " image restored");
    }

    splice::Options wrong;
    wrong.offset = 500;
    Bytes spliced = EncodeBytes(png, "hello", wrong);
    wrong.key = "nope";
    splice::DecodeResult decoded = DecodeBytes(spliced, wrong);
    Check(decoded.checksum_ok, "wrong xor key still passes the checksum");
    Check(test::ToString(decoded.plaintext) != "hello", "wrong xor key gives other bytes");
}

void CustomTag() {
    std::cout << "custom chunk type:\n";
    Bytes png = test::ScenarioPng();
    splice::Options options;
    options.type = TypeTagFromString("prVt");
    Bytes spliced = EncodeBytes(png, "tagged", options);
    Check(spliced[990] == 'p' && spliced[993] == 't', "custom tag written");
    Check(test::ToString(DecodeBytes(spliced, options).plaintext) == "tagged", "decoded with the same tag");

    splice::Options mismatched;
    mismatched.offset = 989;
    std::size_t warnings = 0;
    splice::DecodeResult decoded = DecodeBytes(spliced, mismatched, nullptr, &warnings);
    Check(test::ToString(decoded.plaintext) == "tagged", "explicit offset decodes any tag");
    Check(warnings > 0, "tag mismatch warned");
}

void Corruption() {
    std::cout << "corrupted record:\n";
    Bytes png = test::ScenarioPng();
    splice::Options options;
    options.offset = 500;
    Bytes spliced = EncodeBytes(png, "hello", options);
    spliced[500 + 5] = static_cast<std::uint8_t>(spliced[500 + 5] ^ 0xFF);
    std::size_t warnings = 0;
    splice::DecodeResult decoded = DecodeBytes(spliced, options, nullptr, &warnings);
    Check(!decoded.checksum_ok, "checksum mismatch reported");
    Check(warnings > 0, "checksum mismatch warned");

    options.offset = std::nullopt;
    CheckThrows<MalformedContainer>([&] { DecodeBytes(spliced, options); },
                                    "automatic decode needs a valid record");
}

void Failures() {
    std::cout << "failures leave no output:\n";
    Bytes png = test::ScenarioPng();

    auto encode_into = [&](const Bytes& input_bytes, const Bytes& payload, const splice::Options& options,
                           std::ostringstream& output) {
        Run run;
        auto input = test::InputOf(input_bytes);
        splice::Encode(input, output, payload, options, run.diag);
    };

    std::ostringstream bad_signature;
    Bytes jpeg = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00};
    CheckThrows<MalformedContainer>([&] { encode_into(jpeg, test::ToBytes("x"), {}, bad_signature); },
                                    "bad signature rejected");
    Check(bad_signature.str().empty(), "nothing written for a bad signature");

    std::ostringstream unsupported;
    splice::Options unsupported_options;
    unsupported_options.algorithm = cipher::Algorithm::Unsupported;
    CheckThrows<ConfigError>([&] { encode_into(png, test::ToBytes("x"), unsupported_options, unsupported); },
                             "unsupported algorithm rejected");
    Check(unsupported.str().empty(), "nothing written for an unsupported algorithm");

    std::ostringstream oversized;
    CheckThrows<ConfigError>([&] { encode_into(png, Bytes(256, 'z'), {}, oversized); },
                             "payload over 255 bytes rejected");
    Check(oversized.str().empty(), "nothing written for an oversized payload");

    std::ostringstream oversized_aes;
    splice::Options aes;
    aes.algorithm = cipher::Algorithm::Aes128;
    CheckThrows<ConfigError>([&] { encode_into(png, Bytes(250, 'z'), aes, oversized_aes); },
                             "aes padding past 255 bytes rejected");

    std::ostringstream past_end;
    splice::Options far;
    far.offset = 2000;
    CheckThrows<IoError>([&] { encode_into(png, test::ToBytes("x"), far, past_end); },
                         "offset past the end of the stream");
}

void WriteFile(const fs::path& path, const Bytes& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

Bytes ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return Bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void Files() {
    std::cout << "file pipelines:\n";
    fs::path dir = fs::temp_directory_path() / "stegano_test_splice";
    fs::remove_all(dir);
    fs::create_directories(dir);
    fs::path original = dir / "in.png";
    fs::path encoded = dir / "encoded.png";
    fs::path decoded = dir / "decoded.png";
    Bytes png = test::ScenarioPng();
    WriteFile(original, png);

    Run run;
    splice::Options options;
    splice::EncodeFile(original.string(), encoded.string(), "file secret", options, run.diag);
    Check(fs::file_size(encoded) == png.size() + 9 + 11, "encoded file written");
    splice::DecodeResult result = splice::DecodeFile(encoded.string(), decoded.string(), options, run.diag);
    Check(test::ToString(result.plaintext) == "file secret", "secret recovered from file");
    Check(ReadFile(decoded) == png, "decoded file matches the original");

    CheckThrows<ConfigError>([&] {
        splice::EncodeFile(original.string(), (dir / "." / "in.png").string(), "x", options, run.diag);
    }, "output path equal to input refused");
    Check(ReadFile(original) == png, "input untouched");

    fs::path not_png = dir / "photo.jpg";
    fs::path not_png_out = dir / "photo_out.png";
    WriteFile(not_png, Bytes({0xFF, 0xD8, 0xFF, 0xD9, 0, 0, 0, 0, 0}));
    CheckThrows<MalformedContainer>([&] {
        splice::EncodeFile(not_png.string(), not_png_out.string(), "x", options, run.diag);
    }, "bad signature rejected");
    Check(!fs::exists(not_png_out), "no output file for a bad signature");

    fs::path partial = dir / "partial.png";
    splice::Options far;
    far.offset = 5000;
    CheckThrows<IoError>([&] {
        splice::EncodeFile(original.string(), partial.string(), "x", far, run.diag);
    }, "offset past the end of the file");
    Check(!fs::exists(partial), "partial output removed");

    CheckThrows<IoError>([&] {
        splice::DecodeFile((dir / "missing.png").string(), decoded.string(), options, run.diag);
    }, "missing input reported");

    fs::remove_all(dir);
}

}  // namespace

int main() {
    XorAuto();
    TerminalTagInPayload();
    AesAuto();
    ExplicitOffsets();
    CustomTag();
    Corruption();
    Failures();
    Files();
    return stegano::test::Finish("test_splice");
}
