#include "test_support.hpp"

#include "stegano/cursor.hpp"
#include "stegano/diagnostics.hpp"
#include "stegano/env.hpp"
#include "stegano/errors.hpp"
#include "stegano/locator.hpp"
#include "stegano/splice.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>

using namespace stegano;
using stegano::test::Check;
using stegano::test::CheckThrows;

namespace {

Bytes Spliced(const Bytes& png, const std::string& secret, const TypeTag& type = constants::kSyntheticTypeTag) {
    std::ostringstream sink;
    Diagnostics diag(sink, sink);
    auto input = test::InputOf(png);
    std::ostringstream output;
    splice::Options options;
    options.type = type;
    splice::Encode(input, output, test::ToBytes(secret), options, diag);
    return test::OutputOf(output);
}

void AutoOffset() {
    std::cout << "auto offset:\n";
    std::ostringstream sink;
    Diagnostics diag(sink, sink);
    auto input = test::InputOf(test::ScenarioPng());
    StreamCursor cursor(input, diag);
    Check(locator::FindTerminal(cursor) == std::optional<std::uint64_t>(1000), "IEND found at 1000");
    Check(locator::ResolveOffset(cursor, std::nullopt) == 989, "auto offset is IEND minus 11");
    Check(cursor.Position() == 8, "read position restored");
    Check(locator::ResolveOffset(cursor, std::nullopt) == 989, "repeatable");
    Check(diag.warnings() == 0, "clean walk has no warnings");
}

void ExplicitOffset() {
    std::cout << "explicit offset:\n";
    std::ostringstream sink;
    Diagnostics diag(sink, sink);
    auto input = test::InputOf(test::ScenarioPng());
    StreamCursor cursor(input, diag);
    Check(locator::ResolveOffset(cursor, 500) == 500, "used as given");
    Check(locator::ResolveOffset(cursor, 8) == 8, "right after the signature");
    CheckThrows<ConfigError>([&] { locator::ResolveOffset(cursor, 3); }, "inside the signature rejected");
}

void MissingTerminal() {
    std::cout << "missing terminal:\n";
    std::ostringstream sink;
    Diagnostics diag(sink, sink);

    Bytes png = test::ScenarioPng();
    png.resize(1000);
    auto input = test::InputOf(png);
    StreamCursor cursor(input, diag);
    Check(!locator::FindTerminal(cursor).has_value(), "walk terminates without IEND");
    CheckThrows<MalformedContainer>([&] { locator::ResolveOffset(cursor, std::nullopt); },
                                    "auto offset needs IEND");
    Check(locator::ResolveOffset(cursor, 500) == 500, "explicit offset still works");

    Bytes truncated = test::ScenarioPng();
    truncated.resize(500);
    auto truncated_input = test::InputOf(truncated);
    StreamCursor truncated_cursor(truncated_input, diag);
    std::size_t before = diag.warnings();
    Check(!locator::FindTerminal(truncated_cursor).has_value(), "truncated stream terminates");
    Check(diag.warnings() > before, "truncation warned");

    auto limited_input = test::InputOf(test::ScenarioPng());
    StreamCursor limited(limited_input, diag);
    Check(!locator::FindTerminal(limited, 1).has_value(), "scan limit stops the walk");

    Bytes early;
    test::AppendSignature(early);
    test::AppendChunk(early, "IEND", {});
    auto early_input = test::InputOf(early);
    StreamCursor early_cursor(early_input, diag);
    CheckThrows<MalformedContainer>([&] { locator::ResolveOffset(early_cursor, std::nullopt); },
                                    "IEND right after the signature leaves no room");
}

void SplicedStream() {
    std::cout << "spliced stream:\n";
    std::ostringstream sink;
    Diagnostics diag(sink, sink);
    Bytes spliced = Spliced(test::ScenarioPng(), "hello");
    auto input = test::InputOf(spliced);
    StreamCursor cursor(input, diag);
    Check(locator::FindTerminal(cursor) == std::optional<std::uint64_t>(1014), "IEND resynchronized at 1014");
    Check(locator::LocateSyntheticRecord(cursor, constants::kSyntheticTypeTag) == 989,
          "synthetic chunk found at 989");
    Check(cursor.Position() == 8, "read position restored");
    CheckThrows<MalformedContainer>([&] {
        locator::LocateSyntheticRecord(cursor, TypeTagFromString("prVt"));
    }, "other type tag not found");

    auto plain_input = test::InputOf(test::ScenarioPng());
    StreamCursor plain(plain_input, diag);
    CheckThrows<MalformedContainer>([&] {
        locator::LocateSyntheticRecord(plain, constants::kSyntheticTypeTag);
    }, "untouched image has no synthetic chunk");

    // XOR with "key" gives a ciphertext holding a zero length and the
    // terminal tag right where the misaligned walk reads its next record.
    Bytes planted = Spliced(test::ScenarioPng(), "*$8*$8keyk,<%!8*$8*$");
    auto planted_input = test::InputOf(planted);
    StreamCursor planted_cursor(planted_input, diag);
    Check(locator::FindTerminal(planted_cursor) == std::optional<std::uint64_t>(1029),
          "terminal tag inside the payload is not taken for IEND");
    Check(locator::LocateSyntheticRecord(planted_cursor, constants::kSyntheticTypeTag) == 989,
          "record found despite a terminal tag in its payload");

    Bytes long_secret = Spliced(test::ScenarioPng(), std::string(200, 'q'), TypeTagFromString("prVt"));
    auto long_input = test::InputOf(long_secret);
    StreamCursor long_cursor(long_input, diag);
    Check(locator::LocateSyntheticRecord(long_cursor, TypeTagFromString("prVt")) == 989,
          "long payload with custom tag found at 989");
}

void Environment() {
    std::cout << "environment:\n";
    unsetenv(env::kScanLimitVar);
    Check(env::ScanLimit() == constants::kDefaultScanLimit, "unset scan limit uses the default");
    setenv(env::kScanLimitVar, "1", 1);
    Check(env::ScanLimit() == 1, "scan limit read");
    setenv(env::kScanLimitVar, "0", 1);
    Check(env::ScanLimit() == constants::kDefaultScanLimit, "zero scan limit uses the default");
    setenv(env::kScanLimitVar, "12abc", 1);
    Check(env::ScanLimit() == constants::kDefaultScanLimit, "malformed scan limit uses the default");
    setenv(env::kScanLimitVar, "-5", 1);
    Check(env::ScanLimit() == constants::kDefaultScanLimit, "negative scan limit uses the default");
    setenv(env::kScanLimitVar, "99999999999999999999999", 1);
    Check(env::ScanLimit() == std::numeric_limits<std::size_t>::max(), "huge scan limit saturates");
    unsetenv(env::kScanLimitVar);

    unsetenv(env::kNoColorVar);
    unsetenv(env::kProjectNoColorVar);
    Check(!env::ColorsDisabled(), "colors allowed by default");
    setenv(env::kNoColorVar, "anything", 1);
    Check(env::ColorsDisabled(), "NO_COLOR disables colors");
    setenv(env::kNoColorVar, "", 1);
    Check(!env::ColorsDisabled(), "empty NO_COLOR is ignored");
    setenv(env::kProjectNoColorVar, "Yes", 1);
    Check(env::ColorsDisabled(), "STEGANO_NO_COLOR=yes disables colors");
    setenv(env::kProjectNoColorVar, "0", 1);
    Check(!env::ColorsDisabled(), "STEGANO_NO_COLOR=0 keeps colors");
    unsetenv(env::kNoColorVar);
    unsetenv(env::kProjectNoColorVar);
}

}  // namespace

int main() {
    AutoOffset();
    ExplicitOffset();
    MissingTerminal();
    SplicedStream();
    Environment();
    return stegano::test::Finish("test_locator");
}
