#pragma once

#include <array>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "stegano/constants.hpp"
#include "stegano/diagnostics.hpp"

namespace stegano {

using Bytes = std::vector<std::uint8_t>;
using TypeTag = std::array<std::uint8_t, constants::kTypeTagSize>;

struct Record {
    std::uint32_t length = 0;
    TypeTag type{};
    Bytes payload;
    std::uint32_t checksum = 0;

    std::uint32_t TypeValue() const noexcept;
};

Record MakeRecord(const TypeTag& type, Bytes payload, std::uint32_t checksum);
TypeTag TypeTagFromString(const std::string& label);

// Reads one standard record into `record`, overwriting it in place.
// Short reads never throw: the length field keeps its previous value, the
// other fields keep what was readable, a warning goes to `diag` and the
// function returns false.
bool ReadRecord(std::istream& input, Record& record, Diagnostics& diag);

// Narrow framing used only for the injected record:
// [len:1][tag:4][payload][checksum:4 BE].
Bytes MarshalSyntheticRecord(const Record& record);
void WriteSyntheticRecord(const Record& record, std::ostream& output);
// Strict inverse of WriteSyntheticRecord; throws IoError on a short read.
Record ReadSyntheticRecord(std::istream& input);

// ASCII bytes kept, anything else becomes U+FFFD.
std::string TypeTagToLabel(const TypeTag& type);
std::string TypeTagToLabel(const Record& record);
bool IsTerminal(const Record& record);

}  // namespace stegano
