#pragma once

#include <array>
#include <cstdint>
#include <istream>
#include <ostream>

#include "stegano/constants.hpp"

namespace stegano {

struct Signature {
    std::array<std::uint8_t, constants::kSignatureSize> bytes{};
};

// Consumes exactly 8 bytes. Throws MalformedContainer on a short read or
// when bytes 1..3 are not "PNG".
Signature ReadSignature(std::istream& input);
void WriteSignature(const Signature& signature, std::ostream& output);
bool IsCanonical(const Signature& signature);

}  // namespace stegano
