#include "stegano/signature.hpp"

#include "stegano/errors.hpp"
#include "stegano/stream.hpp"

#include <algorithm>

namespace stegano {

Signature ReadSignature(std::istream& input) {
    Signature signature;
    std::size_t got = stream::ReadSome(input, signature.bytes.data(), signature.bytes.size());
    if (got != signature.bytes.size()) {
        throw MalformedContainer("Not a valid PNG file: stream is shorter than the signature");
    }
    if (!std::equal(constants::kSignatureTag.begin(), constants::kSignatureTag.end(),
                    signature.bytes.begin() + 1)) {
        throw MalformedContainer("Not a valid PNG file: signature magic mismatch");
    }
    return signature;
}

void WriteSignature(const Signature& signature, std::ostream& output) {
    output.write(reinterpret_cast<const char*>(signature.bytes.data()),
                 static_cast<std::streamsize>(signature.bytes.size()));
    if (!output) {
        throw IoError("Failed to write signature");
    }
}

bool IsCanonical(const Signature& signature) {
    return signature.bytes == constants::kPngSignature;
}

}  // namespace stegano
