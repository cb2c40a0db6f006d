#pragma once

#include <cstdint>
#include <istream>

#include "stegano/diagnostics.hpp"
#include "stegano/record.hpp"
#include "stegano/signature.hpp"

namespace stegano {

// Owns the per-run view of an input stream: its signature, the record most
// recently read and where that record started. Only Next() and Seek() move
// the read position.
class StreamCursor {
public:
    // Reads and validates the signature; throws MalformedContainer.
    StreamCursor(std::istream& input, Diagnostics& diag);

    StreamCursor(const StreamCursor&) = delete;
    StreamCursor& operator=(const StreamCursor&) = delete;

    const Signature& signature() const noexcept { return signature_; }
    const Record& current() const noexcept { return current_; }
    std::uint64_t offset() const noexcept { return offset_; }
    std::istream& input() noexcept { return input_; }
    Diagnostics& diagnostics() noexcept { return diag_; }

    // Reads the record at the read position. Returns false on a short read.
    bool Next();
    bool AtEnd();
    std::uint64_t Position();
    void Seek(std::uint64_t position);

    // Puts the read position back where it was on scope exit.
    class PositionGuard {
    public:
        explicit PositionGuard(StreamCursor& cursor);
        ~PositionGuard();

        PositionGuard(const PositionGuard&) = delete;
        PositionGuard& operator=(const PositionGuard&) = delete;

    private:
        StreamCursor& cursor_;
        std::uint64_t position_ = 0;
        std::uint64_t offset_ = 0;
    };

private:
    std::istream& input_;
    Diagnostics& diag_;
    Signature signature_;
    Record current_;
    std::uint64_t offset_ = 0;
};

}  // namespace stegano
