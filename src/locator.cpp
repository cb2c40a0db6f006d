#include "stegano/locator.hpp"

#include "stegano/checksum.hpp"
#include "stegano/errors.hpp"
#include "stegano/format.hpp"
#include "stegano/stream.hpp"

#include <algorithm>
#include <vector>

namespace stegano::locator {

namespace {

// Last occurrence of the terminal tag at or after `from`, as the offset of
// the record start (tag position minus the length field).
std::optional<std::uint64_t> SearchTerminalTag(StreamCursor& cursor, std::uint64_t from) {
    const std::string_view tag = constants::kTerminalLabel;
    const std::size_t overlap = tag.size() - 1;
    std::vector<std::uint8_t> window(constants::kCopyBufferSize + overlap);
    std::optional<std::uint64_t> found;

    cursor.Seek(from);
    std::uint64_t window_start = from;
    std::size_t carried = 0;
    while (true) {
        std::size_t got = stream::ReadSome(cursor.input(), window.data() + carried, constants::kCopyBufferSize);
        std::size_t filled = carried + got;
        for (std::size_t i = 0; i + tag.size() <= filled; ++i) {
            if (std::equal(tag.begin(), tag.end(), window.begin() + static_cast<std::ptrdiff_t>(i))) {
                std::uint64_t tag_pos = window_start + i;
                if (tag_pos >= from + constants::kLengthFieldSize) {
                    found = tag_pos - constants::kLengthFieldSize;
                }
            }
        }
        if (got == 0) {
            break;
        }
        carried = std::min(overlap, filled);
        std::copy(window.begin() + static_cast<std::ptrdiff_t>(filled - carried),
                  window.begin() + static_cast<std::ptrdiff_t>(filled), window.begin());
        window_start += filled - carried;
    }
    return found;
}

// A real terminal record is empty and carries the standard checksum.
bool IsGenuineTerminal(const Record& record) {
    return record.length == 0 && record.payload.empty() && checksum::Verify(record);
}

}  // namespace

std::optional<std::uint64_t> FindTerminal(StreamCursor& cursor, std::size_t scan_limit) {
    StreamCursor::PositionGuard guard(cursor);
    const std::uint64_t start = cursor.Position();

    for (std::size_t walked = 0; walked < scan_limit; ++walked) {
        if (cursor.AtEnd()) {
            break;
        }
        bool complete = cursor.Next();
        if (IsTerminal(cursor.current())) {
            if (IsGenuineTerminal(cursor.current())) {
                return cursor.offset();
            }
            // Misaligned bytes that happen to spell the terminal tag.
            cursor.diagnostics().Warn("Ignoring a malformed IEND chunk at offset "
                                      + std::to_string(cursor.offset()));
            break;
        }
        if (!complete) {
            break;
        }
        if (walked + 1 == scan_limit) {
            cursor.diagnostics().Warn("Stopped after " + std::to_string(scan_limit)
                                      + " chunks without reaching IEND");
            return std::nullopt;
        }
    }

    // The walk ran off the end: chunk alignment was lost somewhere, most
    // likely at a splice. Resynchronize on the terminal tag itself.
    cursor.diagnostics().Warn("Chunk walk lost alignment before IEND; searching for the IEND tag");
    return SearchTerminalTag(cursor, start);
}

std::uint64_t ResolveOffset(StreamCursor& cursor, const OffsetRequest& request, std::size_t scan_limit) {
    if (request) {
        if (*request < constants::kSignatureSize) {
            throw ConfigError("Offset " + std::to_string(*request) + " falls inside the "
                              + std::to_string(constants::kSignatureSize) + "-byte signature");
        }
        return *request;
    }
    std::optional<std::uint64_t> terminal = FindTerminal(cursor, scan_limit);
    if (!terminal) {
        throw MalformedContainer("No IEND chunk found; pass an explicit offset instead of auto");
    }
    if (*terminal < constants::kSignatureSize + constants::kAutoOffsetBackoff) {
        throw MalformedContainer("IEND chunk at offset " + std::to_string(*terminal)
                                 + " leaves no room for an automatic offset");
    }
    return *terminal - constants::kAutoOffsetBackoff;
}

std::uint64_t LocateSyntheticRecord(StreamCursor& cursor, const TypeTag& type) {
    StreamCursor::PositionGuard guard(cursor);
    // The splice always breaks the record walk, and the walk would then read
    // ciphertext as record fields. Only the tag search is trusted here.
    std::optional<std::uint64_t> terminal = SearchTerminalTag(cursor, cursor.Position());
    if (!terminal) {
        throw MalformedContainer("No IEND chunk found; pass the offset used when embedding");
    }

    // The encoder put the record at (original IEND - backoff); everything
    // after it moved by the record's own size.
    std::vector<std::uint8_t> candidate;
    for (std::size_t length = 0; length <= constants::kMaxSyntheticPayload; ++length) {
        std::uint64_t span = constants::kSyntheticFramingSize + length;
        if (*terminal < constants::kSignatureSize + constants::kAutoOffsetBackoff + span) {
            break;
        }
        std::uint64_t start = *terminal - constants::kAutoOffsetBackoff - span;
        candidate.resize(static_cast<std::size_t>(span));
        cursor.Seek(start);
        if (stream::ReadSome(cursor.input(), candidate.data(), candidate.size()) != candidate.size()) {
            continue;
        }
        if (candidate[0] != length) {
            continue;
        }
        const std::uint8_t* tag = candidate.data() + constants::kSyntheticLengthSize;
        if (!std::equal(type.begin(), type.end(), tag)) {
            continue;
        }
        const std::uint8_t* body = tag + constants::kTypeTagSize;
        Bytes payload(body, body + length);
        std::uint32_t stored = format::ReadU32BE(body + length);
        if (checksum::Compute(constants::kStandardChecksumSeed, type, payload) == stored) {
            return start;
        }
    }
    throw MalformedContainer("No embedded \"" + TypeTagToLabel(type) + "\" chunk found before IEND");
}

}  // namespace stegano::locator
