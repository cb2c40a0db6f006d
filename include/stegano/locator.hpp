#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "stegano/constants.hpp"
#include "stegano/cursor.hpp"
#include "stegano/record.hpp"

namespace stegano::locator {

// std::nullopt asks for automatic placement.
using OffsetRequest = std::optional<std::uint64_t>;

// Offset of the terminal record's first byte, walking records from the
// cursor position. Falls back to a byte search for the terminal tag when
// the walk runs off the end of the stream or meets a malformed terminal.
// Read position is restored.
std::optional<std::uint64_t> FindTerminal(StreamCursor& cursor,
                                          std::size_t scan_limit = constants::kDefaultScanLimit);

// Where a new synthetic record goes. Read position is restored.
std::uint64_t ResolveOffset(StreamCursor& cursor,
                            const OffsetRequest& request,
                            std::size_t scan_limit = constants::kDefaultScanLimit);

// Where an already spliced synthetic record starts, found by testing every
// possible length backwards from the last terminal tag in the stream. Read
// position is restored.
std::uint64_t LocateSyntheticRecord(StreamCursor& cursor, const TypeTag& type);

}  // namespace stegano::locator
