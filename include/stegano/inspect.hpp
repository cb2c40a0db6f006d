#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "stegano/cursor.hpp"
#include "stegano/diagnostics.hpp"

namespace stegano::inspect {

struct Options {
    std::size_t start = 1;
    std::size_t end = 11;
    std::size_t count = 10;
    bool hex_dump = false;
};

struct RecordSummary {
    std::size_t index = 0;
    std::uint64_t offset = 0;
    std::uint32_t length = 0;
    std::string label;
    std::uint32_t checksum = 0;
    bool checksum_ok = false;
    bool complete = false;
};

// Records [0, start) are walked silently, then up to `count` records of
// [start, end) are reported. The walk stops after the terminal record.
std::vector<RecordSummary> InspectRecords(StreamCursor& cursor, const Options& options);

std::vector<RecordSummary> InspectFile(const std::string& path, const Options& options, Diagnostics& diag);

}  // namespace stegano::inspect
