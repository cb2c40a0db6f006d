#include "stegano/inspect.hpp"

#include "stegano/checksum.hpp"
#include "stegano/cli_colors.hpp"
#include "stegano/format.hpp"
#include "stegano/stream.hpp"

#include <fstream>
#include <iostream>

namespace stegano::inspect {

namespace {

void Print(Diagnostics& diag, const RecordSummary& summary, const Record& record, bool hex_dump) {
    std::ostream* out = diag.Detail();
    if (!out) {
        return;
    }
    *out << cli::Green("---- Chunk #" + std::to_string(summary.index) + " ----", *out) << "\n";
    *out << "Chunk offset: " << summary.offset << "\n";
    *out << "Chunk size: " << summary.length << "\n";
    *out << "Chunk type: " << summary.label << "\n";
    *out << "Chunk crc: " << format::Hex32(summary.checksum)
         << (summary.checksum_ok ? "" : cli::Yellow(" (mismatch)", *out)) << "\n";
    if (hex_dump && !record.payload.empty()) {
        std::uint64_t data_offset = summary.offset + constants::kLengthFieldSize + constants::kTypeTagSize;
        format::HexDump(record.payload, data_offset, *out, cli::ColorsEnabled(*out));
    }
}

}  // namespace

std::vector<RecordSummary> InspectRecords(StreamCursor& cursor, const Options& options) {
    Diagnostics& diag = cursor.diagnostics();
    std::vector<RecordSummary> summaries;
    // Chunks are numbered from 1; #1 is the chunk right after the signature.
    for (std::size_t index = 1; index < options.end && summaries.size() < options.count; ++index) {
        if (cursor.AtEnd()) {
            diag.Info("Reached end of file after " + std::to_string(index - 1) + " chunks");
            break;
        }
        bool complete = cursor.Next();
        const Record& record = cursor.current();
        bool terminal = IsTerminal(record);
        if (index >= options.start) {
            RecordSummary summary;
            summary.index = index;
            summary.offset = cursor.offset();
            summary.length = record.length;
            summary.label = TypeTagToLabel(record);
            summary.checksum = record.checksum;
            summary.checksum_ok = checksum::Verify(record);
            summary.complete = complete;
            Print(diag, summary, record, options.hex_dump);
            summaries.push_back(std::move(summary));
        }
        if (terminal || !complete) {
            break;
        }
    }
    return summaries;
}

std::vector<RecordSummary> InspectFile(const std::string& path, const Options& options, Diagnostics& diag) {
    std::ifstream input = stream::OpenInput(path);
    StreamCursor cursor(input, diag);
    diag.Info("It is a valid PNG file. Let's process it!");
    return InspectRecords(cursor, options);
}

}  // namespace stegano::inspect
