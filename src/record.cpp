#include "stegano/record.hpp"

#include "stegano/errors.hpp"
#include "stegano/format.hpp"
#include "stegano/stream.hpp"

#include <algorithm>

namespace stegano {

std::uint32_t Record::TypeValue() const noexcept {
    return format::ReadU32BE(type.data());
}

Record MakeRecord(const TypeTag& type, Bytes payload, std::uint32_t checksum) {
    Record record;
    record.length = static_cast<std::uint32_t>(payload.size());
    record.type = type;
    record.payload = std::move(payload);
    record.checksum = checksum;
    return record;
}

TypeTag TypeTagFromString(const std::string& label) {
    if (label.size() != constants::kTypeTagSize) {
        throw ConfigError("Chunk type must be exactly 4 characters: \"" + label + "\"");
    }
    TypeTag type{};
    std::copy(label.begin(), label.end(), type.begin());
    return type;
}

bool ReadRecord(std::istream& input, Record& record, Diagnostics& diag) {
    bool complete = true;
    std::array<std::uint8_t, 4> field{};

    if (stream::ReadSome(input, field.data(), field.size()) == field.size()) {
        record.length = format::ReadU32BE(field.data());
    } else {
        diag.Warn("Reached end of file prematurely while reading chunk size");
        complete = false;
    }

    record.type.fill(0);
    if (stream::ReadSome(input, record.type.data(), record.type.size()) != record.type.size()) {
        diag.Warn("Reached end of file prematurely while reading chunk type");
        complete = false;
    }

    // Never trust the length field with an allocation larger than the stream.
    std::uint64_t available = stream::Remaining(input);
    std::size_t wanted = static_cast<std::size_t>(std::min<std::uint64_t>(record.length, available));
    record.payload.resize(wanted);
    std::size_t got = wanted > 0 ? stream::ReadSome(input, record.payload.data(), wanted) : 0;
    record.payload.resize(got);
    if (got < record.length) {
        diag.Warn("Reached end of file prematurely while reading chunk bytes (" + std::to_string(got) + " of "
                  + std::to_string(record.length) + ")");
        complete = false;
    }

    field.fill(0);
    if (stream::ReadSome(input, field.data(), field.size()) != field.size()) {
        diag.Warn("Reached end of file prematurely while reading CRC");
        complete = false;
    }
    record.checksum = format::ReadU32BE(field.data());
    return complete;
}

Bytes MarshalSyntheticRecord(const Record& record) {
    if (record.payload.size() > constants::kMaxSyntheticPayload) {
        throw ConfigError("Payload of " + std::to_string(record.payload.size())
                          + " bytes does not fit a synthetic chunk (max "
                          + std::to_string(constants::kMaxSyntheticPayload) + ")");
    }
    Bytes out;
    out.reserve(constants::kSyntheticFramingSize + record.payload.size());
    out.push_back(static_cast<std::uint8_t>(record.payload.size()));
    out.insert(out.end(), record.type.begin(), record.type.end());
    out.insert(out.end(), record.payload.begin(), record.payload.end());
    format::PutU32BE(out, record.checksum);
    return out;
}

void WriteSyntheticRecord(const Record& record, std::ostream& output) {
    Bytes data = MarshalSyntheticRecord(record);
    output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!output) {
        throw IoError("Failed to write synthetic chunk");
    }
}

Record ReadSyntheticRecord(std::istream& input) {
    std::uint8_t length = 0;
    if (stream::ReadSome(input, &length, 1) != 1) {
        throw IoError("Truncated synthetic chunk: missing length");
    }
    Record record;
    record.length = length;
    if (stream::ReadSome(input, record.type.data(), record.type.size()) != record.type.size()) {
        throw IoError("Truncated synthetic chunk: missing type");
    }
    record.payload.resize(length);
    if (length > 0 && stream::ReadSome(input, record.payload.data(), length) != length) {
        throw IoError("Truncated synthetic chunk: payload shorter than " + std::to_string(length) + " bytes");
    }
    std::array<std::uint8_t, 4> crc{};
    if (stream::ReadSome(input, crc.data(), crc.size()) != crc.size()) {
        throw IoError("Truncated synthetic chunk: missing CRC");
    }
    record.checksum = format::ReadU32BE(crc.data());
    return record;
}

std::string TypeTagToLabel(const TypeTag& type) {
    std::string label;
    for (std::uint8_t byte : type) {
        if (byte < 0x80) {
            label.push_back(static_cast<char>(byte));
        } else {
            label += "\xEF\xBF\xBD";
        }
    }
    return label;
}

std::string TypeTagToLabel(const Record& record) {
    return TypeTagToLabel(record.type);
}

bool IsTerminal(const Record& record) {
    return TypeTagToLabel(record) == constants::kTerminalLabel;
}

}  // namespace stegano
