#include "stegano/jpeg.hpp"

#include "stegano/errors.hpp"
#include "stegano/format.hpp"
#include "stegano/stream.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <fstream>
#include <vector>

namespace stegano::jpeg {

namespace {

using Bytes = std::vector<std::uint8_t>;

bool IsStandalone(std::uint16_t marker) {
    return (marker >= 0xFFD0 && marker <= 0xFFD7) || marker == 0xFF01 || marker == kSoi;
}

std::string DescribeApp0(const Bytes& body) {
    static const std::array<std::uint8_t, 5> kJfif = {'J', 'F', 'I', 'F', 0};
    if (body.size() >= 12 && std::equal(kJfif.begin(), kJfif.end(), body.begin())) {
        char buffer[96];
        std::snprintf(buffer, sizeof(buffer), "JFIF v%u.%02u, density %ux%u (units %u), thumbnail %ux%u",
                      static_cast<unsigned>(body[5]), static_cast<unsigned>(body[6]),
                      static_cast<unsigned>(format::ReadU16BE(body.data() + 8)),
                      static_cast<unsigned>(format::ReadU16BE(body.data() + 10)), static_cast<unsigned>(body[7]),
                      body.size() > 12 ? static_cast<unsigned>(body[12]) : 0u,
                      body.size() > 13 ? static_cast<unsigned>(body[13]) : 0u);
        return buffer;
    }
    return "APP0 data, " + std::to_string(body.size()) + " bytes";
}

std::string DescribeComment(const Bytes& body) {
    std::string text;
    for (std::uint8_t byte : body) {
        text.push_back((byte >= 0x20 && byte < 0x7F) ? static_cast<char>(byte) : '.');
    }
    return "\"" + text + "\"";
}

std::string DescribeDqt(const Bytes& body) {
    std::string detail;
    std::size_t pos = 0;
    while (pos < body.size()) {
        std::uint8_t precision = body[pos] >> 4;
        std::uint8_t id = body[pos] & 0x0F;
        std::size_t table_len = precision == 0 ? 64 : 128;
        if (!detail.empty()) {
            detail += ", ";
        }
        detail += "table " + std::to_string(id) + (precision == 0 ? " (8-bit)" : " (16-bit)");
        pos += 1 + table_len;
    }
    if (pos > body.size()) {
        detail += " [truncated]";
    }
    return detail;
}

std::string DescribeSof(const Bytes& body) {
    if (body.size() < 6) {
        return "truncated frame header";
    }
    std::size_t components = body[5];
    std::string detail = "precision " + std::to_string(body[0]) + ", "
                         + std::to_string(format::ReadU16BE(body.data() + 3)) + "x"
                         + std::to_string(format::ReadU16BE(body.data() + 1)) + ", "
                         + std::to_string(components) + " components";
    for (std::size_t i = 0; i < components && 6 + i * 3 + 2 < body.size(); ++i) {
        const std::uint8_t* comp = body.data() + 6 + i * 3;
        detail += "; id " + std::to_string(comp[0]) + " sampling " + std::to_string(comp[1] >> 4) + "x"
                  + std::to_string(comp[1] & 0x0F) + " qt " + std::to_string(comp[2]);
    }
    return detail;
}

std::string DescribeDht(const Bytes& body) {
    std::string detail;
    std::size_t pos = 0;
    while (pos + 17 <= body.size()) {
        std::uint8_t table_class = body[pos] >> 4;
        std::uint8_t id = body[pos] & 0x0F;
        std::size_t symbols = 0;
        for (std::size_t i = 1; i <= 16; ++i) {
            symbols += body[pos + i];
        }
        if (!detail.empty()) {
            detail += ", ";
        }
        detail += std::string(table_class == 0 ? "DC" : "AC") + " table " + std::to_string(id) + " ("
                  + std::to_string(symbols) + " symbols)";
        pos += 17 + symbols;
    }
    return detail.empty() ? "empty" : detail;
}

std::string DescribeSos(const Bytes& body) {
    if (body.empty()) {
        return "truncated scan header";
    }
    std::size_t components = body[0];
    std::size_t tail = 1 + components * 2;
    std::string detail = std::to_string(components) + " components";
    if (tail + 3 <= body.size()) {
        detail += ", Ss " + std::to_string(body[tail]) + " Se " + std::to_string(body[tail + 1]) + " Ah "
                  + std::to_string(body[tail + 2] >> 4) + " Al " + std::to_string(body[tail + 2] & 0x0F);
    }
    return detail;
}

std::string Describe(std::uint16_t marker, const Bytes& body) {
    switch (marker) {
        case kApp0:
            return DescribeApp0(body);
        case kCom:
            return DescribeComment(body);
        case kDqt:
            return DescribeDqt(body);
        case kSof0:
        case kSof1:
        case kSof2:
            return DescribeSof(body);
        case kDht:
            return DescribeDht(body);
        case kSos:
            return DescribeSos(body);
        default:
            return std::to_string(body.size()) + " bytes";
    }
}

bool ReadU16(std::istream& input, std::uint16_t& value) {
    std::array<std::uint8_t, 2> raw{};
    if (stream::ReadSome(input, raw.data(), raw.size()) != raw.size()) {
        return false;
    }
    value = format::ReadU16BE(raw.data());
    return true;
}

}  // namespace

const char* MarkerName(std::uint16_t marker) {
    switch (marker) {
        case kSoi: return "SOI";
        case kEoi: return "EOI";
        case kSos: return "SOS";
        case kApp0: return "APP0";
        case kCom: return "COM";
        case kDqt: return "DQT";
        case kDht: return "DHT";
        case kSof0: return "SOF0";
        case kSof1: return "SOF1";
        case kSof2: return "SOF2";
        case 0xFFDD: return "DRI";
        default: break;
    }
    if (marker >= 0xFFE1 && marker <= 0xFFEF) {
        return "APPn";
    }
    if (marker >= 0xFFD0 && marker <= 0xFFD7) {
        return "RSTn";
    }
    return "unknown";
}

std::vector<MarkerSummary> InspectMarkers(std::istream& input, Diagnostics& diag, std::size_t max_markers) {
    std::uint16_t marker = 0;
    if (!ReadU16(input, marker) || marker != kSoi) {
        throw MalformedContainer("Not a valid JPEG file: missing SOI marker");
    }
    std::vector<MarkerSummary> markers;
    markers.push_back(MarkerSummary{0, kSoi, MarkerName(kSoi), 0, {}});

    while (markers.size() < max_markers) {
        std::uint64_t offset = stream::Position(input);
        if (!ReadU16(input, marker)) {
            diag.Warn("Unexpected end of file while reading marker");
            break;
        }
        if ((marker >> 8) != 0xFF) {
            diag.Warn("Expected a marker at offset " + std::to_string(offset) + ", found 0x"
                      + format::Hex32(marker));
            break;
        }
        // Fill bytes: FF FF ... FF xx
        while (marker == 0xFFFF) {
            std::uint8_t next = 0;
            if (stream::ReadSome(input, &next, 1) != 1) {
                break;
            }
            marker = static_cast<std::uint16_t>(0xFF00 | next);
        }
        if (marker == 0xFFFF) {
            diag.Warn("Unexpected end of file inside fill bytes at offset " + std::to_string(offset));
            break;
        }

        MarkerSummary summary;
        summary.offset = offset;
        summary.marker = marker;
        summary.name = MarkerName(marker);
        if (marker == kEoi || IsStandalone(marker)) {
            markers.push_back(std::move(summary));
            if (marker == kEoi) {
                break;
            }
            continue;
        }

        if (!ReadU16(input, summary.length) || summary.length < 2) {
            diag.Warn("Bad or missing segment length for " + summary.name + " at offset " + std::to_string(offset));
            break;
        }
        Bytes body(summary.length - 2u);
        std::size_t got = stream::ReadSome(input, body.data(), body.size());
        bool truncated = got < body.size();
        if (truncated) {
            diag.Warn("Unexpected end of file inside " + summary.name + " segment");
            body.resize(got);
        }
        summary.detail = Describe(marker, body);
        markers.push_back(std::move(summary));
        if (marker == kSos || truncated) {
            break;
        }
    }
    return markers;
}

std::vector<MarkerSummary> InspectFile(const std::string& path, Diagnostics& diag, std::size_t max_markers) {
    std::ifstream input = stream::OpenInput(path);
    std::vector<MarkerSummary> markers = InspectMarkers(input, diag, max_markers);
    if (std::ostream* out = diag.Detail()) {
        for (const auto& m : markers) {
            *out << m.offset << "\t" << m.name << " (0x" << format::Hex32(m.marker) << ")";
            if (m.length > 0) {
                *out << " len " << m.length;
            }
            if (!m.detail.empty()) {
                *out << ": " << m.detail;
            }
            *out << "\n";
        }
    }
    return markers;
}

}  // namespace stegano::jpeg
