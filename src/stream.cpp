#include "stegano/stream.hpp"

#include "stegano/constants.hpp"
#include "stegano/errors.hpp"

#include <algorithm>
#include <array>

namespace stegano::stream {

namespace {

// A short read leaves eof|fail set; drop them so tellg/seekg keep working.
// A bad stream is a real I/O failure.
void ClearShortRead(std::istream& input) {
    if (input.bad()) {
        throw IoError("Read error on input stream");
    }
    if (input.eof() || input.fail()) {
        input.clear();
    }
}

}  // namespace

std::ifstream OpenInput(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw IoError("Failed to open file for reading: " + path.string());
    }
    return input;
}

std::ofstream OpenOutput(const std::filesystem::path& path) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw IoError("Failed to open file for writing: " + path.string());
    }
    return output;
}

std::size_t ReadSome(std::istream& input, std::uint8_t* buffer, std::size_t count) {
    if (count == 0) {
        return 0;
    }
    input.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(count));
    std::size_t got = static_cast<std::size_t>(input.gcount());
    if (got < count) {
        ClearShortRead(input);
    }
    return got;
}

void CopyExact(std::istream& input, std::ostream& output, std::uint64_t count) {
    std::array<std::uint8_t, constants::kCopyBufferSize> chunk;
    std::uint64_t remaining = count;
    while (remaining > 0) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, chunk.size()));
        std::size_t got = ReadSome(input, chunk.data(), want);
        if (got > 0) {
            output.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(got));
            if (!output) {
                throw IoError("Failed to write output stream");
            }
        }
        remaining -= got;
        if (got < want) {
            throw IoError("Unexpected end of input: " + std::to_string(remaining) + " of "
                          + std::to_string(count) + " bytes missing");
        }
    }
}

std::uint64_t CopyRemaining(std::istream& input, std::ostream& output) {
    std::array<std::uint8_t, constants::kCopyBufferSize> chunk;
    std::uint64_t copied = 0;
    while (true) {
        std::size_t got = ReadSome(input, chunk.data(), chunk.size());
        if (got == 0) {
            break;
        }
        output.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(got));
        if (!output) {
            throw IoError("Failed to write output stream");
        }
        copied += got;
        if (got < chunk.size()) {
            break;
        }
    }
    return copied;
}

std::uint64_t Position(std::istream& input) {
    std::istream::pos_type pos = input.tellg();
    if (pos == std::istream::pos_type(-1)) {
        throw IoError("Input stream is not seekable");
    }
    return static_cast<std::uint64_t>(pos);
}

std::uint64_t Size(std::istream& input) {
    std::uint64_t pos = Position(input);
    input.seekg(0, std::ios::end);
    std::uint64_t end = Position(input);
    Seek(input, pos);
    return end;
}

std::uint64_t Remaining(std::istream& input) {
    std::uint64_t pos = Position(input);
    std::uint64_t end = Size(input);
    return end > pos ? end - pos : 0;
}

void Seek(std::istream& input, std::uint64_t position) {
    input.clear();
    input.seekg(static_cast<std::streamoff>(position), std::ios::beg);
    if (!input) {
        throw IoError("Failed to seek input to offset " + std::to_string(position));
    }
}

}  // namespace stegano::stream
