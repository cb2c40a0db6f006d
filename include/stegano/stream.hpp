#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>

namespace stegano::stream {

std::ifstream OpenInput(const std::filesystem::path& path);
std::ofstream OpenOutput(const std::filesystem::path& path);

// Throws IoError when fewer than `count` bytes can be read or the write fails.
void CopyExact(std::istream& input, std::ostream& output, std::uint64_t count);

// Copies until end of input; returns the number of bytes copied.
std::uint64_t CopyRemaining(std::istream& input, std::ostream& output);

std::uint64_t Position(std::istream& input);
std::uint64_t Size(std::istream& input);
std::uint64_t Remaining(std::istream& input);
void Seek(std::istream& input, std::uint64_t position);

// Reads up to `count` bytes at the current position; returns how many.
std::size_t ReadSome(std::istream& input, std::uint8_t* buffer, std::size_t count);

}  // namespace stegano::stream
