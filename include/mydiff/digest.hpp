#pragma once

#include <mydiff/common.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>

namespace mydiff {

inline constexpr size_t DIGEST_SIZE = 32;

using Digest = std::array<std::uint8_t, DIGEST_SIZE>;

// SHA-256 of a file, read in fixed-size blocks.
Digest digest_file(std::filesystem::path const& path);

// SHA-256 of everything remaining in a stream.
Digest digest_stream(std::istream& in);

Digest digest_bytes(ByteView bytes);

std::string to_hex(Digest const& digest);

} // namespace mydiff
