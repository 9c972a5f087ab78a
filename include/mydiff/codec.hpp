#pragma once

#include <mydiff/common.hpp>
#include <mydiff/diff.hpp>
#include <mydiff/digest.hpp>
#include <mydiff/error.hpp>

#include <cstdint>
#include <expected>
#include <generator>
#include <istream>
#include <ostream>
#include <span>
#include <string_view>
#include <vector>

namespace mydiff {

/*
 * Diff file layout, all integers unsigned big-endian:
 *
 *   0..6       "MYDIFF"
 *   6..38      SHA-256 of the old file
 *   38..EOF    records: opcode (1) position (8) length (8) payload (length)
 *
 * Delete records carry no payload; their length is the number of source
 * bytes skipped.
 */
inline constexpr std::string_view MAGIC = "MYDIFF";
inline constexpr size_t HEADER_SIZE = MAGIC.size() + DIGEST_SIZE;
inline constexpr size_t RECORD_HEADER_SIZE = 1 + 8 + 8;

enum class OpCode : std::uint8_t {
    INSERT = 0x01,
    DELETE = 0x02,
    CHANGE = 0x03,
};

bool is_opcode(std::uint8_t byte);

class Codec
{
public:
    using Decoded = std::expected<DiffOp, FormatError>;

    static void write_header(std::ostream& out, Digest const& digest);

    /*
     * Read and check the magic, and return the stored digest.
     * Throws FormatError on a wrong magic or a short header.
     */
    static Digest read_header(std::istream& in);

    static void encode(DiffOp const& op, std::ostream& out);
    static void encode(std::span<DiffOp const> ops, std::ostream& out);
    static Bytes encode(std::span<DiffOp const> ops);

    /*
     * Lazily decode records from the current position of `in` until EOF.
     *
     * `offset` is the file offset of the current stream position, used to
     * report where a record went wrong. A record cut short or an unknown
     * opcode is yielded once as an error, after which decoding stops.
     * The stream must outlive the generator.
     */
    static std::generator<Decoded> decode(std::istream& in, std::uint64_t offset = HEADER_SIZE);

    /*
     * Decode a buffer of records (no file header). Throws FormatError.
     */
    static std::vector<DiffOp> decode(ByteView records);
};

} // namespace mydiff
