#include <mydiff/error.hpp>

namespace mydiff {

FormatError::FormatError(Kind kind, std::uint64_t offset, std::uint64_t op_index, std::string const& detail)
: std::runtime_error(
    std::string(kind_name(kind)) + " at byte " + std::to_string(offset) +
    " (record " + std::to_string(op_index) + "): " + detail)
, kind_(kind)
, offset_(offset)
, op_index_(op_index)
{ }

std::string_view FormatError::kind_name(Kind kind)
{
    switch (kind) {
    case BAD_MAGIC:
        return "bad magic";
    case TRUNCATED:
        return "truncated";
    case UNKNOWN_OPCODE:
        return "unknown opcode";
    }
    return "malformed";
}

ProvenanceError::ProvenanceError(Digest const& expected, Digest const& actual)
: std::runtime_error(
    "source digest " + to_hex(actual) +
    " does not match the digest " + to_hex(expected) + " the diff was made from")
, expected_(expected)
, actual_(actual)
{ }

} // namespace mydiff
