#pragma once

#include <mydiff/digest.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mydiff {

/*
 * A diff file that is not a well-formed sequence of records.
 *
 * offset is the byte offset within the diff file where the problem was
 * found, and op_index the zero-based index of the record being read.
 */
class FormatError : public std::runtime_error
{
public:
    enum Kind {
        BAD_MAGIC,
        TRUNCATED,
        UNKNOWN_OPCODE,
    };

    FormatError(Kind kind, std::uint64_t offset, std::uint64_t op_index, std::string const& detail);

    Kind kind() const noexcept { return kind_; }
    std::uint64_t offset() const noexcept { return offset_; }
    std::uint64_t op_index() const noexcept { return op_index_; }

    static std::string_view kind_name(Kind kind);

private:
    Kind kind_;
    std::uint64_t offset_;
    std::uint64_t op_index_;
};

/*
 * The file about to be patched is not the one the diff was made from.
 */
class ProvenanceError : public std::runtime_error
{
public:
    ProvenanceError(Digest const& expected, Digest const& actual);

    Digest const& expected() const noexcept { return expected_; }
    Digest const& actual() const noexcept { return actual_; }

private:
    Digest expected_;
    Digest actual_;
};

} // namespace mydiff
