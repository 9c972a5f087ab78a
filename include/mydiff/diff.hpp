#pragma once

#include <mydiff/common.hpp>

#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace mydiff {

// Insert payload before source byte `position`.
struct Insert
{
    std::uint64_t position;
    Bytes payload;

    bool operator==(Insert const&) const = default;
};

// Skip `length` source bytes starting at `position`.
struct Delete
{
    std::uint64_t position;
    std::uint64_t length;

    bool operator==(Delete const&) const = default;
};

// Replace payload.size() source bytes starting at `position` with payload.
struct Change
{
    std::uint64_t position;
    Bytes payload;

    bool operator==(Change const&) const = default;
};

/*
 * One edit of a script. A well-formed script is sorted by position and its
 * ops do not overlap: each op's consumed source span ends at or before the
 * next op's position.
 */
using DiffOp = std::variant<Insert, Delete, Change>;

std::uint64_t position(DiffOp const& op);
std::uint64_t & position(DiffOp & op);

// Number of source bytes the op consumes.
std::uint64_t consumed(DiffOp const& op);

// Number of output bytes the op produces.
std::uint64_t produced(DiffOp const& op);

// Number of single-byte insertions and deletions the op stands for.
std::uint64_t edit_length(DiffOp const& op);

class ScriptBuilder
{
public:
    /*
     * Shortest edit script turning old_ into new_, coalesced into Insert,
     * Delete and Change ops in ascending position order.
     */
    static std::vector<DiffOp> build(ByteView old_, ByteView new_);

    /*
     * The uncoalesced script: single-byte steps and whole-span edges of
     * degenerate boxes, in ascending position order.
     */
    static std::vector<DiffOp> primitives(ByteView old_, ByteView new_);

    /*
     * Join Inserts at the same position and Deletes that are contiguous.
     */
    static std::vector<DiffOp> merge(std::vector<DiffOp> ops);

    /*
     * Fuse a Delete and an Insert meeting at one position into a Change,
     * keeping whatever is left of the longer one after it.
     */
    static std::vector<DiffOp> consolidate(std::vector<DiffOp> ops);
};

// Length of the shortest edit script, counted in single-byte edits.
std::uint64_t ses(ByteView old_, ByteView new_);

std::uint64_t edit_length(std::span<DiffOp const> ops);

/*
 * Apply a script to an in-memory source.
 * Throws std::invalid_argument if ops are unsorted, overlap, or reach past
 * the end of old_.
 */
Bytes patch(ByteView old_, std::span<DiffOp const> ops);

} // namespace mydiff
