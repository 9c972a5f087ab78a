#pragma once

#include <mydiff/codec.hpp>
#include <mydiff/digest.hpp>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <span>
#include <string>

namespace mydiff {

inline constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;
inline constexpr size_t DEFAULT_COPY_BLOCK = 1024 * 1024;

class StreamingDiffer
{
public:
    struct Stats
    {
        std::uint64_t chunks = 0;
        std::uint64_t ops = 0;
        std::uint64_t old_bytes = 0;
        std::uint64_t new_bytes = 0;
        std::uint64_t diff_bytes = 0;
    };

    /*
     * Write a diff file turning old_path into new_path.
     *
     * Both inputs are read in lockstep chunks of chunk_size bytes and each
     * pair of chunks is diffed on its own, so memory stays bounded by the
     * chunk size whatever the file size. The output appears at out_path
     * only once it is complete.
     */
    static Stats generate(
        std::filesystem::path const& old_path,
        std::filesystem::path const& new_path,
        std::filesystem::path const& out_path,
        size_t chunk_size = DEFAULT_CHUNK_SIZE
    );

    /*
     * Write the header and records for two streams. `digest` is stored as
     * the digest of old_.
     */
    static Stats generate(
        std::istream& old_,
        std::istream& new_,
        std::ostream& out,
        Digest const& digest,
        size_t chunk_size = DEFAULT_CHUNK_SIZE
    );
};

class StreamingPatcher
{
public:
    struct Stats
    {
        std::uint64_t ops = 0;
        std::uint64_t copied = 0;
        std::uint64_t inserted = 0;
        std::uint64_t skipped = 0;
    };

    /*
     * Rebuild the new file from old_path and the diff at diff_path.
     *
     * The diff is not validated beyond what decoding needs; run
     * IntegrityGuard first. out_path may name old_path, in which case the
     * old file is replaced once the new one is complete.
     */
    static Stats apply(
        std::filesystem::path const& old_path,
        std::filesystem::path const& diff_path,
        std::filesystem::path const& out_path,
        size_t copy_block = DEFAULT_COPY_BLOCK
    );

    /*
     * Apply the records read from `records` (positioned just past the
     * header, at file offset `offset`) to old_, writing to out.
     */
    static Stats apply(
        std::istream& old_,
        std::istream& records,
        std::ostream& out,
        size_t copy_block = DEFAULT_COPY_BLOCK,
        std::uint64_t offset = HEADER_SIZE
    );
};

/*
 * Where the diff of the idx-th old file against latest is written:
 * NAME.diff when names holds a NAME for it, otherwise
 * <old stem>-<latest stem>.diff beside the old file.
 */
std::filesystem::path diff_output_path(
    std::filesystem::path const& old_path,
    std::filesystem::path const& latest_path,
    std::span<std::string const> names,
    size_t idx
);

// Whether path ends in ".diff", ignoring case and surrounding whitespace.
bool has_diff_extension(std::filesystem::path const& path);

// A configured copy block, with 0 meaning the default.
size_t copy_block_or_default(size_t copy_block);

} // namespace mydiff
