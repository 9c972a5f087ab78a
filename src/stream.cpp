#include <mydiff/stream.hpp>
#include <mydiff/diff.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h> // getpid

namespace fs = std::filesystem;

namespace mydiff {

namespace {

std::ifstream open_input(fs::path const& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw fs::filesystem_error("cannot open for reading", path,
            std::error_code(errno, std::generic_category()));
    }
    return file;
}

/*
 * Output written beside its final path and renamed into place by commit(),
 * so readers never see a partial file. Removed if never committed.
 */
class PendingFile
{
public:
    explicit PendingFile(fs::path const& path)
    : path_(path)
    , temp_(path.string() + "." + std::to_string(getpid()) + ".tmp")
    , committed_(false)
    {
        stream.open(temp_, std::ios::binary | std::ios::trunc);
        if (!stream) {
            throw fs::filesystem_error("cannot open for writing", temp_,
                std::error_code(errno, std::generic_category()));
        }
    }

    ~PendingFile()
    {
        if (!committed_) {
            stream.close();
            std::error_code ignored;
            fs::remove(temp_, ignored);
        }
    }

    void commit()
    {
        stream.close();
        if (!stream) {
            throw fs::filesystem_error("write failed", temp_,
                std::error_code(errno, std::generic_category()));
        }
        fs::rename(temp_, path_);
        committed_ = true;
    }

    std::ofstream stream;

private:
    fs::path path_;
    fs::path temp_;
    bool committed_;
};

void check_written(std::ostream& out)
{
    if (!out) {
        throw std::runtime_error("write to output failed");
    }
}

size_t read_chunk(std::istream& in, Bytes & chunk, size_t chunk_size)
{
    chunk.resize(chunk_size);
    in.read(reinterpret_cast<char*>(chunk.data()), (std::streamsize)chunk_size);
    if (in.bad()) {
        throw std::runtime_error("read error on input");
    }
    chunk.resize((size_t)in.gcount());
    return chunk.size();
}

/*
 * Copy exactly `amount` bytes in blocks. Throws if `from` ends first.
 */
void copy_exact(std::istream& from, std::ostream& to, std::uint64_t amount, std::vector<char> & block, std::uint64_t cursor)
{
    while (amount > 0) {
        size_t piece = (size_t)std::min<std::uint64_t>(amount, block.size());
        from.read(block.data(), (std::streamsize)piece);
        auto got = (size_t)from.gcount();
        to.write(block.data(), (std::streamsize)got);
        check_written(to);
        if (got < piece) {
            throw std::runtime_error(
                "source ended at byte " + std::to_string(cursor + got) +
                " but the diff copies " + std::to_string(amount - got) + " more");
        }
        amount -= piece;
        cursor += piece;
    }
}

std::uint64_t copy_rest(std::istream& from, std::ostream& to, std::vector<char> & block)
{
    std::uint64_t total = 0;
    while (from) {
        from.read(block.data(), (std::streamsize)block.size());
        auto got = from.gcount();
        if (got > 0) {
            to.write(block.data(), got);
            check_written(to);
            total += (std::uint64_t)got;
        }
    }
    if (from.bad()) {
        throw std::runtime_error("read error on source");
    }
    return total;
}

// Bytes from the current position of `from` to its end.
std::uint64_t remaining_size(std::istream& from)
{
    auto here = from.tellg();
    from.seekg(0, std::ios::end);
    auto end = from.tellg();
    from.seekg(here);
    if (here < 0 || end < 0 || !from) {
        throw std::runtime_error("source is not seekable");
    }
    return (std::uint64_t)(end - here);
}

/*
 * Skip `amount` source bytes. Throws if that would run past the end of a
 * source of source_size bytes, `cursor` of which are already consumed.
 */
void skip(std::istream& from, std::uint64_t amount, std::uint64_t cursor, std::uint64_t source_size)
{
    if (amount > source_size - cursor) {
        throw std::runtime_error(
            "source ends at byte " + std::to_string(source_size) +
            " but the diff skips " + std::to_string(amount) + " bytes from byte " + std::to_string(cursor));
    }
    from.seekg((std::streamoff)amount, std::ios::cur);
    if (from.fail()) {
        throw std::runtime_error("seek error on source at byte " + std::to_string(cursor));
    }
}

} // namespace

StreamingDiffer::Stats StreamingDiffer::generate(
    std::istream& old_,
    std::istream& new_,
    std::ostream& out,
    Digest const& digest,
    size_t chunk_size
) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be at least 1 byte");
    }

    Stats stats;
    Codec::write_header(out, digest);
    check_written(out);
    stats.diff_bytes = HEADER_SIZE;

    Bytes chunk_old, chunk_new;
    // old-file bytes consumed by earlier chunks; ops are relative to the old file
    std::uint64_t offset = 0;

    while (true) {
        read_chunk(old_, chunk_old, chunk_size);
        read_chunk(new_, chunk_new, chunk_size);
        if (chunk_old.empty() && chunk_new.empty()) {
            break;
        }

        auto ops = ScriptBuilder::build(chunk_old, chunk_new);
        for (auto & op : ops) {
            position(op) += offset;
            Codec::encode(op, out);
            stats.diff_bytes += RECORD_HEADER_SIZE + produced(op);
        }
        check_written(out);

        stats.ops += ops.size();
        stats.old_bytes += chunk_old.size();
        stats.new_bytes += chunk_new.size();
        ++ stats.chunks;

        offset += chunk_old.size();
    }

    return stats;
}

StreamingDiffer::Stats StreamingDiffer::generate(
    fs::path const& old_path,
    fs::path const& new_path,
    fs::path const& out_path,
    size_t chunk_size
) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be at least 1 byte");
    }

    Digest digest = digest_file(old_path);

    auto old_file = open_input(old_path);
    auto new_file = open_input(new_path);
    PendingFile out(out_path);

    auto stats = generate(old_file, new_file, out.stream, digest, chunk_size);

    out.commit();
    return stats;
}

StreamingPatcher::Stats StreamingPatcher::apply(
    std::istream& old_,
    std::istream& records,
    std::ostream& out,
    size_t copy_block,
    std::uint64_t offset
) {
    if (copy_block == 0) {
        throw std::invalid_argument("copy block must be at least 1 byte");
    }

    Stats stats;
    std::vector<char> block(copy_block);
    std::uint64_t const source_size = remaining_size(old_);
    // source bytes consumed so far
    std::uint64_t cursor = 0;

    for (auto && decoded : Codec::decode(records, offset)) {
        if (!decoded) {
            throw decoded.error();
        }
        DiffOp const& op = *decoded;
        std::uint64_t pos = position(op);

        if (pos < cursor) {
            throw std::invalid_argument(
                "record " + std::to_string(stats.ops) + " edits byte " + std::to_string(pos) +
                " after byte " + std::to_string(cursor) + " was already consumed");
        }
        if (pos > cursor) {
            copy_exact(old_, out, pos - cursor, block, cursor);
            stats.copied += pos - cursor;
            cursor = pos;
        }

        std::visit(overloaded{
            [&](Insert const& ins) {
                out.write(reinterpret_cast<char const*>(ins.payload.data()), (std::streamsize)ins.payload.size());
                stats.inserted += ins.payload.size();
            },
            [&](Delete const& del) {
                skip(old_, del.length, cursor, source_size);
                cursor += del.length;
                stats.skipped += del.length;
            },
            [&](Change const& chg) {
                skip(old_, chg.payload.size(), cursor, source_size);
                out.write(reinterpret_cast<char const*>(chg.payload.data()), (std::streamsize)chg.payload.size());
                cursor += chg.payload.size();
                stats.inserted += chg.payload.size();
                stats.skipped += chg.payload.size();
            },
        }, op);
        check_written(out);

        ++ stats.ops;
    }

    stats.copied += copy_rest(old_, out, block);
    return stats;
}

StreamingPatcher::Stats StreamingPatcher::apply(
    fs::path const& old_path,
    fs::path const& diff_path,
    fs::path const& out_path,
    size_t copy_block
) {
    auto diff_file = open_input(diff_path);
    Codec::read_header(diff_file);

    Stats stats;
    {
        auto old_file = open_input(old_path);
        PendingFile out(out_path);
        stats = apply(old_file, diff_file, out.stream, copy_block, HEADER_SIZE);
        old_file.close();
        out.commit();
    }
    return stats;
}

fs::path diff_output_path(
    fs::path const& old_path,
    fs::path const& latest_path,
    std::span<std::string const> names,
    size_t idx
) {
    if (idx < names.size()) {
        return names[idx] + ".diff";
    }
    return old_path.parent_path() / (old_path.stem().string() + "-" + latest_path.stem().string() + ".diff");
}

bool has_diff_extension(fs::path const& path)
{
    std::string ext(trim(path.extension().string()));
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return ext == ".diff";
}

size_t copy_block_or_default(size_t copy_block)
{
    return copy_block == 0 ? DEFAULT_COPY_BLOCK : copy_block;
}

} // namespace mydiff
