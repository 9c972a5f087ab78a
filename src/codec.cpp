#include <mydiff/codec.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>
#include <string>

#include <endian.h>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>

namespace mydiff {

namespace {

// upper bound on a single payload read, so a corrupt length cannot force a
// huge allocation before the short read is noticed
constexpr size_t PAYLOAD_PIECE = 1024 * 1024;

void put_u64(char * dst, std::uint64_t value)
{
    std::uint64_t net = htobe64(value);
    std::memcpy(dst, &net, sizeof(net));
}

std::uint64_t get_u64(char const* src)
{
    std::uint64_t net;
    std::memcpy(&net, src, sizeof(net));
    return be64toh(net);
}

void write_record_header(std::ostream& out, OpCode code, std::uint64_t position, std::uint64_t length)
{
    std::array<char, RECORD_HEADER_SIZE> header;
    header[0] = (char)code;
    put_u64(&header[1], position);
    put_u64(&header[9], length);
    out.write(header.data(), (std::streamsize)header.size());
}

void write_payload(std::ostream& out, Bytes const& payload)
{
    out.write(reinterpret_cast<char const*>(payload.data()), (std::streamsize)payload.size());
}

} // namespace

bool is_opcode(std::uint8_t byte)
{
    switch ((OpCode)byte) {
    case OpCode::INSERT:
    case OpCode::DELETE:
    case OpCode::CHANGE:
        return true;
    }
    return false;
}

void Codec::write_header(std::ostream& out, Digest const& digest)
{
    out.write(MAGIC.data(), (std::streamsize)MAGIC.size());
    out.write(reinterpret_cast<char const*>(digest.data()), (std::streamsize)digest.size());
}

Digest Codec::read_header(std::istream& in)
{
    std::array<char, MAGIC.size()> magic;
    in.read(magic.data(), (std::streamsize)magic.size());
    auto got = (size_t)in.gcount();
    if (got < magic.size()) {
        throw FormatError(FormatError::TRUNCATED, 0, 0,
            "file is " + std::to_string(got) + " bytes, shorter than the magic");
    }
    if (std::string_view(magic.data(), magic.size()) != MAGIC) {
        throw FormatError(FormatError::BAD_MAGIC, 0, 0,
            "expected \"" + std::string(MAGIC) + "\"");
    }

    Digest digest;
    in.read(reinterpret_cast<char*>(digest.data()), (std::streamsize)digest.size());
    got = (size_t)in.gcount();
    if (got < digest.size()) {
        throw FormatError(FormatError::TRUNCATED, MAGIC.size(), 0,
            "digest has " + std::to_string(got) + " of " + std::to_string(DIGEST_SIZE) + " bytes");
    }
    return digest;
}

void Codec::encode(DiffOp const& op, std::ostream& out)
{
    std::visit(overloaded{
        [&](Insert const& ins) {
            write_record_header(out, OpCode::INSERT, ins.position, ins.payload.size());
            write_payload(out, ins.payload);
        },
        [&](Delete const& del) {
            write_record_header(out, OpCode::DELETE, del.position, del.length);
        },
        [&](Change const& chg) {
            write_record_header(out, OpCode::CHANGE, chg.position, chg.payload.size());
            write_payload(out, chg.payload);
        },
    }, op);
}

void Codec::encode(std::span<DiffOp const> ops, std::ostream& out)
{
    for (auto const& op : ops) {
        encode(op, out);
    }
}

Bytes Codec::encode(std::span<DiffOp const> ops)
{
    Bytes bytes;
    std::uint64_t size = 0;
    for (auto const& op : ops) {
        size += RECORD_HEADER_SIZE + produced(op);
    }
    bytes.reserve(size);

    auto put_header = [&](OpCode code, std::uint64_t position, std::uint64_t length) {
        size_t at = bytes.size();
        bytes.resize(at + RECORD_HEADER_SIZE);
        bytes[at] = (std::uint8_t)code;
        put_u64(reinterpret_cast<char*>(&bytes[at + 1]), position);
        put_u64(reinterpret_cast<char*>(&bytes[at + 9]), length);
    };

    for (auto const& op : ops) {
        std::visit(overloaded{
            [&](Insert const& ins) {
                put_header(OpCode::INSERT, ins.position, ins.payload.size());
                bytes.insert(bytes.end(), ins.payload.begin(), ins.payload.end());
            },
            [&](Delete const& del) {
                put_header(OpCode::DELETE, del.position, del.length);
            },
            [&](Change const& chg) {
                put_header(OpCode::CHANGE, chg.position, chg.payload.size());
                bytes.insert(bytes.end(), chg.payload.begin(), chg.payload.end());
            },
        }, op);
    }
    return bytes;
}

std::generator<Codec::Decoded> Codec::decode(std::istream& in, std::uint64_t offset)
{
    std::array<char, RECORD_HEADER_SIZE> header;

    for (std::uint64_t index = 0; ; ++ index) {
        in.read(header.data(), (std::streamsize)header.size());
        auto got = (size_t)in.gcount();
        if (in.bad()) {
            throw std::runtime_error("read error in diff at byte " + std::to_string(offset));
        }
        if (got == 0) {
            // clean end after a complete record
            co_return;
        }
        if (got < RECORD_HEADER_SIZE) {
            co_yield Decoded(std::unexpect, FormatError::TRUNCATED, offset, index,
                "record header has " + std::to_string(got) + " of " +
                std::to_string(RECORD_HEADER_SIZE) + " bytes");
            co_return;
        }

        auto code = (std::uint8_t)header[0];
        std::uint64_t position = get_u64(&header[1]);
        std::uint64_t length = get_u64(&header[9]);

        if (!is_opcode(code)) {
            co_yield Decoded(std::unexpect, FormatError::UNKNOWN_OPCODE, offset, index,
                "opcode " + std::to_string(code));
            co_return;
        }

        std::uint64_t payload_offset = offset + RECORD_HEADER_SIZE;

        if ((OpCode)code == OpCode::DELETE) {
            offset = payload_offset;
            co_yield Decoded(Delete{position, length});
            continue;
        }

        Bytes payload;
        for (std::uint64_t remaining = length; remaining > 0; ) {
            size_t piece = (size_t)std::min<std::uint64_t>(remaining, PAYLOAD_PIECE);
            size_t at = payload.size();
            payload.resize(at + piece);
            in.read(reinterpret_cast<char*>(payload.data() + at), (std::streamsize)piece);
            got = (size_t)in.gcount();
            if (in.bad()) {
                throw std::runtime_error("read error in diff at byte " + std::to_string(payload_offset + at));
            }
            if (got < piece) {
                co_yield Decoded(std::unexpect, FormatError::TRUNCATED, payload_offset, index,
                    "payload has " + std::to_string(at + got) + " of " + std::to_string(length) + " bytes");
                co_return;
            }
            remaining -= piece;
        }

        offset = payload_offset + length;
        if ((OpCode)code == OpCode::INSERT) {
            co_yield Decoded(Insert{position, std::move(payload)});
        } else {
            co_yield Decoded(Change{position, std::move(payload)});
        }
    }
}

std::vector<DiffOp> Codec::decode(ByteView records)
{
    boost::iostreams::stream<boost::iostreams::array_source> in(
        reinterpret_cast<char const*>(records.data()), records.size());

    std::vector<DiffOp> ops;
    for (auto && decoded : decode(in, 0)) {
        if (!decoded) {
            throw decoded.error();
        }
        ops.emplace_back(std::move(*decoded));
    }
    return ops;
}

} // namespace mydiff
