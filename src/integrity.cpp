#include <mydiff/integrity.hpp>
#include <mydiff/codec.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <endian.h>

namespace fs = std::filesystem;

namespace mydiff {

IntegrityGuard::StructureReport IntegrityGuard::validate_structure(std::istream& diff)
{
    StructureReport report;

    diff.seekg(0, std::ios::end);
    auto end = diff.tellg();
    if (end < 0) {
        throw std::runtime_error("diff is not seekable");
    }
    report.size = (std::uint64_t)end;
    diff.seekg(0, std::ios::beg);

    report.digest = Codec::read_header(diff);

    std::array<char, RECORD_HEADER_SIZE> header;
    std::uint64_t offset = HEADER_SIZE;

    while (offset < report.size) {
        std::uint64_t remaining = report.size - offset;
        if (remaining < RECORD_HEADER_SIZE) {
            throw FormatError(FormatError::TRUNCATED, offset, report.op_count,
                "record header has " + std::to_string(remaining) + " of " +
                std::to_string(RECORD_HEADER_SIZE) + " bytes");
        }

        diff.read(header.data(), (std::streamsize)header.size());
        if ((size_t)diff.gcount() != header.size()) {
            throw std::runtime_error("read error in diff at byte " + std::to_string(offset));
        }

        auto code = (std::uint8_t)header[0];
        if (!is_opcode(code)) {
            throw FormatError(FormatError::UNKNOWN_OPCODE, offset, report.op_count,
                "opcode " + std::to_string(code));
        }

        offset += RECORD_HEADER_SIZE;
        remaining -= RECORD_HEADER_SIZE;

        if ((OpCode)code != OpCode::DELETE) {
            std::uint64_t length;
            std::memcpy(&length, &header[9], sizeof(length));
            length = be64toh(length);

            if (length > remaining) {
                throw FormatError(FormatError::TRUNCATED, offset, report.op_count,
                    "payload has " + std::to_string(remaining) + " of " + std::to_string(length) + " bytes");
            }
            offset += length;
            diff.seekg((std::streamoff)offset, std::ios::beg);
        }

        ++ report.op_count;
    }

    return report;
}

IntegrityGuard::StructureReport IntegrityGuard::validate_structure(fs::path const& diff_path)
{
    std::ifstream diff(diff_path, std::ios::binary);
    if (!diff) {
        throw fs::filesystem_error("cannot open diff", diff_path,
            std::error_code(errno, std::generic_category()));
    }
    return validate_structure(diff);
}

void IntegrityGuard::verify_provenance(fs::path const& source_path, Digest const& expected)
{
    Digest actual = digest_file(source_path);
    if (actual != expected) {
        throw ProvenanceError(expected, actual);
    }
}

IntegrityGuard::StructureReport IntegrityGuard::verify(fs::path const& source_path, fs::path const& diff_path)
{
    auto report = validate_structure(diff_path);
    verify_provenance(source_path, report.digest);
    return report;
}

} // namespace mydiff
