#pragma once

#include <mydiff/digest.hpp>
#include <mydiff/error.hpp>

#include <cstdint>
#include <filesystem>
#include <istream>

namespace mydiff {

class IntegrityGuard
{
public:
    struct StructureReport
    {
        Digest digest;
        std::uint64_t op_count = 0;
        std::uint64_t size = 0;
    };

    /*
     * Walk a diff file record by record without reading payloads.
     * Throws FormatError at the first offset that is not well-formed.
     */
    static StructureReport validate_structure(std::filesystem::path const& diff_path);
    static StructureReport validate_structure(std::istream& diff);

    /*
     * Throws ProvenanceError unless source_path hashes to expected.
     */
    static void verify_provenance(std::filesystem::path const& source_path, Digest const& expected);

    // Both checks, structure first.
    static StructureReport verify(
        std::filesystem::path const& source_path,
        std::filesystem::path const& diff_path
    );
};

} // namespace mydiff
