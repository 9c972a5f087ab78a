#include <mydiff/digest.hpp>

#include <cerrno>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <openssl/evp.h>

namespace mydiff {

namespace {

constexpr size_t BLOCK_SIZE = 64 * 1024;

class Sha256
{
public:
    Sha256()
    : ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free)
    {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("failed to initialize SHA-256");
        }
    }

    void update(void const* data, size_t size)
    {
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw std::runtime_error("failed to update SHA-256");
        }
    }

    Digest finish()
    {
        Digest digest;
        unsigned int size = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &size) != 1 || size != DIGEST_SIZE) {
            throw std::runtime_error("failed to finalize SHA-256");
        }
        return digest;
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

} // namespace

Digest digest_stream(std::istream& in)
{
    Sha256 sha;
    std::vector<char> block(BLOCK_SIZE);
    while (in) {
        in.read(block.data(), (std::streamsize)block.size());
        if (in.gcount() > 0) {
            sha.update(block.data(), (size_t)in.gcount());
        }
    }
    if (in.bad()) {
        throw std::runtime_error("read error while hashing");
    }
    return sha.finish();
}

Digest digest_file(std::filesystem::path const& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::filesystem::filesystem_error(
            "cannot open for hashing", path, std::error_code(errno, std::generic_category()));
    }
    return digest_stream(file);
}

Digest digest_bytes(ByteView bytes)
{
    Sha256 sha;
    sha.update(bytes.data(), bytes.size());
    return sha.finish();
}

std::string to_hex(Digest const& digest)
{
    return to_hex(ByteView(digest));
}

} // namespace mydiff
