#include "hib/fingerprint.hpp"
#include "hib/constants.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace hib {

namespace {

std::string to_hex(const unsigned char* hash, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

Fingerprint fingerprint_bytes(std::span<const uint8_t> data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);

    Fingerprint fp;
    fp.digest = to_hex(hash, SHA256_DIGEST_LENGTH);
    fp.size = data.size();
    return fp;
}

std::optional<Fingerprint> fingerprint_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return std::nullopt;

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }

    std::vector<char> buf(constants::FINGERPRINT_READ_CHUNK);
    uint64_t total = 0;
    while (ifs) {
        ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = ifs.gcount();
        if (n <= 0) break;
        if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
            return std::nullopt;
        }
        total += static_cast<uint64_t>(n);
    }
    if (ifs.bad()) return std::nullopt;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return std::nullopt;
    }

    Fingerprint fp;
    fp.digest = to_hex(hash, hash_len);
    fp.size = total;
    return fp;
}

std::string sha256_hex(std::string_view data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

}  // namespace hib
