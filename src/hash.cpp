#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>

namespace {

// Custom deleter for EVP_MD_CTX
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

const EVP_MD* digest_for(const std::string& algorithm) {
    std::string name = to_lower(algorithm);
    if (name == "md5") return EVP_md5();
    if (name == "sha1") return EVP_sha1();
    if (name == "sha256") return EVP_sha256();
    if (name == "sha512") return EVP_sha512();
    throw ZfetchException(string_format("error.unknown_digest", algorithm));
}

} // namespace

std::string calculate_digest(const fs::path& file_path, const std::string& algorithm) {
    const EVP_MD* md = digest_for(algorithm);

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw ZfetchException(string_format("error.open_file_failed", file_path.string()));
    }

    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw ZfetchException(get_string("error.openssl_ctx_failed"));
    }

    if (EVP_DigestInit_ex(md_ctx.get(), md, nullptr) != 1) {
        throw ZfetchException(get_string("error.openssl_init_failed"));
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(md_ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            throw ZfetchException(get_string("error.openssl_update_failed"));
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(md_ctx.get(), hash, &hash_len) != 1) {
        throw ZfetchException(get_string("error.openssl_final_failed"));
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }

    return ss.str();
}

bool verify_checksum(const fs::path& file_path, const std::string& checksum) {
    size_t pos = checksum.find(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 == checksum.size()) {
        throw ZfetchException(string_format("error.bad_checksum_format", checksum));
    }
    std::string algorithm = checksum.substr(0, pos);
    std::string expected = to_lower(checksum.substr(pos + 1));
    return calculate_digest(file_path, algorithm) == expected;
}
