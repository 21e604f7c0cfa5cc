#include "common/file_hash.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>

namespace {

const EVP_MD* digestFor(const std::string& algorithm) {
    const std::string name = utils::toLower(algorithm);
    if (name == "md5") return EVP_md5();
    if (name == "sha1") return EVP_sha1();
    if (name == "sha256") return EVP_sha256();
    return nullptr;
}

} // namespace

bool isSupportedDigest(const std::string& algorithm) {
    return digestFor(algorithm) != nullptr;
}

std::optional<std::string> calculateFileDigest(const std::string& filePath, const std::string& algorithm) {
    const EVP_MD* md = digestFor(algorithm);
    if (!md) {
        Logger::warning("Unsupported digest algorithm: " + algorithm);
        return std::nullopt;
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        Logger::error("Failed to open " + filePath + " for hashing");
        return std::nullopt;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        Logger::error("Failed to create OpenSSL context");
        return std::nullopt;
    }

    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        Logger::error("Failed to initialize digest");
        return std::nullopt;
    }

    char buffer[64 * 1024];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0 && EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
            EVP_MD_CTX_free(ctx);
            Logger::error("Failed to update digest for " + filePath);
            return std::nullopt;
        }
    }
    if (file.bad()) {
        EVP_MD_CTX_free(ctx);
        Logger::error("Read error while hashing " + filePath);
        return std::nullopt;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        Logger::error("Failed to finalize digest for " + filePath);
        return std::nullopt;
    }
    EVP_MD_CTX_free(ctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
