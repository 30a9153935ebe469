#ifndef PROMPTGUARD_UTIL_HASHING_HPP
#define PROMPTGUARD_UTIL_HASHING_HPP

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 fingerprints and random identifiers backed by OpenSSL libcrypto.
 *
 * The gateway never stores user text in its audit trail; it stores the
 * SHA-256 fingerprint produced here. Vault sessions get a random identifier
 * from randomHex().
 *
 * USAGE:
 *   @code
 *   using namespace promptguard::util::hashing;
 *   std::string fp = sha256("What is the capital of France?");
 *   std::string sessionId = randomHex(8);   // 16 hex characters
 *   @endcode
 */

namespace promptguard {
namespace util {
namespace hashing {

inline std::string toHex(const unsigned char *data, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

/**
 * @brief SHA-256 of @p input as 64 lowercase hex characters.
 * @throw std::runtime_error if the EVP digest fails.
 */
inline std::string sha256(const std::string &input)
{
    EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256: Failed to create EVP_MD_CTX.");
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hashLen = 0;
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1
        || EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: EVP digest failed.");
    }
    EVP_MD_CTX_free(mdctx);
    return toHex(hash, hashLen);
}

/**
 * @brief @p byteCount cryptographically random bytes, hex encoded.
 * @throw std::runtime_error if the OpenSSL RNG is not seeded.
 */
inline std::string randomHex(size_t byteCount)
{
    std::vector<unsigned char> buf(byteCount);
    if (byteCount > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("hashing::randomHex: RAND_bytes failed.");
    }
    return toHex(buf.data(), buf.size());
}

} // namespace hashing
} // namespace util
} // namespace promptguard

#endif // PROMPTGUARD_UTIL_HASHING_HPP
