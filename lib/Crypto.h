#ifndef QCHAIN_CRYPTO_H
#define QCHAIN_CRYPTO_H

#include "Utilities.h"

#include <cstdint>
#include <string>

namespace qc {
namespace utl {

/**
 * Compute SHA3-256 using OpenSSL EVP
 * @param input Input bytes
 * @return Lowercase hex digest (64 characters)
 * @throws std::runtime_error if the digest backend fails
 */
std::string sha3_256(const std::string &input);

// --- ML-DSA-65 (raw binary keys and signatures, sizes fixed by liboqs)

struct MldsaKeyPair {
  std::string publicKey;
  std::string secretKey;
};

/**
 * Generate a new ML-DSA-65 key pair
 */
Roe<MldsaKeyPair> mldsaGenerate();

/**
 * Sign a message with an ML-DSA-65 secret key
 * @param secretKey Raw secret key
 * @param message Message to sign (arbitrary bytes)
 * @return Raw signature, or error
 */
Roe<std::string> mldsaSign(const std::string &secretKey,
                           const std::string &message);

/**
 * Verify an ML-DSA-65 signature
 * @return true if valid; false on a bad signature or malformed key/signature
 */
bool mldsaVerify(const std::string &publicKey, const std::string &message,
                 const std::string &signature);

bool isValidMldsaPublicKey(const std::string &publicKey);

// --- Memory-hard proof-of-work hash

struct PowParams {
  uint64_t opsLimit{2};
  uint64_t memLimitBytes{100ULL * 1024 * 1024};
};

/**
 * Argon2id over data with a fixed salt, rendered as unpadded base64.
 * Deterministic for a given (data, params).
 * @throws std::runtime_error if Argon2 fails (e.g. out of memory)
 */
std::string powHash(const std::string &data, const PowParams &params);

} // namespace utl
} // namespace qc

#endif // QCHAIN_CRYPTO_H
