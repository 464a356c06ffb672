#include "Crypto.h"

#include <oqs/oqs.h>
#include <openssl/evp.h>
#include <sodium.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace qc {
namespace utl {

namespace {

// Initialize libsodium (safe to call multiple times)
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;

constexpr const char *SIG_ALGORITHM = OQS_SIG_alg_ml_dsa_65;

// 16 bytes, crypto_pwhash_SALTBYTES
constexpr const char POW_SALT[] = "qchain-pow-salt!";
constexpr size_t POW_HASH_BYTES = 32;

class SigContext {
public:
  SigContext() : handle_(OQS_SIG_new(SIG_ALGORITHM)) {
    if (handle_ == nullptr) {
      throw std::runtime_error("Failed to initialize OQS signature context");
    }
  }
  ~SigContext() { OQS_SIG_free(handle_); }

  SigContext(const SigContext &) = delete;
  SigContext &operator=(const SigContext &) = delete;

  const OQS_SIG *get() const { return handle_; }

private:
  OQS_SIG *handle_{nullptr};
};

const OQS_SIG *getSignatureContext() {
  static SigContext ctx;
  return ctx.get();
}

const unsigned char *bytes(const std::string &s) {
  return reinterpret_cast<const unsigned char *>(s.data());
}

} // namespace

std::string sha3_256(const std::string &input) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(
      EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;

  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha3_256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  if (EVP_DigestUpdate(mdctx.get(), input.data(), input.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hashLen) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hashLen; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

Roe<MldsaKeyPair> mldsaGenerate() {
  const OQS_SIG *sig = getSignatureContext();
  MldsaKeyPair pair;
  pair.publicKey.resize(sig->length_public_key);
  pair.secretKey.resize(sig->length_secret_key);

  if (OQS_SIG_keypair(sig,
                      reinterpret_cast<uint8_t *>(pair.publicKey.data()),
                      reinterpret_cast<uint8_t *>(pair.secretKey.data())) !=
      OQS_SUCCESS) {
    return Error(1, "OQS_SIG_keypair failed");
  }
  return pair;
}

Roe<std::string> mldsaSign(const std::string &secretKey,
                           const std::string &message) {
  const OQS_SIG *sig = getSignatureContext();
  if (secretKey.size() != sig->length_secret_key) {
    return Error(1, "mldsaSign: secret key must be " +
                        std::to_string(sig->length_secret_key) + " bytes");
  }

  std::string signature(sig->length_signature, '\0');
  size_t sigLen = 0;
  if (OQS_SIG_sign(sig, reinterpret_cast<uint8_t *>(signature.data()), &sigLen,
                   bytes(message), message.size(),
                   bytes(secretKey)) != OQS_SUCCESS) {
    return Error(2, "OQS_SIG_sign failed");
  }
  signature.resize(sigLen);
  return signature;
}

bool mldsaVerify(const std::string &publicKey, const std::string &message,
                 const std::string &signature) {
  const OQS_SIG *sig = getSignatureContext();
  if (publicKey.size() != sig->length_public_key || signature.empty() ||
      signature.size() > sig->length_signature) {
    return false;
  }
  return OQS_SIG_verify(sig, bytes(message), message.size(), bytes(signature),
                        signature.size(), bytes(publicKey)) == OQS_SUCCESS;
}

bool isValidMldsaPublicKey(const std::string &publicKey) {
  return publicKey.size() == getSignatureContext()->length_public_key;
}

std::string powHash(const std::string &data, const PowParams &params) {
  static_assert(sizeof(POW_SALT) - 1 == crypto_pwhash_SALTBYTES,
                "proof-of-work salt must match crypto_pwhash_SALTBYTES");

  unsigned char out[POW_HASH_BYTES];
  if (crypto_pwhash(out, sizeof(out), data.data(), data.size(),
                    reinterpret_cast<const unsigned char *>(POW_SALT),
                    params.opsLimit, static_cast<size_t>(params.memLimitBytes),
                    crypto_pwhash_ALG_ARGON2ID13) != 0) {
    throw std::runtime_error("crypto_pwhash failed (out of memory?)");
  }

  constexpr int variant = sodium_base64_VARIANT_ORIGINAL_NO_PADDING;
  std::vector<char> b64(sodium_base64_ENCODED_LEN(sizeof(out), variant));
  sodium_bin2base64(b64.data(), b64.size(), out, sizeof(out), variant);
  return std::string(b64.data());
}

} // namespace utl
} // namespace qc
