#ifndef QCHAIN_BLOCK_H
#define QCHAIN_BLOCK_H

#include "../lib/Crypto.h"
#include "../lib/ResultOrError.hpp"
#include "Transaction.h"

#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace qc {

/**
 * Block of the ledger. The first transaction is the coinbase.
 *
 * The stored hash is always calculateHash() of the header, which covers
 * the transactions through transactions_root. Proof-of-work is checked
 * separately with verifyProofOfWork().
 */
class Block {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_FORMAT = 1;
  constexpr static int32_t E_CANCELLED = 2;

  using CancelCheck = std::function<bool()>;

  Block() = default;
  Block(uint64_t index, const std::string &previousHash, double timestamp,
        const std::vector<Transaction> &transactions);

  uint64_t getIndex() const { return index_; }
  const std::string &getPreviousHash() const { return previousHash_; }
  double getTimestamp() const { return timestamp_; }
  const std::vector<Transaction> &getTransactions() const { return transactions_; }
  uint64_t getNonce() const { return nonce_; }
  const std::string &getHash() const { return hash_; }

  std::string getTransactionsRoot() const;

  // Canonical header record for the given nonce
  std::string getHeader(uint64_t nonce) const;

  std::string calculateHash() const;

  /**
   * Outer stage of the proof-of-work for one nonce:
   * sha3(powHash(getHeader(0) + decimal(nonce)))
   */
  std::string getProofOfWorkDigest(uint64_t nonce,
                                   const utl::PowParams &params) const;

  /**
   * Search nonces from 0 until the digest meets the difficulty.
   * On success stores the nonce and the recomputed hash.
   * @param isCancelled polled between attempts; E_CANCELLED when it fires
   * @return number of attempts
   */
  Roe<uint64_t> mine(uint32_t difficulty, const utl::PowParams &params,
                     const CancelCheck &isCancelled = nullptr);

  bool verifyProofOfWork(uint32_t difficulty,
                         const utl::PowParams &params) const;

  // True when hash starts with at least difficulty '0' characters
  static bool meetsDifficulty(const std::string &hash, uint32_t difficulty);

  nlohmann::json ltsToJson() const;
  Roe<void> ltsFromJson(const nlohmann::json &jd);

  void setNonce(uint64_t nonce) { nonce_ = nonce; }
  void setHash(const std::string &hash) { hash_ = hash; }

private:
  nlohmann::json transactionsToJson() const;

  uint64_t index_{0};
  std::string previousHash_;
  double timestamp_{0};
  std::vector<Transaction> transactions_;
  uint64_t nonce_{0};
  std::string hash_;
};

} // namespace qc

#endif // QCHAIN_BLOCK_H
