#ifndef QCHAIN_CONSENSUS_PARAMS_H
#define QCHAIN_CONSENSUS_PARAMS_H

#include "../lib/Crypto.h"
#include "../lib/ResultOrError.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace qc {
namespace consensus {

constexpr uint32_t DEFAULT_DIFFICULTY = 3;
constexpr double DEFAULT_BLOCK_REWARD = 50.0;
constexpr uint64_t DEFAULT_HALVING_INTERVAL = 210000;
constexpr double DEFAULT_MAX_SUPPLY = 21000000.0;
constexpr uint64_t DEFAULT_ADJUSTMENT_INTERVAL = 2016;
constexpr uint64_t DEFAULT_TARGET_BLOCK_TIME = 600; // seconds
constexpr size_t DEFAULT_MAX_TRANSACTIONS_PER_BLOCK = 999;

// 2025-01-01T00:00:00Z, shared by every node so genesis hashes agree
constexpr double GENESIS_TIMESTAMP = 1735689600.0;
constexpr const char *GENESIS_ADDRESS = "QChain Genesis Address";

struct ChainConfig {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;

  uint32_t initialDifficulty{DEFAULT_DIFFICULTY};
  double blockReward{DEFAULT_BLOCK_REWARD};
  uint64_t halvingInterval{DEFAULT_HALVING_INTERVAL};
  double maxSupply{DEFAULT_MAX_SUPPLY}; // informational, not enforced
  uint64_t adjustmentInterval{DEFAULT_ADJUSTMENT_INTERVAL};
  uint64_t targetBlockTime{DEFAULT_TARGET_BLOCK_TIME};
  size_t maxTransactionsPerBlock{DEFAULT_MAX_TRANSACTIONS_PER_BLOCK};
  utl::PowParams pow;

  // blockReward / 2^(height / halvingInterval)
  double getBlockReward(uint64_t height) const;

  nlohmann::json ltsToJson() const;
  Roe<void> ltsFromJson(const nlohmann::json &jd);
};

/**
 * Retarget after an adjustment window.
 * expected = interval * targetBlockTime; faster than half of it raises the
 * difficulty by one, slower than double lowers it by one (never below 1).
 */
uint32_t calculateNextDifficulty(uint32_t current, double elapsedSeconds,
                                 uint64_t interval, uint64_t targetBlockTime);

} // namespace consensus
} // namespace qc

#endif // QCHAIN_CONSENSUS_PARAMS_H
