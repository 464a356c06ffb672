#ifndef QCHAIN_CHAIN_H
#define QCHAIN_CHAIN_H

#include "../ledger/Block.h"
#include "../ledger/Transaction.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "Params.h"

#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace qc {

/**
 * Chain - The ledger aggregate shared by the miner and the network node
 *
 * Owns the block list, the pending transaction pool and the current
 * difficulty. Every public method takes the one internal lock, so callers
 * on different threads never see a half-applied block. Proof-of-work search
 * runs without the lock; the result is appended only if the tip did not
 * move in the meantime.
 */
class Chain : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Block errors (10-29)
  constexpr static int32_t E_BLOCK_NOT_FOUND = 10;
  constexpr static int32_t E_BLOCK_INDEX = 13; // index != chain length
  constexpr static int32_t E_BLOCK_CHAIN = 14; // previous hash != tip hash
  constexpr static int32_t E_STALE_TIP = 17;   // tip moved while mining

  // Mining errors (20-29)
  constexpr static int32_t E_MINING_CANCELLED = 20;
  constexpr static int32_t E_MINING = 21;

  // Transaction errors (60-79)
  constexpr static int32_t E_TX_SIGNATURE = 61;
  constexpr static int32_t E_TX_AMOUNT = 62;
  constexpr static int32_t E_TX_DUPLICATE = 66;

  // Persistence errors (80-99)
  constexpr static int32_t E_LEDGER_WRITE = 80;
  constexpr static int32_t E_LEDGER_READ = 81;
  constexpr static int32_t E_INTERNAL_DESERIALIZE = 90;

  struct MinedBlock {
    Block block;
    uint64_t attempts{0};
    double seconds{0};
  };

  explicit Chain(const consensus::ChainConfig &config = {});
  ~Chain() override = default;

  static Block createGenesisBlock(const consensus::ChainConfig &config);

  // ----------------- accessors -------------------------------------
  const consensus::ChainConfig &getConfig() const { return config_; }
  size_t getLength() const;
  uint64_t getHeight() const;
  uint32_t getDifficulty() const;
  Block getLatestBlock() const;
  Roe<Block> getBlock(uint64_t index) const;
  // Inclusive range; end is clamped to the tip, empty when start > end
  std::vector<Block> getBlocks(uint64_t start, uint64_t end) const;
  std::vector<Transaction> getPendingTransactions() const;
  size_t getPendingCount() const;
  bool hasTransaction(const std::string &txid) const;
  double getBalance(const std::string &address) const;
  bool isValid() const;

  // ----------------- methods -------------------------------------
  Roe<void> addTransaction(const Transaction &tx);
  Block assembleBlock(const std::string &minerAddress) const;
  Roe<MinedBlock>
  minePendingTransactions(const std::string &minerAddress,
                          const Block::CancelCheck &isCancelled = nullptr);
  Roe<void> appendBlock(const Block &block);

  nlohmann::json ltsToJson() const;
  Roe<void> ltsFromJson(const nlohmann::json &jd);
  Roe<void> saveToFile(const std::string &path) const;
  Roe<void> loadFromFile(const std::string &path);

private:
  Block assembleBlockLocked(const std::string &minerAddress) const;
  Roe<void> appendBlockLocked(const Block &block);
  void adjustDifficultyLocked();
  nlohmann::json ltsToJsonLocked() const;

  consensus::ChainConfig config_;
  mutable std::mutex mutex_;
  std::vector<Block> blocks_;
  std::vector<Transaction> pending_;
  std::unordered_set<std::string> chainTxids_;
  std::unordered_set<std::string> pendingTxids_;
  uint32_t difficulty_{consensus::DEFAULT_DIFFICULTY};
};

} // namespace qc

#endif // QCHAIN_CHAIN_H
