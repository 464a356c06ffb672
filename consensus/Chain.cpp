#include "Chain.h"
#include "../lib/Utilities.h"

#include <algorithm>
#include <chrono>

namespace qc {

Chain::Chain(const consensus::ChainConfig &config)
    : Module("qchain.chain"), config_(config),
      difficulty_(config.initialDifficulty) {
  blocks_.push_back(createGenesisBlock(config_));
  for (const auto &tx : blocks_.front().getTransactions()) {
    chainTxids_.insert(tx.getTxid());
  }
}

Block Chain::createGenesisBlock(const consensus::ChainConfig &config) {
  auto coinbase = Transaction::createCoinbase(consensus::GENESIS_ADDRESS,
                                              config.getBlockReward(0),
                                              consensus::GENESIS_TIMESTAMP);
  return Block(0, std::string(64, '0'), consensus::GENESIS_TIMESTAMP,
               {coinbase});
}

size_t Chain::getLength() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}

uint64_t Chain::getHeight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size() - 1;
}

uint32_t Chain::getDifficulty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return difficulty_;
}

Block Chain::getLatestBlock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.back();
}

Chain::Roe<Block> Chain::getBlock(uint64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= blocks_.size()) {
    return Error(E_BLOCK_NOT_FOUND,
                 "Block " + std::to_string(index) + " not found");
  }
  return blocks_[index];
}

std::vector<Block> Chain::getBlocks(uint64_t start, uint64_t end) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Block> result;
  uint64_t tip = blocks_.size() - 1;
  end = std::min(end, tip);
  if (start > end) {
    return result;
  }
  result.assign(blocks_.begin() + start, blocks_.begin() + end + 1);
  return result;
}

std::vector<Transaction> Chain::getPendingTransactions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

size_t Chain::getPendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

bool Chain::hasTransaction(const std::string &txid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chainTxids_.count(txid) > 0 || pendingTxids_.count(txid) > 0;
}

double Chain::getBalance(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  double balance = 0;
  for (const auto &block : blocks_) {
    for (const auto &tx : block.getTransactions()) {
      if (tx.getRecipient() == address) {
        balance += tx.getAmount();
      }
      if (tx.getSender() == address) {
        balance -= tx.getAmount() + tx.getFee();
      }
    }
  }
  return balance;
}

bool Chain::isValid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 1; i < blocks_.size(); ++i) {
    const Block &block = blocks_[i];
    const Block &previous = blocks_[i - 1];

    if (block.getHash() != block.calculateHash()) {
      log().warning << "Block " << i << " hash mismatch";
      return false;
    }
    if (block.getPreviousHash() != previous.getHash()) {
      log().warning << "Block " << i << " is not linked to its predecessor";
      return false;
    }
    const auto &txs = block.getTransactions();
    for (size_t j = 1; j < txs.size(); ++j) {
      if (!txs[j].verify()) {
        log().warning << "Block " << i << " carries transaction "
                      << txs[j].getTxid() << " with an invalid signature";
        return false;
      }
    }
  }
  return true;
}

Chain::Roe<void> Chain::addTransaction(const Transaction &tx) {
  if (tx.getAmount() < 0 || tx.getFee() < 0) {
    return Error(E_TX_AMOUNT, "Transaction " + tx.getTxid() +
                                  " has a negative amount or fee");
  }
  if (!tx.verify()) {
    return Error(E_TX_SIGNATURE,
                 "Transaction " + tx.getTxid() + " has an invalid signature");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (pendingTxids_.count(tx.getTxid()) > 0 ||
      chainTxids_.count(tx.getTxid()) > 0) {
    return Error(E_TX_DUPLICATE,
                 "Transaction " + tx.getTxid() + " is already known");
  }
  pending_.push_back(tx);
  pendingTxids_.insert(tx.getTxid());
  log().debug << "Transaction " << tx.getTxid() << " added to the pool ("
              << pending_.size() << " pending)";
  return {};
}

Block Chain::assembleBlock(const std::string &minerAddress) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return assembleBlockLocked(minerAddress);
}

Block Chain::assembleBlockLocked(const std::string &minerAddress) const {
  uint64_t height = blocks_.size();
  double now = utl::getTimestamp();

  std::vector<Transaction> ordered = pending_;
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const Transaction &a, const Transaction &b) {
                     return a.getFee() > b.getFee();
                   });

  std::vector<Transaction> txs;
  txs.reserve(std::min(ordered.size(), config_.maxTransactionsPerBlock) + 1);
  txs.push_back(Transaction::createCoinbase(
      minerAddress, config_.getBlockReward(height), now));
  for (size_t i = 0; i < ordered.size() && i < config_.maxTransactionsPerBlock;
       ++i) {
    txs.push_back(ordered[i]);
  }

  return Block(height, blocks_.back().getHash(), now, txs);
}

Chain::Roe<Chain::MinedBlock>
Chain::minePendingTransactions(const std::string &minerAddress,
                               const Block::CancelCheck &isCancelled) {
  Block candidate;
  uint32_t difficulty = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    candidate = assembleBlockLocked(minerAddress);
    difficulty = difficulty_;
  }

  log().debug << "Mining block " << candidate.getIndex() << " with "
              << candidate.getTransactions().size()
              << " transactions at difficulty " << difficulty;

  auto started = std::chrono::steady_clock::now();
  Block::Roe<uint64_t> mined = Block::Error(E_MINING, "not started");
  try {
    mined = candidate.mine(difficulty, config_.pow, isCancelled);
  } catch (const std::exception &e) {
    return Error(E_MINING, std::string("Proof-of-work failed: ") + e.what());
  }
  if (!mined) {
    return Error(E_MINING_CANCELLED, mined.error().message);
  }

  MinedBlock result;
  result.attempts = mined.value();
  result.seconds = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - started)
                       .count();

  std::lock_guard<std::mutex> lock(mutex_);
  auto appended = appendBlockLocked(candidate);
  if (!appended) {
    if (appended.error().code == E_BLOCK_INDEX ||
        appended.error().code == E_BLOCK_CHAIN) {
      log().warning << "Discarding mined block " << candidate.getIndex()
                    << ", the tip moved while mining";
      return Error(E_STALE_TIP, appended.error().message);
    }
    return appended.error();
  }
  result.block = candidate;
  return result;
}

Chain::Roe<void> Chain::appendBlock(const Block &block) {
  std::lock_guard<std::mutex> lock(mutex_);
  return appendBlockLocked(block);
}

Chain::Roe<void> Chain::appendBlockLocked(const Block &block) {
  if (block.getIndex() != blocks_.size()) {
    return Error(E_BLOCK_INDEX, "Block index " +
                                    std::to_string(block.getIndex()) +
                                    " does not match chain length " +
                                    std::to_string(blocks_.size()));
  }
  if (block.getPreviousHash() != blocks_.back().getHash()) {
    return Error(E_BLOCK_CHAIN, "Block " + std::to_string(block.getIndex()) +
                                    " does not extend the current tip");
  }

  blocks_.push_back(block);

  std::unordered_set<std::string> included;
  for (const auto &tx : block.getTransactions()) {
    included.insert(tx.getTxid());
    chainTxids_.insert(tx.getTxid());
  }
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [&included](const Transaction &tx) {
                                  return included.count(tx.getTxid()) > 0;
                                }),
                 pending_.end());
  for (const auto &txid : included) {
    pendingTxids_.erase(txid);
  }

  if (block.getIndex() % config_.adjustmentInterval == 0) {
    adjustDifficultyLocked();
  }
  return {};
}

void Chain::adjustDifficultyLocked() {
  uint64_t interval = config_.adjustmentInterval;
  if (blocks_.size() <= interval) {
    return;
  }
  const Block &latest = blocks_.back();
  const Block &first = blocks_[blocks_.size() - interval];
  double elapsed = latest.getTimestamp() - first.getTimestamp();

  uint32_t next = consensus::calculateNextDifficulty(
      difficulty_, elapsed, interval, config_.targetBlockTime);
  if (next != difficulty_) {
    log().info << "Difficulty adjusted from " << difficulty_ << " to " << next;
    difficulty_ = next;
  }
}

nlohmann::json Chain::ltsToJson() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ltsToJsonLocked();
}

nlohmann::json Chain::ltsToJsonLocked() const {
  nlohmann::json jd;
  jd["chain"] = nlohmann::json::array();
  for (const auto &block : blocks_) {
    jd["chain"].push_back(block.ltsToJson());
  }
  jd["pending_transactions"] = nlohmann::json::array();
  for (const auto &tx : pending_) {
    jd["pending_transactions"].push_back(tx.ltsToJson());
  }
  jd["difficulty"] = difficulty_;
  return jd;
}

Chain::Roe<void> Chain::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object() || !jd.contains("chain") || !jd["chain"].is_array() ||
      jd["chain"].empty()) {
    return Error(E_INTERNAL_DESERIALIZE,
                 "Snapshot must contain a non-empty 'chain' array");
  }

  std::vector<Block> blocks;
  for (const auto &blockJson : jd["chain"]) {
    Block block;
    auto result = block.ltsFromJson(blockJson);
    if (!result) {
      return Error(E_INTERNAL_DESERIALIZE, result.error().message);
    }
    if (block.getIndex() != blocks.size()) {
      return Error(E_INTERNAL_DESERIALIZE,
                   "Snapshot block at position " +
                       std::to_string(blocks.size()) + " has index " +
                       std::to_string(block.getIndex()));
    }
    blocks.push_back(std::move(block));
  }

  std::vector<Transaction> pending;
  if (jd.contains("pending_transactions")) {
    if (!jd["pending_transactions"].is_array()) {
      return Error(E_INTERNAL_DESERIALIZE,
                   "Field 'pending_transactions' must be an array");
    }
    for (const auto &txJson : jd["pending_transactions"]) {
      Transaction tx;
      auto result = tx.ltsFromJson(txJson);
      if (!result) {
        return Error(E_INTERNAL_DESERIALIZE, result.error().message);
      }
      pending.push_back(std::move(tx));
    }
  }

  uint32_t difficulty = config_.initialDifficulty;
  if (jd.contains("difficulty")) {
    if (!jd["difficulty"].is_number_unsigned() ||
        jd["difficulty"].get<uint64_t>() == 0 ||
        jd["difficulty"].get<uint64_t>() > 64) {
      return Error(E_INTERNAL_DESERIALIZE,
                   "Field 'difficulty' must be between 1 and 64");
    }
    difficulty = jd["difficulty"].get<uint32_t>();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  blocks_ = std::move(blocks);
  pending_ = std::move(pending);
  difficulty_ = difficulty;
  chainTxids_.clear();
  pendingTxids_.clear();
  for (const auto &block : blocks_) {
    for (const auto &tx : block.getTransactions()) {
      chainTxids_.insert(tx.getTxid());
    }
  }
  for (const auto &tx : pending_) {
    pendingTxids_.insert(tx.getTxid());
  }
  return {};
}

Chain::Roe<void> Chain::saveToFile(const std::string &path) const {
  std::string content;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    content = ltsToJsonLocked().dump(2);
  }
  auto result = utl::writeToFile(path, content);
  if (!result) {
    return Error(E_LEDGER_WRITE, "Failed to save chain: " +
                                     result.error().message);
  }
  return {};
}

Chain::Roe<void> Chain::loadFromFile(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    return Error(E_LEDGER_READ, jsonResult.error().message);
  }
  auto result = ltsFromJson(jsonResult.value());
  if (!result) {
    return result;
  }
  log().info << "Loaded chain with " << getLength() << " blocks from " << path;
  return {};
}

} // namespace qc
