#include "Block.h"
#include "../lib/Utilities.h"

namespace qc {

Block::Block(uint64_t index, const std::string &previousHash,
             double timestamp, const std::vector<Transaction> &transactions)
    : index_(index), previousHash_(previousHash), timestamp_(timestamp),
      transactions_(transactions) {
  hash_ = calculateHash();
}

nlohmann::json Block::transactionsToJson() const {
  nlohmann::json records = nlohmann::json::array();
  for (const auto &tx : transactions_) {
    records.push_back(tx.ltsToJson());
  }
  return records;
}

std::string Block::getTransactionsRoot() const {
  return utl::sha3_256(utl::canonicalJson(transactionsToJson()));
}

std::string Block::getHeader(uint64_t nonce) const {
  nlohmann::json header = {{"index", index_},
                           {"previous_hash", previousHash_},
                           {"timestamp", timestamp_},
                           {"transactions_root", getTransactionsRoot()},
                           {"nonce", nonce}};
  return utl::canonicalJson(header);
}

std::string Block::calculateHash() const {
  return utl::sha3_256(getHeader(nonce_));
}

std::string Block::getProofOfWorkDigest(uint64_t nonce,
                                        const utl::PowParams &params) const {
  return utl::sha3_256(utl::powHash(getHeader(0) + std::to_string(nonce), params));
}

Block::Roe<uint64_t> Block::mine(uint32_t difficulty,
                                 const utl::PowParams &params,
                                 const CancelCheck &isCancelled) {
  // The mining header is fixed for the whole search
  const std::string header = getHeader(0);

  for (uint64_t nonce = 0;; ++nonce) {
    if (isCancelled && isCancelled()) {
      return Error(E_CANCELLED, "Mining cancelled after " +
                                    std::to_string(nonce) + " attempts");
    }
    std::string digest =
        utl::sha3_256(utl::powHash(header + std::to_string(nonce), params));
    if (meetsDifficulty(digest, difficulty)) {
      nonce_ = nonce;
      hash_ = calculateHash();
      return nonce + 1;
    }
  }
}

bool Block::verifyProofOfWork(uint32_t difficulty,
                              const utl::PowParams &params) const {
  return meetsDifficulty(getProofOfWorkDigest(nonce_, params), difficulty);
}

bool Block::meetsDifficulty(const std::string &hash, uint32_t difficulty) {
  if (hash.size() < difficulty) {
    return false;
  }
  for (uint32_t i = 0; i < difficulty; ++i) {
    if (hash[i] != '0') {
      return false;
    }
  }
  return true;
}

nlohmann::json Block::ltsToJson() const {
  nlohmann::json jd;
  jd["index"] = index_;
  jd["previous_hash"] = previousHash_;
  jd["timestamp"] = timestamp_;
  jd["transactions"] = transactionsToJson();
  jd["nonce"] = nonce_;
  jd["hash"] = hash_;
  return jd;
}

Block::Roe<void> Block::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_FORMAT, "Block must be a JSON object");
  }
  if (!jd.contains("index") || !jd["index"].is_number_unsigned()) {
    return Error(E_FORMAT, "Field 'index' must be a non-negative integer");
  }
  if (!jd.contains("previous_hash") || !jd["previous_hash"].is_string()) {
    return Error(E_FORMAT, "Field 'previous_hash' must be a string");
  }
  if (!jd.contains("timestamp") || !jd["timestamp"].is_number()) {
    return Error(E_FORMAT, "Field 'timestamp' must be a number");
  }
  if (!jd.contains("transactions") || !jd["transactions"].is_array()) {
    return Error(E_FORMAT, "Field 'transactions' must be an array");
  }
  if (!jd.contains("nonce") || !jd["nonce"].is_number_unsigned()) {
    return Error(E_FORMAT, "Field 'nonce' must be a non-negative integer");
  }

  std::vector<Transaction> transactions;
  transactions.reserve(jd["transactions"].size());
  for (const auto &txJson : jd["transactions"]) {
    Transaction tx;
    auto result = tx.ltsFromJson(txJson);
    if (!result) {
      return Error(E_FORMAT, "Invalid transaction in block: " +
                                 result.error().message);
    }
    transactions.push_back(std::move(tx));
  }

  index_ = jd["index"].get<uint64_t>();
  previousHash_ = jd["previous_hash"].get<std::string>();
  timestamp_ = jd["timestamp"].get<double>();
  transactions_ = std::move(transactions);
  nonce_ = jd["nonce"].get<uint64_t>();

  if (jd.contains("hash")) {
    if (!jd["hash"].is_string()) {
      return Error(E_FORMAT, "Field 'hash' must be a string");
    }
    hash_ = jd["hash"].get<std::string>();
  } else {
    hash_ = calculateHash();
  }
  return {};
}

} // namespace qc
