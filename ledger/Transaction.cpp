#include "Transaction.h"
#include "../lib/Crypto.h"
#include "../lib/Utilities.h"

namespace qc {

const std::string Transaction::COINBASE_SENDER(64, '0');

Transaction::Transaction(const std::string &sender,
                         const std::string &recipient, double amount,
                         double fee, double timestamp)
    : sender_(sender), recipient_(recipient), amount_(amount), fee_(fee),
      timestamp_(timestamp) {
  txid_ = computeId();
}

Transaction Transaction::createCoinbase(const std::string &recipient,
                                        double amount, double timestamp) {
  return Transaction(COINBASE_SENDER, recipient, amount, 0.0, timestamp);
}

std::string Transaction::computeId() const {
  nlohmann::json record = {{"sender", sender_},
                           {"recipient", recipient_},
                           {"amount", amount_},
                           {"fee", fee_},
                           {"timestamp", timestamp_}};
  return utl::sha3_256(utl::canonicalJson(record));
}

std::string Transaction::signingPayload() const {
  nlohmann::json record = {{"txid", txid_},
                           {"sender", sender_},
                           {"recipient", recipient_},
                           {"amount", amount_},
                           {"fee", fee_},
                           {"timestamp", timestamp_}};
  return utl::canonicalJson(record);
}

Transaction::Roe<void> Transaction::sign(const std::string &secretKey) {
  if (signature_) {
    return {};
  }
  auto result = utl::mldsaSign(secretKey, signingPayload());
  if (!result) {
    return Error(E_SIGN, "Failed to sign transaction: " + result.error().message);
  }
  signature_ = utl::hexEncode(result.value());
  return {};
}

bool Transaction::verify() const {
  if (!signature_) {
    return false;
  }
  std::string publicKey = utl::hexDecode(sender_);
  std::string signature = utl::hexDecode(*signature_);
  if (publicKey.empty() || signature.empty()) {
    return false;
  }
  return utl::mldsaVerify(publicKey, signingPayload(), signature);
}

nlohmann::json Transaction::ltsToJson() const {
  nlohmann::json jd;
  jd["txid"] = txid_;
  jd["sender"] = sender_;
  jd["recipient"] = recipient_;
  jd["amount"] = amount_;
  jd["fee"] = fee_;
  jd["timestamp"] = timestamp_;
  if (signature_) {
    jd["signature"] = *signature_;
  } else {
    jd["signature"] = nullptr;
  }
  return jd;
}

Transaction::Roe<void> Transaction::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_FORMAT, "Transaction must be a JSON object");
  }

  for (const char *field : {"sender", "recipient"}) {
    if (!jd.contains(field) || !jd[field].is_string()) {
      return Error(E_FORMAT, std::string("Field '") + field +
                                 "' must be a string");
    }
  }
  for (const char *field : {"amount", "fee", "timestamp"}) {
    if (!jd.contains(field) || !jd[field].is_number()) {
      return Error(E_FORMAT, std::string("Field '") + field +
                                 "' must be a number");
    }
  }

  sender_ = jd["sender"].get<std::string>();
  recipient_ = jd["recipient"].get<std::string>();
  amount_ = jd["amount"].get<double>();
  fee_ = jd["fee"].get<double>();
  timestamp_ = jd["timestamp"].get<double>();
  if (amount_ < 0 || fee_ < 0) {
    return Error(E_FORMAT, "Fields 'amount' and 'fee' must not be negative");
  }

  if (jd.contains("txid")) {
    if (!jd["txid"].is_string()) {
      return Error(E_FORMAT, "Field 'txid' must be a string");
    }
    txid_ = jd["txid"].get<std::string>();
  } else {
    txid_ = computeId();
  }

  signature_.reset();
  if (jd.contains("signature") && !jd["signature"].is_null()) {
    if (!jd["signature"].is_string()) {
      return Error(E_FORMAT, "Field 'signature' must be a string or null");
    }
    signature_ = jd["signature"].get<std::string>();
  }
  return {};
}

bool Transaction::operator==(const Transaction &other) const {
  return txid_ == other.txid_ && sender_ == other.sender_ &&
         recipient_ == other.recipient_ && amount_ == other.amount_ &&
         fee_ == other.fee_ && timestamp_ == other.timestamp_ &&
         signature_ == other.signature_;
}

} // namespace qc
