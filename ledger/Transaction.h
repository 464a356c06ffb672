#ifndef QCHAIN_TRANSACTION_H
#define QCHAIN_TRANSACTION_H

#include "../lib/ResultOrError.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace qc {

/**
 * Transfer of value between two addresses.
 *
 * Addresses are hex-encoded ML-DSA public keys. The coinbase sentinel
 * (64 '0' characters) as sender marks a block reward. The txid is fixed at
 * construction and never recomputed, so a record received from the network
 * keeps the identifier it was sent with.
 */
class Transaction {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_FORMAT = 1;
  constexpr static int32_t E_SIGN = 2;

  static const std::string COINBASE_SENDER;

  Transaction() = default;
  Transaction(const std::string &sender, const std::string &recipient,
              double amount, double fee, double timestamp);

  static Transaction createCoinbase(const std::string &recipient,
                                    double amount, double timestamp);

  const std::string &getTxid() const { return txid_; }
  const std::string &getSender() const { return sender_; }
  const std::string &getRecipient() const { return recipient_; }
  double getAmount() const { return amount_; }
  double getFee() const { return fee_; }
  double getTimestamp() const { return timestamp_; }
  const std::optional<std::string> &getSignature() const { return signature_; }

  bool isCoinbase() const { return sender_ == COINBASE_SENDER; }
  bool isSigned() const { return signature_.has_value(); }

  // Hash of the canonical record of (amount, fee, recipient, sender, timestamp)
  std::string computeId() const;

  /**
   * Sign with the sender's secret key (raw bytes). No-op when a signature
   * is already attached.
   */
  Roe<void> sign(const std::string &secretKey);

  // False when unsigned or when the signature does not match the sender key
  bool verify() const;

  nlohmann::json ltsToJson() const;
  Roe<void> ltsFromJson(const nlohmann::json &jd);

  bool operator==(const Transaction &other) const;

private:
  std::string signingPayload() const;

  std::string txid_;
  std::string sender_;
  std::string recipient_;
  double amount_{0};
  double fee_{0};
  double timestamp_{0};
  std::optional<std::string> signature_;
};

} // namespace qc

#endif // QCHAIN_TRANSACTION_H
