#ifndef QCHAIN_WALLET_H
#define QCHAIN_WALLET_H

#include "../consensus/Chain.h"
#include "../ledger/Transaction.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace qc {

/**
 * Wallet - One ML-DSA key pair and the transactions it signs
 *
 * The address is the hex-encoded public key. The key file holds
 * {"public_key", "secret_key"}, both hex.
 */
class Wallet : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_KEYGEN = 1;
  constexpr static int32_t E_NO_KEY = 2;
  constexpr static int32_t E_READ = 3;
  constexpr static int32_t E_WRITE = 4;
  constexpr static int32_t E_FORMAT = 5;
  constexpr static int32_t E_SENDER = 6;
  constexpr static int32_t E_AMOUNT = 7;
  constexpr static int32_t E_BALANCE = 8;
  constexpr static int32_t E_SIGN = 9;

  constexpr static double DEFAULT_FEE = 0.0001;

  Wallet();
  ~Wallet() override = default;

  bool hasKeys() const { return !publicKey_.empty(); }
  std::string getAddress() const;
  const std::string &getPublicKey() const { return publicKey_; }

  Roe<void> generate();

  nlohmann::json ltsToJson() const;
  Roe<void> ltsFromJson(const nlohmann::json &jd);
  Roe<void> saveToFile(const std::string &path) const;
  Roe<void> loadFromFile(const std::string &path);
  // Loads the key file, or generates keys and writes it when absent
  Roe<void> loadOrCreate(const std::string &path);

  double getBalance(const Chain &chain) const;

  // The transaction sender must be this wallet's address
  Roe<void> signTransaction(Transaction &tx) const;

  /**
   * Build and sign a transfer from this wallet.
   * The balance check is advisory: it only guards this wallet against
   * overspending, the chain itself does not enforce balances.
   */
  Roe<Transaction> createTransaction(const Chain &chain,
                                     const std::string &recipient,
                                     double amount,
                                     double fee = DEFAULT_FEE) const;

private:
  std::string publicKey_;
  std::string secretKey_;
};

} // namespace qc

#endif // QCHAIN_WALLET_H
