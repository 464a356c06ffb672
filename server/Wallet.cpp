#include "Wallet.h"
#include "../lib/Crypto.h"
#include "../lib/Utilities.h"

#include <filesystem>
#include <sstream>

namespace qc {

Wallet::Wallet() : Module("qchain.wallet") {}

std::string Wallet::getAddress() const { return utl::hexEncode(publicKey_); }

Wallet::Roe<void> Wallet::generate() {
  auto keys = utl::mldsaGenerate();
  if (!keys) {
    return Error(E_KEYGEN, "Key generation failed: " + keys.error().message);
  }
  publicKey_ = keys.value().publicKey;
  secretKey_ = keys.value().secretKey;
  log().info << "Generated wallet " << getAddress().substr(0, 16) << "...";
  return {};
}

nlohmann::json Wallet::ltsToJson() const {
  nlohmann::json jd;
  jd["public_key"] = utl::hexEncode(publicKey_);
  jd["secret_key"] = utl::hexEncode(secretKey_);
  return jd;
}

Wallet::Roe<void> Wallet::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_FORMAT, "Key file must be a JSON object");
  }
  for (const char *key : {"public_key", "secret_key"}) {
    if (!jd.contains(key) || !jd[key].is_string() ||
        !utl::isHexString(jd[key].get<std::string>())) {
      return Error(E_FORMAT, std::string("Field '") + key +
                                 "' must be a hex string");
    }
  }
  std::string publicKey = utl::hexDecode(jd["public_key"].get<std::string>());
  std::string secretKey = utl::hexDecode(jd["secret_key"].get<std::string>());
  if (!utl::isValidMldsaPublicKey(publicKey) || secretKey.empty()) {
    return Error(E_FORMAT, "Key file does not hold an ML-DSA-65 key pair");
  }
  publicKey_ = publicKey;
  secretKey_ = secretKey;
  return {};
}

Wallet::Roe<void> Wallet::saveToFile(const std::string &path) const {
  if (!hasKeys()) {
    return Error(E_NO_KEY, "Wallet has no keys to save");
  }
  auto written = utl::writeToFile(path, ltsToJson().dump(2));
  if (!written) {
    return Error(E_WRITE, "Failed to save wallet: " + written.error().message);
  }
  std::error_code ec;
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    log().warning << "Could not restrict permissions of " << path << ": "
                  << ec.message();
  }
  return {};
}

Wallet::Roe<void> Wallet::loadFromFile(const std::string &path) {
  auto jd = utl::loadJsonFile(path);
  if (!jd) {
    return Error(E_READ, jd.error().message);
  }
  auto result = ltsFromJson(jd.value());
  if (!result) {
    return Error(result.error().code,
                 path + ": " + result.error().message);
  }
  log().info << "Loaded wallet " << getAddress().substr(0, 16) << "... from "
             << path;
  return {};
}

Wallet::Roe<void> Wallet::loadOrCreate(const std::string &path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    return loadFromFile(path);
  }
  auto generated = generate();
  if (!generated) {
    return generated;
  }
  return saveToFile(path);
}

double Wallet::getBalance(const Chain &chain) const {
  return chain.getBalance(getAddress());
}

Wallet::Roe<void> Wallet::signTransaction(Transaction &tx) const {
  if (!hasKeys()) {
    return Error(E_NO_KEY, "Wallet has no keys");
  }
  if (tx.getSender() != getAddress()) {
    return Error(E_SENDER, "Transaction " + tx.getTxid() +
                               " is not sent from this wallet");
  }
  auto signedResult = tx.sign(secretKey_);
  if (!signedResult) {
    return Error(E_SIGN, signedResult.error().message);
  }
  return {};
}

Wallet::Roe<Transaction>
Wallet::createTransaction(const Chain &chain, const std::string &recipient,
                          double amount, double fee) const {
  if (!hasKeys()) {
    return Error(E_NO_KEY, "Wallet has no keys");
  }
  if (recipient.empty() || amount < 0 || fee < 0) {
    return Error(E_AMOUNT, "Recipient must be set and amounts non-negative");
  }

  double balance = getBalance(chain);
  if (balance < amount + fee) {
    std::ostringstream oss;
    oss << "Insufficient balance: " << balance << " < " << amount + fee;
    return Error(E_BALANCE, oss.str());
  }

  Transaction tx(getAddress(), recipient, amount, fee, utl::getTimestamp());
  auto signedResult = signTransaction(tx);
  if (!signedResult) {
    return signedResult.error();
  }
  return tx;
}

} // namespace qc
