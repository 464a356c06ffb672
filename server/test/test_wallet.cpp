#include "../Wallet.h"
#include "../../lib/Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>

using namespace qc;

namespace {

consensus::ChainConfig makeTestConfig() {
    consensus::ChainConfig config;
    config.initialDifficulty = 1;
    config.pow = utl::PowParams{1, 8192};
    return config;
}

} // namespace

class WalletTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "qchain_wallet_test";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::string pathFor(const std::string &name) const {
        return (dir_ / name).string();
    }

    std::filesystem::path dir_;
};

TEST_F(WalletTest, NewWalletHasNoKeys) {
    Wallet wallet;
    EXPECT_FALSE(wallet.hasKeys());
    EXPECT_EQ(wallet.saveToFile(pathFor("empty.json")).error().code,
              Wallet::E_NO_KEY);
}

TEST_F(WalletTest, AddressIsHexPublicKey) {
    Wallet wallet;
    ASSERT_TRUE(wallet.generate().isOk());
    EXPECT_TRUE(wallet.hasKeys());
    EXPECT_EQ(wallet.getAddress(), utl::hexEncode(wallet.getPublicKey()));
    EXPECT_TRUE(utl::isValidMldsaPublicKey(wallet.getPublicKey()));

    Wallet other;
    ASSERT_TRUE(other.generate().isOk());
    EXPECT_NE(wallet.getAddress(), other.getAddress());
}

TEST_F(WalletTest, SaveAndLoadRestoresKeys) {
    Wallet wallet;
    ASSERT_TRUE(wallet.generate().isOk());
    std::string path = pathFor("wallet.json");
    ASSERT_TRUE(wallet.saveToFile(path).isOk());

    auto perms = std::filesystem::status(path).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::group_read,
              std::filesystem::perms::none);
    EXPECT_EQ(perms & std::filesystem::perms::others_read,
              std::filesystem::perms::none);

    Wallet restored;
    ASSERT_TRUE(restored.loadFromFile(path).isOk());
    EXPECT_EQ(restored.getAddress(), wallet.getAddress());

    // Keys survive a signing round trip
    Transaction tx(restored.getAddress(), "bob", 1.0, 0.0, 1735690000.0);
    ASSERT_TRUE(restored.signTransaction(tx).isOk());
    EXPECT_TRUE(tx.verify());
}

TEST_F(WalletTest, LoadOrCreateReusesExistingFile) {
    std::string path = pathFor("wallets/default.json");
    std::filesystem::create_directories(dir_ / "wallets");

    Wallet first;
    ASSERT_TRUE(first.loadOrCreate(path).isOk());
    EXPECT_TRUE(std::filesystem::exists(path));

    Wallet second;
    ASSERT_TRUE(second.loadOrCreate(path).isOk());
    EXPECT_EQ(second.getAddress(), first.getAddress());
}

TEST_F(WalletTest, LoadRejectsBrokenFiles) {
    Wallet wallet;
    EXPECT_EQ(wallet.loadFromFile(pathFor("missing.json")).error().code,
              Wallet::E_READ);

    EXPECT_EQ(wallet.ltsFromJson(nlohmann::json::array()).error().code,
              Wallet::E_FORMAT);
    EXPECT_EQ(wallet.ltsFromJson({{"public_key", "zz"}, {"secret_key", "00"}})
                  .error()
                  .code,
              Wallet::E_FORMAT);
    EXPECT_EQ(wallet.ltsFromJson({{"public_key", "abcd"}, {"secret_key", "00"}})
                  .error()
                  .code,
              Wallet::E_FORMAT);
    EXPECT_FALSE(wallet.hasKeys());
}

TEST_F(WalletTest, SigningRequiresMatchingSender) {
    Wallet wallet;
    ASSERT_TRUE(wallet.generate().isOk());

    Transaction foreign("someone-else", "bob", 1.0, 0.0, 1735690000.0);
    auto result = wallet.signTransaction(foreign);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, Wallet::E_SENDER);
    EXPECT_FALSE(foreign.isSigned());

    Wallet empty;
    Transaction tx(wallet.getAddress(), "bob", 1.0, 0.0, 1735690000.0);
    EXPECT_EQ(empty.signTransaction(tx).error().code, Wallet::E_NO_KEY);
}

TEST_F(WalletTest, CreateTransactionChecksBalance) {
    Chain chain(makeTestConfig());
    Wallet wallet;
    ASSERT_TRUE(wallet.generate().isOk());
    EXPECT_DOUBLE_EQ(wallet.getBalance(chain), 0.0);

    auto broke = wallet.createTransaction(chain, "bob", 1.0);
    ASSERT_TRUE(broke.isError());
    EXPECT_EQ(broke.error().code, Wallet::E_BALANCE);
    EXPECT_NE(broke.error().message.find("Insufficient balance"), std::string::npos);

    ASSERT_TRUE(chain.minePendingTransactions(wallet.getAddress()).isOk());
    EXPECT_DOUBLE_EQ(wallet.getBalance(chain), 50.0);

    auto tx = wallet.createTransaction(chain, "bob", 10.0);
    ASSERT_TRUE(tx.isOk()) << tx.error().message;
    EXPECT_EQ(tx.value().getSender(), wallet.getAddress());
    EXPECT_DOUBLE_EQ(tx.value().getFee(), Wallet::DEFAULT_FEE);
    EXPECT_TRUE(tx.value().verify());
    ASSERT_TRUE(chain.addTransaction(tx.value()).isOk());

    // Exactly the full balance is allowed
    EXPECT_TRUE(wallet.createTransaction(chain, "bob", 49.5, 0.5).isOk());
    EXPECT_EQ(wallet.createTransaction(chain, "bob", 49.5, 0.6).error().code,
              Wallet::E_BALANCE);
}

TEST_F(WalletTest, CreateTransactionRejectsBadArguments) {
    Chain chain(makeTestConfig());
    Wallet wallet;
    ASSERT_TRUE(wallet.generate().isOk());

    EXPECT_EQ(wallet.createTransaction(chain, "", 1.0).error().code,
              Wallet::E_AMOUNT);
    EXPECT_EQ(wallet.createTransaction(chain, "bob", -1.0).error().code,
              Wallet::E_AMOUNT);
    EXPECT_EQ(wallet.createTransaction(chain, "bob", 1.0, -0.1).error().code,
              Wallet::E_AMOUNT);

    Wallet empty;
    EXPECT_EQ(empty.createTransaction(chain, "bob", 1.0).error().code,
              Wallet::E_NO_KEY);
}
