#include "../Chain.h"
#include "../../lib/Crypto.h"
#include "../../lib/Utilities.h"
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <thread>

using namespace qc;

namespace {

consensus::ChainConfig makeTestConfig() {
    consensus::ChainConfig config;
    config.initialDifficulty = 1;
    config.pow = utl::PowParams{1, 8192};
    return config;
}

// Links a block onto the current tip without proof-of-work
Block makeLinkedBlock(const Chain &chain, double timestamp,
                      const std::vector<Transaction> &extra = {}) {
    Block tip = chain.getLatestBlock();
    std::vector<Transaction> txs = {
        Transaction::createCoinbase("linked-miner", 1.0, timestamp)};
    txs.insert(txs.end(), extra.begin(), extra.end());
    Block block(tip.getIndex() + 1, tip.getHash(), timestamp, txs);
    block.setHash(block.calculateHash());
    return block;
}

} // namespace

class ChainTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto keys = utl::mldsaGenerate();
        ASSERT_TRUE(keys.isOk()) << keys.error().message;
        keys_ = keys.value();
        address_ = utl::hexEncode(keys_.publicKey);
    }

    Transaction makeSigned(double amount, double fee, double timestamp = 1735700000.0) {
        Transaction tx(address_, "bob", amount, fee, timestamp);
        auto signedTx = tx.sign(keys_.secretKey);
        EXPECT_TRUE(signedTx.isOk());
        return tx;
    }

    utl::MldsaKeyPair keys_;
    std::string address_;
};

TEST_F(ChainTest, FreshChainHoldsOnlyGenesis) {
    Chain chain(makeTestConfig());
    EXPECT_EQ(chain.getLength(), 1u);
    EXPECT_EQ(chain.getHeight(), 0u);
    EXPECT_EQ(chain.getPendingCount(), 0u);
    EXPECT_EQ(chain.getDifficulty(), 1u);

    Block genesis = chain.getLatestBlock();
    EXPECT_EQ(genesis.getIndex(), 0u);
    EXPECT_EQ(genesis.getPreviousHash(), std::string(64, '0'));
    ASSERT_EQ(genesis.getTransactions().size(), 1u);
    EXPECT_TRUE(genesis.getTransactions()[0].isCoinbase());
    EXPECT_DOUBLE_EQ(chain.getBalance(consensus::GENESIS_ADDRESS), 50.0);
    EXPECT_TRUE(chain.isValid());
}

TEST_F(ChainTest, GenesisIsIdenticalAcrossInstances) {
    Chain a(makeTestConfig());
    Chain b(makeTestConfig());
    EXPECT_EQ(a.getLatestBlock().getHash(), b.getLatestBlock().getHash());
    EXPECT_EQ(a.getLatestBlock().getHash(), a.getLatestBlock().calculateHash());
}

TEST_F(ChainTest, SignedTransactionIsAdmittedWithoutFunds) {
    Chain chain(makeTestConfig());
    EXPECT_DOUBLE_EQ(chain.getBalance(address_), 0.0);

    Transaction tx = makeSigned(10.0, 0.0001);
    ASSERT_TRUE(chain.addTransaction(tx).isOk());
    EXPECT_EQ(chain.getPendingCount(), 1u);
    EXPECT_TRUE(chain.hasTransaction(tx.getTxid()));
}

TEST_F(ChainTest, UnsignedTransactionIsRejected) {
    Chain chain(makeTestConfig());
    Transaction tx(address_, "bob", 1.0, 0.0, 1735700000.0);
    auto result = chain.addTransaction(tx);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, Chain::E_TX_SIGNATURE);
    EXPECT_EQ(chain.getPendingCount(), 0u);
}

TEST_F(ChainTest, DuplicateTransactionIsRejected) {
    Chain chain(makeTestConfig());
    Transaction tx = makeSigned(1.0, 0.0);
    ASSERT_TRUE(chain.addTransaction(tx).isOk());
    auto again = chain.addTransaction(tx);
    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, Chain::E_TX_DUPLICATE);
    EXPECT_EQ(chain.getPendingCount(), 1u);
}

TEST_F(ChainTest, SignedNegativeTransferIsRejected) {
    Chain chain(makeTestConfig());
    Transaction pull = makeSigned(-1000.0, 0.0);
    ASSERT_TRUE(pull.verify());
    auto result = chain.addTransaction(pull);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, Chain::E_TX_AMOUNT);

    auto negativeFee = chain.addTransaction(makeSigned(1.0, -5.0, 1735700001.0));
    ASSERT_TRUE(negativeFee.isError());
    EXPECT_EQ(negativeFee.error().code, Chain::E_TX_AMOUNT);
    EXPECT_EQ(chain.getPendingCount(), 0u);
    EXPECT_DOUBLE_EQ(chain.getBalance("bob"), 0.0);
}

TEST_F(ChainTest, MiningAppendsBlockWithCoinbase) {
    Chain chain(makeTestConfig());
    Transaction tx = makeSigned(2.0, 0.5);
    ASSERT_TRUE(chain.addTransaction(tx).isOk());

    auto mined = chain.minePendingTransactions("miner");
    ASSERT_TRUE(mined.isOk()) << mined.error().message;
    EXPECT_GE(mined.value().attempts, 1u);

    const Block &block = mined.value().block;
    EXPECT_EQ(block.getIndex(), 1u);
    EXPECT_TRUE(Block::meetsDifficulty(block.getHash(), 1));
    EXPECT_TRUE(block.verifyProofOfWork(1, chain.getConfig().pow));
    ASSERT_EQ(block.getTransactions().size(), 2u);
    EXPECT_TRUE(block.getTransactions()[0].isCoinbase());
    EXPECT_EQ(block.getTransactions()[0].getRecipient(), "miner");
    EXPECT_DOUBLE_EQ(block.getTransactions()[0].getAmount(), 50.0);
    EXPECT_EQ(block.getTransactions()[1].getTxid(), tx.getTxid());

    EXPECT_EQ(chain.getLength(), 2u);
    EXPECT_EQ(chain.getPendingCount(), 0u);
    EXPECT_TRUE(chain.hasTransaction(tx.getTxid()));
    EXPECT_TRUE(chain.isValid());
}

TEST_F(ChainTest, BalanceReplaysWholeChain) {
    Chain chain(makeTestConfig());
    ASSERT_TRUE(chain.minePendingTransactions(address_).isOk());
    EXPECT_DOUBLE_EQ(chain.getBalance(address_), 50.0);

    ASSERT_TRUE(chain.addTransaction(makeSigned(10.0, 0.5)).isOk());
    ASSERT_TRUE(chain.minePendingTransactions("miner").isOk());

    EXPECT_DOUBLE_EQ(chain.getBalance(address_), 39.5);
    EXPECT_DOUBLE_EQ(chain.getBalance("bob"), 10.0);
    EXPECT_DOUBLE_EQ(chain.getBalance("miner"), 50.0);
    EXPECT_DOUBLE_EQ(chain.getBalance("nobody"), 0.0);
}

TEST_F(ChainTest, AssemblyOrdersByFeeAndCapsBlockSize) {
    consensus::ChainConfig config = makeTestConfig();
    config.maxTransactionsPerBlock = 2;
    Chain chain(config);

    Transaction low = makeSigned(1.0, 0.1, 1735700001.0);
    Transaction high = makeSigned(1.0, 0.9, 1735700002.0);
    Transaction mid = makeSigned(1.0, 0.5, 1735700003.0);
    ASSERT_TRUE(chain.addTransaction(low).isOk());
    ASSERT_TRUE(chain.addTransaction(high).isOk());
    ASSERT_TRUE(chain.addTransaction(mid).isOk());

    Block candidate = chain.assembleBlock("miner");
    ASSERT_EQ(candidate.getTransactions().size(), 3u);
    EXPECT_EQ(candidate.getTransactions()[1].getTxid(), high.getTxid());
    EXPECT_EQ(candidate.getTransactions()[2].getTxid(), mid.getTxid());

    ASSERT_TRUE(chain.minePendingTransactions("miner").isOk());
    auto pending = chain.getPendingTransactions();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].getTxid(), low.getTxid());
}

TEST_F(ChainTest, AppendRejectsWrongIndexAndLink) {
    Chain chain(makeTestConfig());
    Block good = makeLinkedBlock(chain, 1735690000.0);

    Block skipped(5, good.getPreviousHash(), 1735690000.0,
                  good.getTransactions());
    auto wrongIndex = chain.appendBlock(skipped);
    ASSERT_TRUE(wrongIndex.isError());
    EXPECT_EQ(wrongIndex.error().code, Chain::E_BLOCK_INDEX);

    Block unlinked(1, std::string(64, 'f'), 1735690000.0,
                   good.getTransactions());
    auto wrongLink = chain.appendBlock(unlinked);
    ASSERT_TRUE(wrongLink.isError());
    EXPECT_EQ(wrongLink.error().code, Chain::E_BLOCK_CHAIN);

    ASSERT_TRUE(chain.appendBlock(good).isOk());
    EXPECT_EQ(chain.getLength(), 2u);
}

TEST_F(ChainTest, AppendedBlockClearsItsTransactionsFromPool) {
    Chain chain(makeTestConfig());
    Transaction tx = makeSigned(1.0, 0.0);
    ASSERT_TRUE(chain.addTransaction(tx).isOk());

    ASSERT_TRUE(chain.appendBlock(makeLinkedBlock(chain, 1735690000.0, {tx})).isOk());
    EXPECT_EQ(chain.getPendingCount(), 0u);
    EXPECT_TRUE(chain.addTransaction(tx).isError());
}

TEST_F(ChainTest, MinedBlockOnMovedTipIsStale) {
    Chain chain(makeTestConfig());
    std::atomic<bool> appended{false};
    Block competitor = makeLinkedBlock(chain, 1735690000.0);

    auto mined = chain.minePendingTransactions("miner", [&]() {
        if (!appended) {
            appended = true;
            EXPECT_TRUE(chain.appendBlock(competitor).isOk());
        }
        return false;
    });
    ASSERT_TRUE(mined.isError());
    EXPECT_EQ(mined.error().code, Chain::E_STALE_TIP);
    EXPECT_EQ(chain.getLength(), 2u);
    EXPECT_EQ(chain.getLatestBlock().getHash(), competitor.getHash());
}

TEST_F(ChainTest, CancelledMiningLeavesChainUntouched) {
    consensus::ChainConfig config = makeTestConfig();
    config.initialDifficulty = 64;
    Chain chain(config);

    auto mined = chain.minePendingTransactions("miner", []() { return true; });
    ASSERT_TRUE(mined.isError());
    EXPECT_EQ(mined.error().code, Chain::E_MINING_CANCELLED);
    EXPECT_EQ(chain.getLength(), 1u);
}

TEST_F(ChainTest, FastBlocksRaiseDifficulty) {
    consensus::ChainConfig config = makeTestConfig();
    config.adjustmentInterval = 2;
    config.targetBlockTime = 10;
    Chain chain(config);

    double t = consensus::GENESIS_TIMESTAMP;
    ASSERT_TRUE(chain.appendBlock(makeLinkedBlock(chain, t + 100)).isOk());
    EXPECT_EQ(chain.getDifficulty(), 1u);
    ASSERT_TRUE(chain.appendBlock(makeLinkedBlock(chain, t + 101)).isOk());
    EXPECT_EQ(chain.getDifficulty(), 2u);
}

TEST_F(ChainTest, SlowBlocksLowerDifficulty) {
    consensus::ChainConfig config = makeTestConfig();
    config.initialDifficulty = 3;
    config.adjustmentInterval = 2;
    config.targetBlockTime = 10;
    Chain chain(config);

    double t = consensus::GENESIS_TIMESTAMP;
    ASSERT_TRUE(chain.appendBlock(makeLinkedBlock(chain, t + 10)).isOk());
    ASSERT_TRUE(chain.appendBlock(makeLinkedBlock(chain, t + 500)).isOk());
    EXPECT_EQ(chain.getDifficulty(), 2u);
}

TEST_F(ChainTest, TamperedBlockInvalidatesChain) {
    Chain chain(makeTestConfig());
    ASSERT_TRUE(chain.minePendingTransactions("miner").isOk());
    ASSERT_TRUE(chain.isValid());

    nlohmann::json snapshot = chain.ltsToJson();
    snapshot["chain"][1]["transactions"][0]["amount"] = 5000.0;
    Chain tampered(makeTestConfig());
    ASSERT_TRUE(tampered.ltsFromJson(snapshot).isOk());
    EXPECT_FALSE(tampered.isValid());
}

TEST_F(ChainTest, GetBlocksClampsToTip) {
    Chain chain(makeTestConfig());
    ASSERT_TRUE(chain.appendBlock(makeLinkedBlock(chain, 1735690000.0)).isOk());
    ASSERT_TRUE(chain.appendBlock(makeLinkedBlock(chain, 1735690001.0)).isOk());

    EXPECT_EQ(chain.getBlocks(0, 100).size(), 3u);
    EXPECT_EQ(chain.getBlocks(1, 1).size(), 1u);
    EXPECT_TRUE(chain.getBlocks(3, 5).empty());
    EXPECT_TRUE(chain.getBlock(2).isOk());
    EXPECT_EQ(chain.getBlock(3).error().code, Chain::E_BLOCK_NOT_FOUND);
}

TEST_F(ChainTest, SnapshotRoundTripsThroughFile) {
    Chain chain(makeTestConfig());
    ASSERT_TRUE(chain.minePendingTransactions(address_).isOk());
    Transaction pending = makeSigned(3.0, 0.1);
    ASSERT_TRUE(chain.addTransaction(pending).isOk());

    auto dir = std::filesystem::temp_directory_path() / "qchain_chain_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    std::string path = (dir / "blockchain.json").string();

    ASSERT_TRUE(chain.saveToFile(path).isOk());

    Chain restored(makeTestConfig());
    auto loaded = restored.loadFromFile(path);
    ASSERT_TRUE(loaded.isOk()) << loaded.error().message;
    EXPECT_EQ(restored.getLength(), 2u);
    EXPECT_EQ(restored.getLatestBlock().getHash(), chain.getLatestBlock().getHash());
    EXPECT_EQ(restored.getPendingCount(), 1u);
    EXPECT_TRUE(restored.hasTransaction(pending.getTxid()));
    EXPECT_DOUBLE_EQ(restored.getBalance(address_), 50.0);
    EXPECT_TRUE(restored.isValid());

    std::filesystem::remove_all(dir);
}

TEST_F(ChainTest, LoadRejectsBrokenSnapshots) {
    Chain chain(makeTestConfig());
    EXPECT_EQ(chain.ltsFromJson(nlohmann::json::object()).error().code,
              Chain::E_INTERNAL_DESERIALIZE);
    EXPECT_EQ(chain.ltsFromJson({{"chain", nlohmann::json::array()}}).error().code,
              Chain::E_INTERNAL_DESERIALIZE);

    nlohmann::json snapshot = chain.ltsToJson();
    snapshot["chain"][0]["index"] = 3;
    EXPECT_TRUE(chain.ltsFromJson(snapshot).isError());

    snapshot = chain.ltsToJson();
    snapshot["difficulty"] = 0;
    EXPECT_TRUE(chain.ltsFromJson(snapshot).isError());

    EXPECT_EQ(chain.loadFromFile("/nonexistent/qchain/blockchain.json").error().code,
              Chain::E_LEDGER_READ);
    EXPECT_EQ(chain.getLength(), 1u);
}

TEST_F(ChainTest, ConcurrentAdmissionKeepsEveryTransaction) {
    Chain chain(makeTestConfig());
    std::vector<Transaction> txs;
    for (int i = 0; i < 8; ++i) {
        txs.push_back(makeSigned(1.0, 0.0, 1735700000.0 + i));
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (size_t i = t; i < txs.size(); i += 4) {
                EXPECT_TRUE(chain.addTransaction(txs[i]).isOk());
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }
    EXPECT_EQ(chain.getPendingCount(), txs.size());
}
