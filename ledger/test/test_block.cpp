#include "../Block.h"
#include "../../lib/Utilities.h"
#include <gtest/gtest.h>

#include <atomic>

using namespace qc;

namespace {

// Cheapest Argon2id settings so real mining stays fast in tests
const utl::PowParams kTestPow{1, 8192};

Block makeBlock(uint64_t index = 1, const std::string &previous = std::string(64, 'a')) {
    std::vector<Transaction> txs;
    txs.push_back(Transaction::createCoinbase("miner", 50.0, 1735690000.0));
    txs.push_back(Transaction("alice", "bob", 2.0, 0.5, 1735690001.5));
    return Block(index, previous, 1735690002.0, txs);
}

} // namespace

TEST(BlockTest, HashCoversHeaderFields) {
    Block block = makeBlock();
    EXPECT_EQ(block.getHash(), block.calculateHash());
    EXPECT_EQ(block.getHash().size(), 64u);

    nlohmann::json header = {{"index", 1},
                             {"previous_hash", std::string(64, 'a')},
                             {"timestamp", 1735690002.0},
                             {"transactions_root", block.getTransactionsRoot()},
                             {"nonce", 0}};
    EXPECT_EQ(block.getHeader(0), utl::canonicalJson(header));
    EXPECT_EQ(block.calculateHash(), utl::sha3_256(block.getHeader(0)));
}

TEST(BlockTest, HashChangesWithTransactionsAndNonce) {
    Block block = makeBlock();
    Block other = makeBlock(1, std::string(64, 'b'));
    EXPECT_NE(block.getHash(), other.getHash());

    std::string before = block.calculateHash();
    block.setNonce(99);
    EXPECT_NE(block.calculateHash(), before);
}

TEST(BlockTest, MeetsDifficultyCountsLeadingZeros) {
    EXPECT_TRUE(Block::meetsDifficulty("000abc", 3));
    EXPECT_FALSE(Block::meetsDifficulty("00abc0", 3));
    EXPECT_TRUE(Block::meetsDifficulty("abc", 0));
    EXPECT_FALSE(Block::meetsDifficulty("00", 3));
}

TEST(BlockTest, MinedNonceSatisfiesDifficulty) {
    Block block = makeBlock();
    auto attempts = block.mine(1, kTestPow);
    ASSERT_TRUE(attempts.isOk()) << attempts.error().message;
    EXPECT_GE(attempts.value(), 1u);
    EXPECT_EQ(attempts.value(), block.getNonce() + 1);

    EXPECT_EQ(block.getHash(), block.calculateHash());
    EXPECT_TRUE(Block::meetsDifficulty(
        block.getProofOfWorkDigest(block.getNonce(), kTestPow), 1));
    EXPECT_TRUE(block.verifyProofOfWork(1, kTestPow));
}

TEST(BlockTest, TamperingAfterMiningBreaksHash) {
    Block block = makeBlock();
    ASSERT_TRUE(block.mine(1, kTestPow).isOk());

    nlohmann::json jd = block.ltsToJson();
    jd["transactions"][1]["amount"] = 200.0;
    Block tampered;
    ASSERT_TRUE(tampered.ltsFromJson(jd).isOk());
    EXPECT_EQ(tampered.getHash(), block.getHash());
    EXPECT_NE(tampered.calculateHash(), tampered.getHash());
}

TEST(BlockTest, MiningCanBeCancelled) {
    Block block = makeBlock();
    std::atomic<int> checks{0};
    auto result = block.mine(64, kTestPow, [&checks] { return ++checks > 3; });
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, Block::E_CANCELLED);
}

TEST(BlockTest, JsonRecordRoundTripKeepsHash) {
    Block block = makeBlock(7);
    ASSERT_TRUE(block.mine(1, kTestPow).isOk());

    nlohmann::json jd = block.ltsToJson();
    for (const char *field :
         {"index", "previous_hash", "timestamp", "transactions", "nonce", "hash"}) {
        EXPECT_TRUE(jd.contains(field)) << field;
    }

    Block restored;
    ASSERT_TRUE(restored.ltsFromJson(jd).isOk());
    EXPECT_EQ(restored.getIndex(), 7u);
    EXPECT_EQ(restored.getNonce(), block.getNonce());
    EXPECT_EQ(restored.getHash(), block.getHash());
    EXPECT_EQ(restored.getTransactions().size(), 2u);
    EXPECT_EQ(restored.getTransactions()[1], block.getTransactions()[1]);
    EXPECT_TRUE(restored.verifyProofOfWork(1, kTestPow));
}

TEST(BlockTest, MissingHashIsRecomputed) {
    Block block = makeBlock();
    nlohmann::json jd = block.ltsToJson();
    jd.erase("hash");
    Block restored;
    ASSERT_TRUE(restored.ltsFromJson(jd).isOk());
    EXPECT_EQ(restored.getHash(), block.getHash());
}

TEST(BlockTest, RejectsMalformedRecords) {
    Block block;
    EXPECT_EQ(block.ltsFromJson("block").error().code, Block::E_FORMAT);

    nlohmann::json jd = makeBlock().ltsToJson();
    jd["index"] = -1;
    EXPECT_TRUE(block.ltsFromJson(jd).isError());

    jd = makeBlock().ltsToJson();
    jd["transactions"] = nlohmann::json::object();
    EXPECT_TRUE(block.ltsFromJson(jd).isError());

    jd = makeBlock().ltsToJson();
    jd["transactions"][0].erase("sender");
    EXPECT_TRUE(block.ltsFromJson(jd).isError());
}
