#ifndef QCHAIN_MINER_H
#define QCHAIN_MINER_H

#include "../consensus/Chain.h"
#include "../ledger/Block.h"
#include "../lib/ResultOrError.hpp"
#include "../lib/Service.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace qc {

/**
 * Miner - Mines pending transactions into blocks for as long as it runs
 *
 * Each round assembles a candidate from the pool, searches for a nonce
 * and appends the block. A round interrupted by stop() or overtaken by a
 * block from the network is simply retried; any other failure is logged
 * and followed by a cooldown before the next round.
 */
class Miner : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;
  constexpr static int32_t E_CANCELLED = 2;
  constexpr static int32_t E_STALE = 3;
  constexpr static int32_t E_MINING = 4;

  using BlockCallback = std::function<void(const Block &)>;

  struct Config {
    // Recipient of block rewards and fees
    std::string minerAddress;
    std::chrono::milliseconds cooldown{5000};
    // Written after every mined block when set
    std::string snapshotPath;
    BlockCallback onBlockMined{nullptr};
  };

  explicit Miner(Chain &chain);
  ~Miner() override;

  Service::Roe<void> start(const Config &config);

  uint64_t getBlocksMined() const { return blocksMined_; }
  // Attempts per second of the last successful round
  double getLastHashrate() const { return lastHashrate_; }

  // One mining round; used by the service loop
  Roe<Chain::MinedBlock> mineOnce();

protected:
  void runLoop() override;
  Service::Roe<void> onStart() override;

private:
  void cooldown();

  Chain &chain_;
  Config config_;
  std::atomic<uint64_t> blocksMined_{0};
  std::atomic<double> lastHashrate_{0};
};

} // namespace qc

#endif // QCHAIN_MINER_H
