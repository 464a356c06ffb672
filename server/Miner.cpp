#include "Miner.h"

#include <thread>

namespace qc {

Miner::Miner(Chain &chain) : Service("qchain.miner"), chain_(chain) {}

Miner::~Miner() { stop(); }

Service::Roe<void> Miner::start(const Config &config) {
  if (isRunning()) {
    return Service::Error(E_CONFIG, "Miner is already running");
  }
  config_ = config;
  return Service::start();
}

Service::Roe<void> Miner::onStart() {
  if (config_.minerAddress.empty()) {
    return Service::Error(E_CONFIG, "Miner address must not be empty");
  }
  log().info << "Mining to " << config_.minerAddress.substr(0, 16)
             << "... at difficulty " << chain_.getDifficulty();
  return {};
}

Miner::Roe<Chain::MinedBlock> Miner::mineOnce() {
  try {
    auto mined = chain_.minePendingTransactions(
        config_.minerAddress, [this]() { return isStopSet(); });
    if (!mined) {
      switch (mined.error().code) {
      case Chain::E_MINING_CANCELLED:
        return Error(E_CANCELLED, mined.error().message);
      case Chain::E_STALE_TIP:
        return Error(E_STALE, mined.error().message);
      default:
        return Error(E_MINING, mined.error().message);
      }
    }

    const Chain::MinedBlock &result = mined.value();
    double hashrate =
        result.seconds > 0 ? result.attempts / result.seconds : 0.0;
    lastHashrate_ = hashrate;
    ++blocksMined_;

    log().info << "Mined block " << result.block.getIndex() << " with "
               << result.block.getTransactions().size()
               << " transactions, hash " << result.block.getHash() << " in "
               << result.seconds << "s (" << hashrate << " H/s)";

    if (config_.onBlockMined) {
      config_.onBlockMined(result.block);
    }

    if (!config_.snapshotPath.empty()) {
      auto saved = chain_.saveToFile(config_.snapshotPath);
      if (!saved) {
        log().error << "Failed to save snapshot: " << saved.error().message;
      }
    }
    return mined.value();
  } catch (const std::exception &e) {
    return Error(E_MINING, e.what());
  }
}

void Miner::runLoop() {
  while (!isStopSet()) {
    auto round = mineOnce();
    if (round) {
      continue;
    }
    switch (round.error().code) {
    case E_CANCELLED:
      break;
    case E_STALE:
      log().debug << round.error().message;
      break;
    default:
      log().error << "Mining error: " << round.error().message;
      cooldown();
      break;
    }
  }
  log().info << "Mining stopped after " << blocksMined_ << " blocks";
}

void Miner::cooldown() {
  auto until = std::chrono::steady_clock::now() + config_.cooldown;
  while (!isStopSet() && std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

} // namespace qc
