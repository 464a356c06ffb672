#include "Params.h"

#include <cmath>

namespace qc {
namespace consensus {

double ChainConfig::getBlockReward(uint64_t height) const {
  if (halvingInterval == 0) {
    return blockReward;
  }
  uint64_t halvings = height / halvingInterval;
  if (halvings >= 1024) {
    return 0.0;
  }
  return std::ldexp(blockReward, -static_cast<int>(halvings));
}

nlohmann::json ChainConfig::ltsToJson() const {
  nlohmann::json jd;
  jd["difficulty"] = initialDifficulty;
  jd["blockReward"] = blockReward;
  jd["halvingInterval"] = halvingInterval;
  jd["maxSupply"] = maxSupply;
  jd["adjustmentInterval"] = adjustmentInterval;
  jd["targetBlockTime"] = targetBlockTime;
  jd["maxTransactionsPerBlock"] = maxTransactionsPerBlock;
  jd["powOpsLimit"] = pow.opsLimit;
  jd["powMemLimitBytes"] = pow.memLimitBytes;
  return jd;
}

ChainConfig::Roe<void> ChainConfig::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Chain configuration must be a JSON object");
  }

  auto readUnsigned = [&jd](const char *field, uint64_t minValue,
                            uint64_t &out) -> Roe<void> {
    if (!jd.contains(field)) {
      return {};
    }
    if (!jd[field].is_number_unsigned()) {
      return Error(E_CONFIG, std::string("Field '") + field +
                                 "' must be a non-negative integer");
    }
    uint64_t value = jd[field].get<uint64_t>();
    if (value < minValue) {
      return Error(E_CONFIG, std::string("Field '") + field +
                                 "' must be at least " +
                                 std::to_string(minValue));
    }
    out = value;
    return {};
  };

  auto readPositive = [&jd](const char *field, double &out) -> Roe<void> {
    if (!jd.contains(field)) {
      return {};
    }
    if (!jd[field].is_number() || jd[field].get<double>() <= 0) {
      return Error(E_CONFIG, std::string("Field '") + field +
                                 "' must be a positive number");
    }
    out = jd[field].get<double>();
    return {};
  };

  ChainConfig parsed = *this;
  uint64_t difficulty = parsed.initialDifficulty;
  uint64_t maxTx = parsed.maxTransactionsPerBlock;

  for (auto result :
       {readUnsigned("difficulty", 1, difficulty),
        readPositive("blockReward", parsed.blockReward),
        readUnsigned("halvingInterval", 1, parsed.halvingInterval),
        readPositive("maxSupply", parsed.maxSupply),
        readUnsigned("adjustmentInterval", 1, parsed.adjustmentInterval),
        readUnsigned("targetBlockTime", 1, parsed.targetBlockTime),
        readUnsigned("maxTransactionsPerBlock", 0, maxTx),
        readUnsigned("powOpsLimit", 1, parsed.pow.opsLimit),
        readUnsigned("powMemLimitBytes", 8192, parsed.pow.memLimitBytes)}) {
    if (!result) {
      return result;
    }
  }

  if (difficulty > 64) {
    return Error(E_CONFIG, "Field 'difficulty' must be at most 64");
  }

  parsed.initialDifficulty = static_cast<uint32_t>(difficulty);
  parsed.maxTransactionsPerBlock = static_cast<size_t>(maxTx);
  *this = parsed;
  return {};
}

uint32_t calculateNextDifficulty(uint32_t current, double elapsedSeconds,
                                 uint64_t interval, uint64_t targetBlockTime) {
  double expected = static_cast<double>(interval) *
                    static_cast<double>(targetBlockTime);
  if (elapsedSeconds < expected / 2) {
    return current + 1;
  }
  if (elapsedSeconds > expected * 2) {
    return current > 1 ? current - 1 : 1;
  }
  return current;
}

} // namespace consensus
} // namespace qc
