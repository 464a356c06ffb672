#include "../consensus/Chain.h"
#include "../consensus/Params.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"
#include "../server/Miner.h"
#include "../server/Node.h"
#include "../server/Wallet.h"

#include <CLI/CLI.hpp>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace {
std::atomic<bool> g_running{true};
std::mutex g_mutex;
std::condition_variable g_cv;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running = false;
    g_cv.notify_one();
  }
}

constexpr const char *FILE_CONFIG = "config.json";
constexpr const char *FILE_LOG = "qchaind.log";
constexpr const char *DIR_WALLETS = "wallets";

struct Options {
  std::string dataDir{"data"};
  std::string host;
  uint16_t port{0};
  bool hasPort{false};
  std::vector<std::string> seedPeers;
  bool mine{false};
  std::string wallet{"default"};
  std::string logLevel{"info"};
};

// Reads config.json, writing one with the defaults when it is missing
bool loadConfig(const std::string &dataDir, qc::consensus::ChainConfig &chain,
                qc::Node::Config &node, qc::logging::Logger &logger) {
  std::string path = (std::filesystem::path(dataDir) / FILE_CONFIG).string();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    nlohmann::json jd;
    jd["chain"] = chain.ltsToJson();
    jd["node"] = node.ltsToJson();
    auto written = qc::utl::writeToFile(path, jd.dump(2));
    if (!written) {
      logger.error << "Failed to write default config: "
                   << written.error().message;
      return false;
    }
    logger.info << "Wrote default configuration to " << path;
    return true;
  }

  auto jd = qc::utl::loadJsonFile(path);
  if (!jd) {
    logger.error << "Failed to read " << path << ": " << jd.error().message;
    return false;
  }
  if (!jd.value().is_object()) {
    logger.error << path << " must hold a JSON object";
    return false;
  }
  if (jd.value().contains("chain")) {
    auto parsed = chain.ltsFromJson(jd.value()["chain"]);
    if (!parsed) {
      logger.error << "Invalid chain configuration: "
                   << parsed.error().message;
      return false;
    }
  }
  if (jd.value().contains("node")) {
    auto parsed = node.ltsFromJson(jd.value()["node"]);
    if (!parsed) {
      logger.error << "Invalid node configuration: " << parsed.error().message;
      return false;
    }
  }
  return true;
}

int runDaemon(const Options &options) {
  auto logger = qc::logging::getLogger("qchain");

  std::error_code ec;
  std::filesystem::create_directories(options.dataDir, ec);
  if (ec) {
    logger.error << "Cannot create data directory " << options.dataDir << ": "
                 << ec.message();
    return 1;
  }

  std::string logFile =
      (std::filesystem::path(options.dataDir) / FILE_LOG).string();
  try {
    qc::logging::getRootLogger().addFileHandler(logFile,
                                                qc::logging::Level::DEBUG);
  } catch (const std::exception &e) {
    logger.warning << "File logging disabled: " << e.what();
  }

  qc::consensus::ChainConfig chainConfig;
  qc::Node::Config nodeConfig;
  if (!loadConfig(options.dataDir, chainConfig, nodeConfig, logger)) {
    return 1;
  }

  nodeConfig.dataDir = options.dataDir;
  if (!options.host.empty()) {
    nodeConfig.endpoint.address = options.host;
  }
  if (options.hasPort) {
    nodeConfig.endpoint.port = options.port;
  }
  for (const auto &seed : options.seedPeers) {
    qc::network::TcpEndpoint endpoint;
    if (!qc::utl::parseHostPort(seed, endpoint.address, endpoint.port)) {
      logger.error << "Invalid seed peer '" << seed << "', expected host:port";
      return 1;
    }
    nodeConfig.seedPeers.push_back(endpoint);
  }

  qc::Chain chain(chainConfig);
  std::string chainFile =
      (std::filesystem::path(options.dataDir) / qc::Node::FILE_BLOCKCHAIN)
          .string();
  if (std::filesystem::exists(chainFile, ec)) {
    auto loaded = chain.loadFromFile(chainFile);
    if (!loaded) {
      logger.error << "Failed to load " << chainFile << ": "
                   << loaded.error().message;
      return 1;
    }
  } else {
    logger.info << "Starting a new chain from genesis";
  }

  qc::Wallet wallet;
  if (options.mine) {
    std::string walletFile = (std::filesystem::path(options.dataDir) /
                              DIR_WALLETS / (options.wallet + ".json"))
                                 .string();
    auto opened = wallet.loadOrCreate(walletFile);
    if (!opened) {
      logger.error << "Failed to open wallet " << walletFile << ": "
                   << opened.error().message;
      return 1;
    }
  }

  qc::Node node(chain);
  auto started = node.start(nodeConfig);
  if (!started) {
    logger.error << "Failed to start node: " << started.error().message;
    return 1;
  }

  qc::Miner miner(chain);
  if (options.mine) {
    qc::Miner::Config minerConfig;
    minerConfig.minerAddress = wallet.getAddress();
    minerConfig.onBlockMined = [&node](const qc::Block &block) {
      node.announceBlock(block);
    };
    auto minerStarted = miner.start(minerConfig);
    if (!minerStarted) {
      logger.error << "Failed to start miner: "
                   << minerStarted.error().message;
      node.stop();
      return 1;
    }
  }

  logger.info << "qchaind running on " << node.getEndpoint()
              << ", press Ctrl+C to stop";

  {
    std::unique_lock<std::mutex> lock(g_mutex);
    g_cv.wait(lock, [] { return !g_running.load(); });
  }

  logger.info << "Shutting down";
  miner.stop();
  node.stop();
  logger.info << "Stopped at height " << chain.getHeight();
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"qchaind - QChain full node"};

  Options options;
  app.add_option("-d,--data-dir", options.dataDir,
                 "Data directory for config, chain, peers and wallets");
  app.add_option("--host", options.host, "Address to bind the listener to");
  auto *portOption =
      app.add_option("-p,--port", options.port, "Port to listen on");
  app.add_option("--seed-peer", options.seedPeers,
                 "Initial peer as host:port (repeatable)");
  app.add_flag("--mine", options.mine, "Mine blocks with the selected wallet");
  app.add_option("--wallet", options.wallet,
                 "Wallet name under <data-dir>/wallets");
  app.add_option("--log-level", options.logLevel,
                 "debug, info, warning, error or critical");

  app.footer("Example:\n"
             "  qchaind -d ./node1 --port 9333 --mine\n"
             "  qchaind -d ./node2 --port 9334 --seed-peer 127.0.0.1:9333\n"
             "\n"
             "A default config.json is written to the data directory on "
             "first start.\n");

  CLI11_PARSE(app, argc, argv);
  options.hasPort = portOption->count() > 0;

  qc::logging::Level level;
  if (!qc::logging::parseLevel(options.logLevel, level)) {
    std::cerr << "Error: unknown log level '" << options.logLevel << "'\n";
    return 1;
  }
  qc::logging::getRootLogger().setLevel(level);

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  return runDaemon(options);
}
