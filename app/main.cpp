#include "../server/NodeServer.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

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
} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"chain-ledger node: custody ledger with HTTP replication"};

  std::string workDir;
  std::string nodeId;
  uint16_t port = 0;
  std::string host;
  std::string advertiseUrl;
  std::vector<std::string> peers;
  uint64_t syncInterval = 0;
  std::string policy;
  std::string logLevel;

  app.add_option("-d,--work-dir", workDir, "Work directory (holds config.json, database and log)")
      ->required();
  app.add_option("--node-id", nodeId, "Node identifier");
  app.add_option("--port", port, "HTTP port, 0 picks a free one");
  app.add_option("--host", host, "HTTP bind address");
  app.add_option("--advertise-url", advertiseUrl, "URL peers use to reach this node");
  app.add_option("--peer", peers, "Peer base URL to connect to at startup (repeatable)");
  app.add_option("--sync-interval", syncInterval, "Seconds between background syncs, 0 disables");
  app.add_option("--policy", policy, "Chain adoption policy")
      ->check(CLI::IsMember({"trust", "validate"}));
  app.add_option("--log-level", logLevel, "debug, info, warning, error or critical");
  CLI11_PARSE(app, argc, argv);

  auto logger = cl::logging::getLogger("cl");

  auto configResult = cl::NodeServer::loadConfigFile(workDir);
  if (!configResult) {
    std::cerr << "Error: " << configResult.error().message << "\n";
    return 1;
  }
  cl::NodeServer::Config config = configResult.value();

  // Command line wins over config.json
  if (app.count("--node-id")) {
    config.nodeId = nodeId;
  }
  if (app.count("--port")) {
    config.port = port;
  }
  if (app.count("--host")) {
    config.host = host;
  }
  if (app.count("--advertise-url")) {
    config.advertiseUrl = cl::utl::normalizePeerUrl(advertiseUrl);
  }
  for (const auto &peer : peers) {
    config.peers.push_back(cl::utl::normalizePeerUrl(peer));
  }
  if (app.count("--sync-interval")) {
    config.syncIntervalSec = syncInterval;
  }
  if (app.count("--policy")) {
    config.adoptionPolicy = policy;
  }
  if (app.count("--log-level")) {
    config.logLevel = logLevel;
  }

  if (config.nodeId.empty()) {
    std::cerr << "Error: node id cannot be empty\n";
    return 1;
  }

  cl::logging::Level level = cl::logging::Level::INFO;
  if (!cl::logging::parseLevel(config.logLevel, level)) {
    std::cerr << "Error: unknown log level: " << config.logLevel << "\n";
    return 1;
  }
  logger.setLevel(level);

  std::string logPath =
      (std::filesystem::path(workDir) / cl::NodeServer::FILE_LOG).string();
  try {
    logger.addFileHandler(logPath, cl::logging::Level::DEBUG);
  } catch (const std::exception &e) {
    std::cerr << "Warning: file logging disabled: " << e.what() << "\n";
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  logger.info << "Starting node " << config.nodeId << " with work directory: " << workDir;

  cl::NodeServer node;
  node.setConfig(config);
  auto startResult = node.start();
  if (!startResult) {
    logger.error << "Failed to start node: " << startResult.error().message;
    std::cerr << "Error: Failed to start node: " << startResult.error().message << "\n";
    return 1;
  }

  std::cout << "Node " << config.nodeId << " running at " << node.getUrl() << "\n";
  std::cout << "Work directory: " << workDir << "\n";
  std::cout << "Press Ctrl+C to stop the node...\n";

  {
    std::unique_lock<std::mutex> lock(g_mutex);
    g_cv.wait(lock, [] { return !g_running.load(); });
  }

  node.stop();
  logger.info << "Node stopped";
  return 0;
}
