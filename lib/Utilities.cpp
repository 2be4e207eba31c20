#include "Utilities.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sodium.h>
#include <sstream>
#include <stdexcept>

namespace cl {
namespace utl {

namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
SodiumInitializer sodium_initializer;
} // namespace

int64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

double currentTimeSeconds() {
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  return static_cast<double>(us) / 1e6;
}

std::string formatIsoTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                now.time_since_epoch()) %
            1000000;

  std::tm tmBuf{};
  localtime_r(&time, &tmBuf);

  std::stringstream ss;
  ss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(6) << us.count();
  return ss.str();
}

std::string trim(const std::string &str) {
  const char *ws = " \t\r\n\f\v";
  auto begin = str.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = str.find_last_not_of(ws);
  return str.substr(begin, end - begin + 1);
}

std::string normalizePeerUrl(const std::string &url) {
  std::string result = trim(url);
  while (!result.empty() && result.back() == '/') {
    result.pop_back();
  }
  return result;
}

cl::Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "File not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  try {
    return nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }
}

cl::Roe<void> writeJsonFile(const std::string &path, const nlohmann::json &j) {
  std::filesystem::path fsPath(path);
  std::filesystem::path parentDir = fsPath.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(1, "Failed to create parent directories for " + path +
                          ": " + ec.message());
    }
  }

  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    return Error(2, "Failed to open file for writing: " + path);
  }
  file << j.dump(2) << std::endl;
  if (!file.good()) {
    return Error(3, "Failed to write file: " + path);
  }
  return {};
}

cl::Roe<nlohmann::json> parseJsonObject(const std::string &body) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(1, "Invalid JSON: " + std::string(e.what()));
  }
  if (!j.is_object()) {
    return Error(2, "Expected a JSON object");
  }
  return j;
}

std::string sha256(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];

  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char *>(input.data()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < crypto_hash_sha256_BYTES; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

} // namespace utl
} // namespace cl
