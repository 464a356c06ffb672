#include "Utilities.h"

#include <charconv>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace qc {
namespace utl {

double getTimestamp() {
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  return static_cast<double>(us) / 1e6;
}

bool parseInt(const std::string &str, int &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

bool parsePort(const std::string &str, uint16_t &port) {
  int portInt = 0;
  if (!parseInt(str, portInt)) {
    return false;
  }
  if (portInt < 0 || portInt > 65535) {
    return false;
  }
  port = static_cast<uint16_t>(portInt);
  return true;
}

bool parseHostPort(const std::string &hostPort, std::string &host,
                   uint16_t &port) {
  size_t colonPos = hostPort.find_last_of(':');
  if (colonPos == std::string::npos || colonPos == 0 ||
      colonPos == hostPort.length() - 1) {
    return false;
  }

  host = hostPort.substr(0, colonPos);
  return parsePort(hostPort.substr(colonPos + 1), port);
}

Roe<nlohmann::json> loadJsonFile(const std::string &filePath) {
  if (!std::filesystem::exists(filePath)) {
    return Error(1, "File not found: " + filePath);
  }

  std::ifstream file(filePath);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + filePath);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  file.close();

  try {
    return nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + filePath + ": " +
                        std::string(e.what()));
  }
}

std::string canonicalJson(const nlohmann::json &value) {
  if (value.is_object()) {
    // nlohmann::json keeps object keys in a std::map, so iteration is sorted
    std::string out = "{";
    bool first = true;
    for (auto it = value.begin(); it != value.end(); ++it) {
      if (!first) {
        out += ", ";
      }
      first = false;
      out += nlohmann::json(it.key()).dump(-1, ' ', true);
      out += ": ";
      out += canonicalJson(it.value());
    }
    out += "}";
    return out;
  }
  if (value.is_array()) {
    std::string out = "[";
    bool first = true;
    for (const auto &item : value) {
      if (!first) {
        out += ", ";
      }
      first = false;
      out += canonicalJson(item);
    }
    out += "]";
    return out;
  }
  return value.dump(-1, ' ', true);
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

static int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return {};
  }
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hexValue(hex[i]);
    int lo = hexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

bool isHexString(const std::string &s) {
  if (s.empty() || s.size() % 2 != 0) {
    return false;
  }
  for (char c : s) {
    if (hexValue(c) < 0) {
      return false;
    }
  }
  return true;
}

static Roe<void> ensureParentDirectory(const std::string &filePath) {
  std::filesystem::path parentDir = std::filesystem::path(filePath).parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(2, "Failed to create parent directories for " + filePath +
                          ": " + ec.message());
    }
  }
  return {};
}

Roe<void> writeToFile(const std::string &filePath, const std::string &content) {
  auto dirResult = ensureParentDirectory(filePath);
  if (!dirResult) {
    return dirResult;
  }

  std::string tmpPath = filePath + ".tmp";
  {
    std::ofstream file(tmpPath, std::ios::trunc);
    if (!file.is_open()) {
      return Error(3, "Failed to open file for writing: " + tmpPath);
    }
    file << content;
    file.close();
    if (!file.good()) {
      return Error(4, "Failed to write content to file: " + tmpPath);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmpPath, filePath, ec);
  if (ec) {
    return Error(5, "Failed to replace " + filePath + ": " + ec.message());
  }
  return {};
}

} // namespace utl
} // namespace qc
