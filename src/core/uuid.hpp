#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace warden {

// UUID v4 generator, safe to call from any thread
class UUID {
 public:
  static std::string generate() {
    uint64_t ab = next();
    uint64_t cd = next();

    // Version 4, RFC 4122 variant
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (ab >> 32) << "-";
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (ab & 0xFFFF) << "-";
    ss << std::setw(4) << (cd >> 48) << "-";
    ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);
    return ss.str();
  }

  // Prefixed id such as "msg_3f9c2a1b"
  static std::string with_prefix(const std::string& prefix, size_t length = 12) {
    static const char charset[] = "0123456789abcdef";
    std::string result = prefix;
    result.reserve(prefix.size() + length);
    for (size_t i = 0; i < length; ++i) {
      result += charset[next() & 0xF];
    }
    return result;
  }

 private:
  static uint64_t next() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    return gen();
  }
};

}  // namespace warden
