#include "hex_utils.h"

namespace sft::common {

namespace {

constexpr char kHex[] = "0123456789abcdef";

int HexNibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

}  // namespace

std::string BytesToHexLower(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return {};
  }
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHex[data[i] >> 4];
    out[i * 2 + 1] = kHex[data[i] & 0x0F];
  }
  return out;
}

std::string BytesToHexLower(const std::vector<std::uint8_t>& data) {
  return BytesToHexLower(data.data(), data.size());
}

bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out) {
  out.clear();
  if (hex.empty() || (hex.size() % 2) != 0) {
    return false;
  }
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexNibble(hex[i]);
    const int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out.clear();
      return false;
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

bool HexToBytes(const std::string& hex, std::vector<std::uint8_t>& out) {
  return HexToBytes(std::string_view(hex), out);
}

bool IsHexString(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  for (const char c : text) {
    if (HexNibble(c) < 0) {
      return false;
    }
  }
  return true;
}

}  // namespace sft::common
