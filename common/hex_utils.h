#ifndef SFT_HEX_UTILS_H
#define SFT_HEX_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sft::common {

std::string BytesToHexLower(const std::uint8_t* data, std::size_t len);
std::string BytesToHexLower(const std::vector<std::uint8_t>& data);

// Accepts upper and lower case digits. Odd length or a non-hex character
// clears |out| and fails.
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);
bool HexToBytes(const std::string& hex, std::vector<std::uint8_t>& out);

bool IsHexString(std::string_view text);

}  // namespace sft::common

#endif  // SFT_HEX_UTILS_H
