#ifndef SFT_PLATFORM_RANDOM_H
#define SFT_PLATFORM_RANDOM_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace sft::platform {

// OS CSPRNG. Returns false when the source is unavailable or short.
bool RandomBytes(std::uint8_t* out, std::size_t len);
bool RandomUint32(std::uint32_t& out);

template <std::size_t N>
bool RandomArray(std::array<std::uint8_t, N>& out) {
  return RandomBytes(out.data(), out.size());
}

}  // namespace sft::platform

#endif  // SFT_PLATFORM_RANDOM_H
