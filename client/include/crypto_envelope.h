#ifndef SFT_CLIENT_CRYPTO_ENVELOPE_H
#define SFT_CLIENT_CRYPTO_ENVELOPE_H

#include <array>
#include <cstdint>
#include <vector>

#include "transfer_types.h"

namespace sft::transfer {

// AES-256-GCM with a 16 byte IV and no associated data. The wire framing is
// ciphertext || tag(16); the receiver finds the tag by position.
class CryptoEnvelope {
 public:
  using Key = std::array<std::uint8_t, kEnvelopeKeySize>;
  using Iv = std::array<std::uint8_t, kEnvelopeIvSize>;

  static bool Generate(Envelope& out, TransferError& error);

  static bool Encrypt(const std::vector<std::uint8_t>& plaintext,
                      const Key& key,
                      const Iv& iv,
                      std::vector<std::uint8_t>& out_framed,
                      TransferError& error);

  static bool Decrypt(const std::vector<std::uint8_t>& framed,
                      const Key& key,
                      const Iv& iv,
                      std::vector<std::uint8_t>& out_plaintext,
                      TransferError& error);

  static std::uint64_t FramedSize(std::uint64_t plaintext_size) {
    return plaintext_size + kAuthTagSize;
  }
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_CRYPTO_ENVELOPE_H
