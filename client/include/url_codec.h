#ifndef SFT_CLIENT_URL_CODEC_H
#define SFT_CLIENT_URL_CODEC_H

#include <optional>
#include <string>

#include "crypto_envelope.h"
#include "transfer_types.h"

namespace sft::transfer {

inline constexpr const char kPlainScheme[] = "https";
inline constexpr const char kMarkerScheme[] = "aesgcm";

// Shareable URL handling. Encrypted links look like
// aesgcm://host/path#<hex(iv || key)> and are fetched as https://host/path.
class UrlCodec {
 public:
  static bool EmbedKey(const std::string& base_read_url,
                       const CryptoEnvelope::Iv& iv,
                       const CryptoEnvelope::Key& key,
                       std::string& out_url,
                       TransferError& error);

  // No key is not an error: it marks a plaintext link.
  static std::optional<Envelope> ExtractKey(const std::string& url);

  static bool NormalizeForFetch(const std::string& url,
                                std::string& out_url,
                                TransferError& error);

  // Fetchable form without fragment; identifies one remote resource.
  static bool DedupeKey(const std::string& url,
                        std::string& out_key,
                        TransferError& error);

  static bool IsMarkerUrl(const std::string& url);
  static std::string LastPathComponent(const std::string& url);
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_URL_CODEC_H
