#ifndef SFT_CLIENT_LOCAL_BLOB_STORE_H
#define SFT_CLIENT_LOCAL_BLOB_STORE_H

#include <array>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "media_store.h"

namespace sft::transfer {

// Media blobs kept as individually sealed files under one directory.
// File layout: header || nonce(24) || mac(16) || cipher, header authenticated
// as associated data.
class LocalBlobStore : public MediaBlobStore {
 public:
  LocalBlobStore(std::filesystem::path base_dir,
                 std::filesystem::path key_path);
  ~LocalBlobStore() override;

  LocalBlobStore(const LocalBlobStore&) = delete;
  LocalBlobStore& operator=(const LocalBlobStore&) = delete;

  // Creates the directory and loads the store key, generating it on first use.
  bool Init(std::string& error);

  bool Put(const std::vector<std::uint8_t>& bytes, std::string& out_locator,
           std::string& error) override;
  bool Get(const std::string& locator, std::vector<std::uint8_t>& out_bytes,
           std::string& error) override;
  bool Remove(const std::string& locator, std::string& error);

  static bool IsValidLocator(const std::string& locator);

 private:
  std::filesystem::path ResolvePath(const std::string& locator) const;
  bool LoadOrCreateKey(std::string& error);

  std::filesystem::path base_dir_;
  std::filesystem::path key_path_;
  std::array<std::uint8_t, 32> key_{};
  bool ready_{false};
  mutable std::mutex mutex_;
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_LOCAL_BLOB_STORE_H
