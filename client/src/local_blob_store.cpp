#include "local_blob_store.h"

#include <cstring>
#include <system_error>
#include <utility>

#include "hex_utils.h"
#include "monocypher.h"
#include "platform_fs.h"
#include "platform_log.h"
#include "platform_random.h"

namespace sft::transfer {

namespace pfs = sft::platform::fs;
namespace plog = sft::platform::log;

namespace {

constexpr std::uint8_t kBlobMagic[4] = {'S', 'F', 'B', '1'};
constexpr std::uint8_t kBlobVersion = 1;
constexpr std::size_t kBlobHeaderSize = sizeof(kBlobMagic) + 1 + 3 + 8;
constexpr std::size_t kNonceSize = 24;
constexpr std::size_t kMacSize = 16;
constexpr std::size_t kLocatorBytes = 16;

void WriteUint64(std::uint64_t v, std::vector<std::uint8_t>& out) {
  for (int i = 7; i >= 0; --i) {
    out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

std::uint64_t ReadUint64(const std::uint8_t* p) {
  std::uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8) | p[i];
  }
  return v;
}

std::vector<std::uint8_t> BuildHeader(std::uint64_t plain_len) {
  std::vector<std::uint8_t> header;
  header.reserve(kBlobHeaderSize);
  header.insert(header.end(), kBlobMagic, kBlobMagic + sizeof(kBlobMagic));
  header.push_back(kBlobVersion);
  header.push_back(0);
  header.push_back(0);
  header.push_back(0);
  WriteUint64(plain_len, header);
  return header;
}

}  // namespace

LocalBlobStore::LocalBlobStore(std::filesystem::path base_dir,
                               std::filesystem::path key_path)
    : base_dir_(std::move(base_dir)), key_path_(std::move(key_path)) {}

LocalBlobStore::~LocalBlobStore() { crypto_wipe(key_.data(), key_.size()); }

bool LocalBlobStore::Init(std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ready_) {
    return true;
  }
  std::error_code ec;
  if (!pfs::CreateDirectories(base_dir_, ec)) {
    error = "blob dir create failed: " + ec.message();
    return false;
  }
  if (!LoadOrCreateKey(error)) {
    return false;
  }
  ready_ = true;
  return true;
}

bool LocalBlobStore::LoadOrCreateKey(std::string& error) {
  std::error_code ec;
  if (pfs::Exists(key_path_, ec)) {
    std::vector<std::uint8_t> raw;
    if (!pfs::ReadFile(key_path_, raw, 64, ec)) {
      error = "blob key read failed: " + ec.message();
      return false;
    }
    if (raw.size() != key_.size()) {
      crypto_wipe(raw.data(), raw.size());
      error = "blob key size invalid";
      return false;
    }
    std::memcpy(key_.data(), raw.data(), key_.size());
    crypto_wipe(raw.data(), raw.size());
    return true;
  }
  if (ec) {
    error = "blob key stat failed: " + ec.message();
    return false;
  }
  if (!sft::platform::RandomArray(key_)) {
    error = "blob key generation failed";
    return false;
  }
  if (key_path_.has_parent_path() &&
      !pfs::CreateDirectories(key_path_.parent_path(), ec)) {
    error = "blob key dir create failed: " + ec.message();
    return false;
  }
  if (!pfs::AtomicWrite(key_path_, key_.data(), key_.size(), ec)) {
    crypto_wipe(key_.data(), key_.size());
    error = "blob key write failed: " + ec.message();
    return false;
  }
  plog::Log(plog::Level::kInfo, "blob_store", "created store key");
  return true;
}

bool LocalBlobStore::IsValidLocator(const std::string& locator) {
  return locator.size() == kLocatorBytes * 2 &&
         sft::common::IsHexString(locator);
}

std::filesystem::path LocalBlobStore::ResolvePath(
    const std::string& locator) const {
  return base_dir_ / (locator + ".blob");
}

bool LocalBlobStore::Put(const std::vector<std::uint8_t>& bytes,
                         std::string& out_locator, std::string& error) {
  out_locator.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ready_) {
    error = "blob store not initialized";
    return false;
  }

  std::array<std::uint8_t, kLocatorBytes> id{};
  std::array<std::uint8_t, kNonceSize> nonce{};
  if (!sft::platform::RandomArray(id) || !sft::platform::RandomArray(nonce)) {
    error = "random source failed";
    return false;
  }
  const std::string locator = sft::common::BytesToHexLower(id.data(), id.size());

  const std::vector<std::uint8_t> header = BuildHeader(bytes.size());
  std::vector<std::uint8_t> blob(header.size() + nonce.size() + kMacSize +
                                 bytes.size());
  std::memcpy(blob.data(), header.data(), header.size());
  std::memcpy(blob.data() + header.size(), nonce.data(), nonce.size());
  std::uint8_t* mac = blob.data() + header.size() + nonce.size();
  std::uint8_t* cipher = mac + kMacSize;
  crypto_aead_lock(cipher, mac, key_.data(), nonce.data(), header.data(),
                   header.size(), bytes.data(), bytes.size());

  std::error_code ec;
  if (!pfs::AtomicWrite(ResolvePath(locator), blob.data(), blob.size(), ec)) {
    error = "blob write failed: " + ec.message();
    return false;
  }
  out_locator = locator;
  return true;
}

bool LocalBlobStore::Get(const std::string& locator,
                         std::vector<std::uint8_t>& out_bytes,
                         std::string& error) {
  out_bytes.clear();
  if (!IsValidLocator(locator)) {
    error = "invalid locator";
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ready_) {
    error = "blob store not initialized";
    return false;
  }

  std::vector<std::uint8_t> blob;
  std::error_code ec;
  if (!pfs::ReadFile(ResolvePath(locator), blob, 0, ec)) {
    error = ec == std::errc::no_such_file_or_directory ? "blob not found"
                                                       : "blob read failed";
    return false;
  }
  const std::size_t overhead = kBlobHeaderSize + kNonceSize + kMacSize;
  if (blob.size() < overhead) {
    error = "blob truncated";
    return false;
  }
  if (std::memcmp(blob.data(), kBlobMagic, sizeof(kBlobMagic)) != 0 ||
      blob[sizeof(kBlobMagic)] != kBlobVersion) {
    error = "blob header invalid";
    return false;
  }
  const std::uint64_t plain_len = ReadUint64(blob.data() + 8);
  if (plain_len != blob.size() - overhead) {
    error = "blob truncated";
    return false;
  }

  const std::uint8_t* nonce = blob.data() + kBlobHeaderSize;
  const std::uint8_t* mac = nonce + kNonceSize;
  const std::uint8_t* cipher = mac + kMacSize;
  out_bytes.resize(static_cast<std::size_t>(plain_len));
  const int ok = crypto_aead_unlock(out_bytes.data(), mac, key_.data(), nonce,
                                    blob.data(), kBlobHeaderSize, cipher,
                                    static_cast<std::size_t>(plain_len));
  if (ok != 0) {
    crypto_wipe(out_bytes.data(), out_bytes.size());
    out_bytes.clear();
    error = "blob auth failed";
    return false;
  }
  return true;
}

bool LocalBlobStore::Remove(const std::string& locator, std::string& error) {
  if (!IsValidLocator(locator)) {
    error = "invalid locator";
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  if (!pfs::WipeAndRemove(ResolvePath(locator), ec)) {
    error = "blob remove failed: " + ec.message();
    return false;
  }
  return true;
}

}  // namespace sft::transfer
