#ifndef SFT_CLIENT_TRANSFER_TYPES_H
#define SFT_CLIENT_TRANSFER_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace sft::transfer {

// Size of the AES-GCM authentication tag appended to every encrypted body.
constexpr std::size_t kAuthTagSize = 16;
constexpr std::size_t kEnvelopeKeySize = 32;
constexpr std::size_t kEnvelopeIvSize = 16;
// IV || key carried in the aesgcm:// fragment.
constexpr std::size_t kFragmentKeyMaterialSize =
    kEnvelopeIvSize + kEnvelopeKeySize;

enum class TransferErrorKind : std::uint8_t {
  kUnknown = 0,
  kNoServers = 1,
  kServerError = 2,
  kExceedsMaxSize = 3,
  kUrlFormatting = 4,
  kFileNotFound = 5,
  kKeyGeneration = 6,
  kCrypto = 7,
  kNoSlot = 8,
  kStorage = 9,
  kMissingRecord = 10,
};

const char* TransferErrorKindName(TransferErrorKind kind);

struct TransferError {
  TransferErrorKind kind{TransferErrorKind::kUnknown};
  std::string detail;

  void Set(TransferErrorKind k, std::string d) {
    kind = k;
    detail = std::move(d);
  }
};

struct Service {
  std::string address;
  std::uint64_t max_upload_size{0};

  bool operator==(const Service& other) const {
    return address == other.address &&
           max_upload_size == other.max_upload_size;
  }
};

struct UploadSlot {
  std::string put_url;
  std::string get_url;
  std::vector<std::pair<std::string, std::string>> put_headers;
};

struct Envelope {
  std::array<std::uint8_t, kEnvelopeKeySize> key{};
  std::array<std::uint8_t, kEnvelopeIvSize> iv{};
};

enum class SourceKind : std::uint8_t {
  kNone = 0,
  kBytes = 1,
  kFilePath = 2,
  kBlobLocator = 3,
};

// Exactly one source of truth for the payload bytes.
struct TransferSource {
  SourceKind kind{SourceKind::kNone};
  std::vector<std::uint8_t> bytes;
  std::string file_path;
  std::string blob_locator;

  static TransferSource FromBytes(std::vector<std::uint8_t> data);
  static TransferSource FromFile(std::string path);
  static TransferSource FromBlob(std::string locator);
};

struct UploadRequest {
  TransferSource source;
  std::string filename;
  std::string content_type;
  bool should_encrypt{false};
};

struct UploadResult {
  bool success{false};
  std::string url;
  TransferError error;
};

using UploadCallback = std::function<void(const UploadResult&)>;

struct DownloadResult {
  bool success{false};
  std::string url;
  std::string media_item_id;
  std::string blob_locator;
  TransferError error;
};

using DownloadCallback = std::function<void(const DownloadResult&)>;

// Message security as decided by the chat session layer.
enum class MessageSecurity : std::uint8_t {
  kInvalid = 0,
  kPlaintext = 1,
  kPlaintextWithOtr = 2,
  kOtr = 3,
  kOmemo = 4,
};

bool ShouldEncryptFor(MessageSecurity security);

struct MessageRecord {
  std::string id;
  std::string thread_id;
  // Set on download records: the message whose text carried the link.
  std::string parent_message_id;
  std::string download_url;
  std::string text;
  std::string media_item_id;
  MessageSecurity security{MessageSecurity::kInvalid};
  bool incoming{false};
  bool has_error{false};
  TransferErrorKind error_kind{TransferErrorKind::kUnknown};
  std::string error_detail;
};

struct MediaItem {
  std::string id;
  std::string filename;
  std::string mime_type;
  std::string blob_locator;
  std::string file_path;
  std::uint64_t size{0};
  double transfer_progress{0.0};
  bool incoming{false};
};

// Random 32 hex character identifier for records created by this core.
bool GenerateRecordId(std::string& out);

}  // namespace sft::transfer

#endif  // SFT_CLIENT_TRANSFER_TYPES_H
