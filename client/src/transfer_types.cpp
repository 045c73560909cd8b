#include "transfer_types.h"

#include <array>

#include "hex_utils.h"
#include "platform_random.h"

namespace sft::transfer {

const char* TransferErrorKindName(TransferErrorKind kind) {
  switch (kind) {
    case TransferErrorKind::kUnknown:
      return "unknown";
    case TransferErrorKind::kNoServers:
      return "no_servers";
    case TransferErrorKind::kServerError:
      return "server_error";
    case TransferErrorKind::kExceedsMaxSize:
      return "exceeds_max_size";
    case TransferErrorKind::kUrlFormatting:
      return "url_formatting";
    case TransferErrorKind::kFileNotFound:
      return "file_not_found";
    case TransferErrorKind::kKeyGeneration:
      return "key_generation";
    case TransferErrorKind::kCrypto:
      return "crypto";
    case TransferErrorKind::kNoSlot:
      return "no_slot";
    case TransferErrorKind::kStorage:
      return "storage";
    case TransferErrorKind::kMissingRecord:
      return "missing_record";
  }
  return "unknown";
}

TransferSource TransferSource::FromBytes(std::vector<std::uint8_t> data) {
  TransferSource src;
  src.kind = SourceKind::kBytes;
  src.bytes = std::move(data);
  return src;
}

TransferSource TransferSource::FromFile(std::string path) {
  TransferSource src;
  src.kind = SourceKind::kFilePath;
  src.file_path = std::move(path);
  return src;
}

TransferSource TransferSource::FromBlob(std::string locator) {
  TransferSource src;
  src.kind = SourceKind::kBlobLocator;
  src.blob_locator = std::move(locator);
  return src;
}

bool ShouldEncryptFor(MessageSecurity security) {
  switch (security) {
    case MessageSecurity::kOtr:
    case MessageSecurity::kOmemo:
      return true;
    case MessageSecurity::kInvalid:
    case MessageSecurity::kPlaintext:
    case MessageSecurity::kPlaintextWithOtr:
      return false;
  }
  return false;
}

bool GenerateRecordId(std::string& out) {
  std::array<std::uint8_t, 16> raw{};
  if (!platform::RandomArray(raw)) {
    out.clear();
    return false;
  }
  out = common::BytesToHexLower(raw.data(), raw.size());
  return true;
}

}  // namespace sft::transfer
