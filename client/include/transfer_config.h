#ifndef SFT_CLIENT_TRANSFER_CONFIG_H
#define SFT_CLIENT_TRANSFER_CONFIG_H

#include <cstdint>
#include <string>

#include "curl_http_client.h"

namespace sft::transfer {

struct UploadConfig {
  std::string upload_namespace{"urn:xmpp:http:upload:0"};
  // Files below this size are read into memory before the upload starts.
  std::uint64_t prefetch_limit_bytes{1024 * 1024};
  bool require_encryption{false};
};

struct StorageConfig {
  std::string blob_dir{"media_blobs"};
  std::string blob_key_path{"media_blobs/store.key"};
};

struct DownloadConfig {
  bool auto_download{true};
};

struct TransferConfig {
  UploadConfig upload;
  HttpOptions http;
  StorageConfig storage;
  DownloadConfig download;
};

bool LoadTransferConfig(const std::string& path, TransferConfig& out_cfg,
                        std::string& error);

}  // namespace sft::transfer

#endif  // SFT_CLIENT_TRANSFER_CONFIG_H
