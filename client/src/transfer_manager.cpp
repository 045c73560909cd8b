#include "transfer_manager.h"

#include <filesystem>
#include <memory>
#include <system_error>
#include <utility>

#include "link_scanner.h"
#include "mime_types.h"
#include "platform_fs.h"
#include "platform_log.h"

namespace sft::transfer {

namespace plog = sft::platform::log;
namespace pfs = sft::platform::fs;

namespace {

constexpr char kLogTag[] = "transfer";

}  // namespace

TransferManager::TransferManager(TransferConfig config,
                                 DiscoveryTransport& discovery,
                                 SlotTransport& slots,
                                 HttpClient& http,
                                 MediaBlobStore& blobs,
                                 MessageStore& store)
    : config_(std::move(config)),
      http_(http),
      blobs_(blobs),
      store_(store),
      worker_("transfer", 1, 0),
      notify_("transfer-notify", 1),
      registry_(discovery, worker_, notify_, config_.upload.upload_namespace),
      negotiator_(slots),
      uploads_(registry_, negotiator_, http, blobs, worker_, notify_),
      downloads_(http, blobs, store, worker_, notify_) {}

TransferManager::~TransferManager() {
  worker_.Stop();
  notify_.Stop();
}

bool TransferManager::Start(std::string& error) {
  if (!worker_.Start() || !notify_.Start()) {
    error = "transfer queues failed to start";
    return false;
  }
  return true;
}

void TransferManager::Shutdown() {
  http_.Stop();
  worker_.Stop();
  notify_.Stop();
}

void TransferManager::RefreshCapabilities() { registry_.Refresh(); }

bool TransferManager::CanUploadFiles() const { return registry_.CanUpload(); }

void TransferManager::Upload(UploadRequest request, UploadCallback done) {
  uploads_.Upload(std::move(request), std::move(done));
}

void TransferManager::SendMediaItem(MediaItem item,
                                    std::vector<std::uint8_t> prefetched,
                                    MessageRecord message,
                                    UploadCallback done) {
  UploadRequest request;
  if (!prefetched.empty()) {
    request.source = TransferSource::FromBytes(std::move(prefetched));
  } else if (!item.blob_locator.empty()) {
    request.source = TransferSource::FromBlob(item.blob_locator);
  } else if (!item.file_path.empty()) {
    request.source = TransferSource::FromFile(item.file_path);
  }
  request.filename = item.filename;
  request.content_type = item.mime_type;
  request.should_encrypt =
      config_.upload.require_encryption || ShouldEncryptFor(message.security);

  auto state = std::make_shared<std::pair<MediaItem, MessageRecord>>(
      std::move(item), std::move(message));
  uploads_.Upload(
      std::move(request), [this, state, done](const UploadResult& r) {
        // Store writes stay on the worker.
        auto result = std::make_shared<UploadResult>(r);
        if (worker_.Post([this, state, result, done] {
              FinishSend(state->first, state->second, *result);
              NotifyUpload(done, std::move(*result));
            })) {
          return;
        }
        plog::Log(plog::Level::kError, kLogTag, "send result not recorded",
                  {{"message", state->second.id}});
        result->success = false;
        result->error.Set(TransferErrorKind::kUnknown, "worker stopped");
        if (done) {
          done(*result);
        }
      });
}

void TransferManager::FinishSend(MediaItem& item,
                                 MessageRecord& message,
                                 UploadResult& result) {
  std::string store_error;
  if (!result.success) {
    message.has_error = true;
    message.error_kind = result.error.kind;
    message.error_detail = result.error.detail;
    if (!store_.SaveMessage(message, store_error)) {
      plog::Log(plog::Level::kError, kLogTag, "failed to record send error",
                {{"message", message.id}, {"error", store_error}});
    }
    return;
  }

  message.text = result.url;
  message.media_item_id = item.id;
  message.has_error = false;
  item.transfer_progress = 1.0;
  if (!store_.SaveMediaItem(item, store_error) ||
      !store_.SaveMessage(message, store_error) ||
      !store_.QueueOutgoing(message, store_error)) {
    plog::Log(plog::Level::kError, kLogTag, "failed to finish send",
              {{"message", message.id}, {"error", store_error}});
    result.success = false;
    result.error.Set(TransferErrorKind::kStorage, store_error);
    return;
  }
  plog::Log(plog::Level::kInfo, kLogTag, "media message queued",
            {{"message", message.id}, {"media", item.id}});
}

void TransferManager::SendFile(const std::string& path,
                               const std::string& thread_id,
                               MessageSecurity security,
                               bool remove_source,
                               UploadCallback done) {
  const bool queued =
      worker_.Post([this, path, thread_id, security, remove_source, done] {
        SendFileOnWorker(path, thread_id, security, remove_source, done);
      });
  if (!queued) {
    UploadResult result;
    result.error.Set(TransferErrorKind::kUnknown, "worker stopped");
    ReportUpload(done, std::move(result));
  }
}

void TransferManager::SendFileOnWorker(const std::string& path,
                                       const std::string& thread_id,
                                       MessageSecurity security,
                                       bool remove_source,
                                       UploadCallback done) {
  UploadResult failure;
  std::error_code ec;
  const std::filesystem::path fs_path(path);
  std::vector<std::uint8_t> bytes;
  if (!pfs::IsRegularFile(fs_path, ec) ||
      !pfs::ReadFile(fs_path, bytes, 0, ec)) {
    failure.error.Set(TransferErrorKind::kFileNotFound,
                      "cannot read " + fs_path.filename().string());
    ReportUpload(done, std::move(failure));
    return;
  }

  MediaItem item;
  MessageRecord message;
  std::string store_error;
  if (!GenerateRecordId(item.id) || !GenerateRecordId(message.id)) {
    failure.error.Set(TransferErrorKind::kKeyGeneration,
                      "record id generation failed");
    ReportUpload(done, std::move(failure));
    return;
  }
  if (!blobs_.Put(bytes, item.blob_locator, store_error)) {
    failure.error.Set(TransferErrorKind::kStorage, store_error);
    ReportUpload(done, std::move(failure));
    return;
  }
  item.filename = fs_path.filename().string();
  item.mime_type = MimeTypeForPath(path);
  item.size = bytes.size();
  item.incoming = false;

  message.thread_id = thread_id;
  message.media_item_id = item.id;
  message.security = security;
  message.incoming = false;

  if (!store_.SaveMediaItem(item, store_error) ||
      !store_.SaveMessage(message, store_error)) {
    failure.error.Set(TransferErrorKind::kStorage, store_error);
    ReportUpload(done, std::move(failure));
    return;
  }

  if (bytes.size() >= config_.upload.prefetch_limit_bytes) {
    bytes.clear();
    bytes.shrink_to_fit();
  }
  if (remove_source && !pfs::Remove(fs_path, ec)) {
    plog::Log(plog::Level::kWarn, kLogTag, "source file not removed",
              {{"file", item.filename}, {"error", ec.message()}});
  }
  SendMediaItem(std::move(item), std::move(bytes), std::move(message),
                std::move(done));
}

void TransferManager::CreateAndDownloadItemsIfNeeded(
    const MessageRecord& message, DownloadCallback done) {
  if (!message.media_item_id.empty() || message.text.empty()) {
    return;
  }
  if (!worker_.Post([this, message, done] {
        CreateDownloadsOnWorker(message, done);
      })) {
    plog::Log(plog::Level::kWarn, kLogTag, "download scan not scheduled",
              {{"message", message.id}});
  }
}

void TransferManager::CreateDownloadsOnWorker(const MessageRecord& message,
                                              DownloadCallback done) {
  const std::vector<std::string> urls = ExtractDownloadableUrls(message.text);
  if (urls.empty()) {
    return;
  }
  std::vector<MessageRecord> downloads;
  std::string store_error;
  if (!store_.LoadDownloads(message.id, downloads, store_error)) {
    plog::Log(plog::Level::kError, kLogTag, "download records unavailable",
              {{"message", message.id}, {"error", store_error}});
    return;
  }
  if (downloads.empty()) {
    for (const auto& url : urls) {
      MessageRecord download;
      if (!GenerateRecordId(download.id)) {
        plog::Log(plog::Level::kError, kLogTag, "record id generation failed");
        return;
      }
      download.thread_id = message.thread_id;
      download.parent_message_id = message.id;
      download.download_url = url;
      download.security = message.security;
      download.incoming = message.incoming;
      if (!store_.SaveMessage(download, store_error)) {
        plog::Log(plog::Level::kError, kLogTag, "download record not saved",
                  {{"message", message.id}, {"error", store_error}});
        return;
      }
      downloads.push_back(std::move(download));
    }
  }
  if (!config_.download.auto_download) {
    return;
  }
  for (const auto& download : downloads) {
    DownloadMediaIfNeeded(download, done);
  }
}

void TransferManager::DownloadMediaIfNeeded(const MessageRecord& download,
                                            DownloadCallback done) {
  if (!download.media_item_id.empty() || download.download_url.empty()) {
    return;
  }
  downloads_.Download(download.download_url, download.id, std::move(done));
}

void TransferManager::ReportUpload(UploadCallback done, UploadResult result) {
  plog::Log(plog::Level::kWarn, kLogTag, "send failed",
            {{"kind", TransferErrorKindName(result.error.kind)},
             {"detail", result.error.detail}});
  NotifyUpload(std::move(done), std::move(result));
}

void TransferManager::NotifyUpload(UploadCallback done, UploadResult result) {
  if (!done) {
    return;
  }
  auto shared = std::make_shared<UploadResult>(std::move(result));
  if (!notify_.Post([done, shared] { done(*shared); })) {
    done(*shared);
  }
}

}  // namespace sft::transfer
