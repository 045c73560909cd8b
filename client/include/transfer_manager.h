#ifndef SFT_CLIENT_TRANSFER_MANAGER_H
#define SFT_CLIENT_TRANSFER_MANAGER_H

#include <cstdint>
#include <string>
#include <vector>

#include "capability_registry.h"
#include "discovery_transport.h"
#include "download_pipeline.h"
#include "http_client.h"
#include "media_store.h"
#include "slot_negotiator.h"
#include "task_queue.h"
#include "transfer_config.h"
#include "transfer_types.h"
#include "upload_pipeline.h"

namespace sft::transfer {

// Message level file transfer: sending media items and files, and turning
// links in incoming messages into downloaded media items. Owns the serial
// worker queue and the notification queue. Message store access runs on the
// worker only.
class TransferManager {
 public:
  TransferManager(TransferConfig config,
                  DiscoveryTransport& discovery,
                  SlotTransport& slots,
                  HttpClient& http,
                  MediaBlobStore& blobs,
                  MessageStore& store);
  // Drains the queues. Transport callbacks arriving later are dropped; the
  // HTTP transport itself is only stopped by Shutdown().
  ~TransferManager();

  TransferManager(const TransferManager&) = delete;
  TransferManager& operator=(const TransferManager&) = delete;

  bool Start(std::string& error);
  // Stops the HTTP transport, then drains the worker and notification queues.
  void Shutdown();

  void RefreshCapabilities();
  bool CanUploadFiles() const;
  CapabilityRegistry& registry() { return registry_; }

  void Upload(UploadRequest request, UploadCallback done);

  // Uploads |item| for |message|. |prefetched| holds the item bytes when the
  // caller already has them in memory.
  void SendMediaItem(MediaItem item,
                     std::vector<std::uint8_t> prefetched,
                     MessageRecord message,
                     UploadCallback done = nullptr);

  // Copies the file into the blob store, creates the outgoing message and
  // media item, then sends it.
  void SendFile(const std::string& path,
                const std::string& thread_id,
                MessageSecurity security,
                bool remove_source,
                UploadCallback done = nullptr);

  // |done| fires once per download started.
  void CreateAndDownloadItemsIfNeeded(const MessageRecord& message,
                                      DownloadCallback done = nullptr);
  void DownloadMediaIfNeeded(const MessageRecord& download,
                             DownloadCallback done = nullptr);

 private:
  void SendFileOnWorker(const std::string& path,
                        const std::string& thread_id,
                        MessageSecurity security,
                        bool remove_source,
                        UploadCallback done);
  void CreateDownloadsOnWorker(const MessageRecord& message,
                               DownloadCallback done);
  void FinishSend(MediaItem& item,
                  MessageRecord& message,
                  UploadResult& result);
  void ReportUpload(UploadCallback done, UploadResult result);
  void NotifyUpload(UploadCallback done, UploadResult result);

  TransferConfig config_;
  HttpClient& http_;
  MediaBlobStore& blobs_;
  MessageStore& store_;

  TaskQueue worker_;
  TaskQueue notify_;
  CapabilityRegistry registry_;
  SlotNegotiator negotiator_;
  UploadPipeline uploads_;
  DownloadPipeline downloads_;
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_TRANSFER_MANAGER_H
