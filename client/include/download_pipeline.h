#ifndef SFT_CLIENT_DOWNLOAD_PIPELINE_H
#define SFT_CLIENT_DOWNLOAD_PIPELINE_H

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "http_client.h"
#include "media_store.h"
#include "task_queue.h"
#include "transfer_types.h"

namespace sft::transfer {

// Fetches shareable links. Concurrent requests for the same remote resource
// share one GET; each distinct link is decrypted and stored once and every
// attached download record gets the resulting media item. Transport
// callbacks that arrive after destruction are dropped.
class DownloadPipeline {
 public:
  DownloadPipeline(HttpClient& http,
                   MediaBlobStore& blobs,
                   MessageStore& store,
                   Executor& worker,
                   Executor& notify);

  DownloadPipeline(const DownloadPipeline&) = delete;
  DownloadPipeline& operator=(const DownloadPipeline&) = delete;

  // |download_id| names the download record to update and may be empty.
  // |done| is optional and fires on |notify| for both outcomes.
  void Download(const std::string& url,
                const std::string& download_id,
                DownloadCallback done = nullptr);

  std::size_t InFlightCount() const;

 private:
  struct Waiter {
    std::string url;
    std::string download_id;
    DownloadCallback done;
  };

  struct Fetched {
    bool ok{false};
    std::string content_type;
    std::vector<std::uint8_t> body;
    TransferError error;
  };

  void Start(Waiter waiter);
  void OnFetched(const std::string& dedupe_key, const Fetched& fetched);
  // Fails every waiter of a fetch whose completion the worker refused.
  void AbandonFetch(const std::string& dedupe_key, const TransferError& error);
  // Decrypts and stores the body for one original link.
  bool Persist(const std::string& url,
               const Fetched& fetched,
               MediaItem& out_item,
               TransferError& error);
  bool AttachToRecord(const std::string& download_id,
                      const MediaItem& item,
                      TransferError& error);
  void Report(const Waiter& waiter, DownloadResult result);

  HttpClient& http_;
  MediaBlobStore& blobs_;
  MessageStore& store_;
  Executor& worker_;
  Executor& notify_;

  // Dedupe key -> requests waiting on that fetch.
  mutable std::mutex in_flight_mutex_;
  std::unordered_map<std::string, std::vector<Waiter>> in_flight_;

  // Last member: revoked before the rest is torn down.
  Lifeline lifeline_;
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_DOWNLOAD_PIPELINE_H
