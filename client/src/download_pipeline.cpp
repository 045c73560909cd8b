#include "download_pipeline.h"

#include <map>
#include <utility>

#include "crypto_envelope.h"
#include "mime_types.h"
#include "platform_log.h"
#include "secure_buffer.h"
#include "url_codec.h"

namespace sft::transfer {

namespace plog = sft::platform::log;

namespace {

constexpr char kLogTag[] = "download";

bool IsSuccessStatus(long status) { return status >= 200 && status < 300; }

std::string MediaTypeOnly(const std::string& content_type) {
  std::string out = content_type.substr(0, content_type.find(';'));
  while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) {
    out.pop_back();
  }
  return out;
}

}  // namespace

DownloadPipeline::DownloadPipeline(HttpClient& http,
                                   MediaBlobStore& blobs,
                                   MessageStore& store,
                                   Executor& worker,
                                   Executor& notify)
    : http_(http),
      blobs_(blobs),
      store_(store),
      worker_(worker),
      notify_(notify) {}

void DownloadPipeline::Download(const std::string& url,
                                const std::string& download_id,
                                DownloadCallback done) {
  auto waiter = std::make_shared<Waiter>();
  waiter->url = url;
  waiter->download_id = download_id;
  waiter->done = std::move(done);
  if (!worker_.Post([this, waiter] { Start(std::move(*waiter)); })) {
    DownloadResult result;
    result.url = waiter->url;
    result.error.Set(TransferErrorKind::kUnknown, "worker stopped");
    Report(*waiter, std::move(result));
  }
}

void DownloadPipeline::Start(Waiter waiter) {
  TransferError error;
  std::string dedupe_key;
  if (!UrlCodec::DedupeKey(waiter.url, dedupe_key, error)) {
    plog::Log(plog::Level::kWarn, kLogTag, "unusable link",
              {{"url", waiter.url}, {"detail", error.detail}});
    DownloadResult result;
    result.url = waiter.url;
    result.error = error;
    Report(waiter, std::move(result));
    return;
  }

  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto it = in_flight_.find(dedupe_key);
    if (it != in_flight_.end()) {
      plog::Log(plog::Level::kDebug, kLogTag, "joined in-flight fetch",
                {{"url", dedupe_key}});
      it->second.push_back(std::move(waiter));
      return;
    }
    in_flight_[dedupe_key].push_back(std::move(waiter));
  }

  HttpRequest get;
  get.method = HttpMethod::kGet;
  // The fragment never leaves the client.
  get.url = dedupe_key;
  const Lifeline::Handle alive = lifeline_.handle();
  http_.Send(std::move(get), [this, alive, dedupe_key](HttpResponse response) {
    auto fetched = std::make_shared<Fetched>();
    if (!response.transport_ok) {
      fetched->error.Set(TransferErrorKind::kServerError,
                         "get failed: " + response.error);
    } else if (!IsSuccessStatus(response.status)) {
      fetched->error.Set(TransferErrorKind::kServerError,
                         "get status " + std::to_string(response.status));
    } else {
      fetched->ok = true;
      fetched->content_type = std::move(response.content_type);
      fetched->body = std::move(response.body);
    }
    const bool live = alive.Run([this, &dedupe_key, &fetched] {
      if (worker_.Post([this, dedupe_key, fetched] {
            OnFetched(dedupe_key, *fetched);
          })) {
        return;
      }
      plog::Log(plog::Level::kError, kLogTag, "fetch completion rejected",
                {{"url", dedupe_key}});
      TransferError error;
      error.Set(TransferErrorKind::kUnknown, "worker rejected fetch result");
      AbandonFetch(dedupe_key, error);
    });
    if (!live) {
      plog::Log(plog::Level::kDebug, kLogTag, "fetch finished after teardown",
                {{"url", dedupe_key}});
    }
  });
}

std::size_t DownloadPipeline::InFlightCount() const {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  return in_flight_.size();
}

void DownloadPipeline::AbandonFetch(const std::string& dedupe_key,
                                    const TransferError& error) {
  std::vector<Waiter> waiters;
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto node = in_flight_.extract(dedupe_key);
    if (node.empty()) {
      return;
    }
    waiters = std::move(node.mapped());
  }
  for (const auto& waiter : waiters) {
    DownloadResult result;
    result.url = waiter.url;
    result.error = error;
    Report(waiter, std::move(result));
  }
}

void DownloadPipeline::OnFetched(const std::string& dedupe_key,
                                 const Fetched& fetched) {
  std::vector<Waiter> waiters;
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto node = in_flight_.extract(dedupe_key);
    if (node.empty()) {
      return;
    }
    waiters = std::move(node.mapped());
  }

  if (!fetched.ok) {
    plog::Log(plog::Level::kWarn, kLogTag, "fetch failed",
              {{"url", dedupe_key}, {"detail", fetched.error.detail}});
    for (const auto& waiter : waiters) {
      DownloadResult result;
      result.url = waiter.url;
      result.error = fetched.error;
      Report(waiter, std::move(result));
    }
    return;
  }

  // One decrypt and store per distinct original link.
  std::map<std::string, std::vector<const Waiter*>> by_url;
  for (const auto& waiter : waiters) {
    by_url[waiter.url].push_back(&waiter);
  }
  for (const auto& entry : by_url) {
    MediaItem item;
    TransferError error;
    const bool stored = Persist(entry.first, fetched, item, error);
    if (!stored) {
      plog::Log(plog::Level::kWarn, kLogTag, "download aborted",
                {{"url", entry.first},
                 {"kind", TransferErrorKindName(error.kind)},
                 {"detail", error.detail}});
    }
    for (const Waiter* waiter : entry.second) {
      DownloadResult result;
      result.url = waiter->url;
      if (!stored) {
        result.error = error;
        Report(*waiter, std::move(result));
        continue;
      }
      TransferError attach_error;
      if (!AttachToRecord(waiter->download_id, item, attach_error)) {
        result.error = attach_error;
        result.media_item_id = item.id;
        result.blob_locator = item.blob_locator;
        Report(*waiter, std::move(result));
        continue;
      }
      result.success = true;
      result.media_item_id = item.id;
      result.blob_locator = item.blob_locator;
      Report(*waiter, std::move(result));
    }
  }
}

bool DownloadPipeline::Persist(const std::string& url,
                               const Fetched& fetched,
                               MediaItem& out_item,
                               TransferError& error) {
  std::vector<std::uint8_t> plain;
  auto envelope = UrlCodec::ExtractKey(url);
  if (envelope) {
    const bool ok = CryptoEnvelope::Decrypt(fetched.body, envelope->key,
                                            envelope->iv, plain, error);
    sft::common::SecureWipe(envelope->key);
    sft::common::SecureWipe(envelope->iv);
    if (!ok) {
      return false;
    }
  } else {
    plain = fetched.body;
  }

  std::string locator;
  std::string store_error;
  const bool put_ok = blobs_.Put(plain, locator, store_error);
  const std::uint64_t size = plain.size();
  sft::common::SecureWipe(plain);
  if (!put_ok) {
    error.Set(TransferErrorKind::kStorage, "blob put failed: " + store_error);
    return false;
  }

  MediaItem item;
  if (!GenerateRecordId(item.id)) {
    error.Set(TransferErrorKind::kKeyGeneration, "record id generation failed");
    return false;
  }
  item.filename = UrlCodec::LastPathComponent(url);
  item.mime_type = MediaTypeOnly(fetched.content_type);
  if (item.mime_type.empty()) {
    item.mime_type = MimeTypeForPath(item.filename);
  }
  item.blob_locator = locator;
  item.size = size;
  item.transfer_progress = 1.0;
  item.incoming = true;
  if (!store_.SaveMediaItem(item, store_error)) {
    error.Set(TransferErrorKind::kStorage,
              "media item save failed: " + store_error);
    return false;
  }
  out_item = std::move(item);
  return true;
}

bool DownloadPipeline::AttachToRecord(const std::string& download_id,
                                      const MediaItem& item,
                                      TransferError& error) {
  if (download_id.empty()) {
    return true;
  }
  MessageLoadResult loaded;
  std::string store_error;
  if (!store_.LoadMessage(download_id, loaded, store_error)) {
    error.Set(TransferErrorKind::kStorage, "record load failed: " + store_error);
    return false;
  }
  if (!loaded.found) {
    error.Set(TransferErrorKind::kMissingRecord,
              "download record vanished: " + download_id);
    plog::Log(plog::Level::kError, kLogTag, "download record missing",
              {{"download", download_id}, {"media", item.id}});
    return false;
  }
  loaded.record.media_item_id = item.id;
  if (!store_.SaveMessage(loaded.record, store_error)) {
    error.Set(TransferErrorKind::kStorage, "record save failed: " + store_error);
    return false;
  }
  return true;
}

void DownloadPipeline::Report(const Waiter& waiter, DownloadResult result) {
  if (!waiter.done) {
    return;
  }
  DownloadCallback done = waiter.done;
  auto shared = std::make_shared<DownloadResult>(std::move(result));
  if (!notify_.Post([done, shared] { done(*shared); })) {
    done(*shared);
  }
}

}  // namespace sft::transfer
