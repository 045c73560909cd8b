#include <cassert>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "crypto_envelope.h"
#include "download_pipeline.h"
#include "transfer_fakes.h"
#include "url_codec.h"

using namespace sft::transfer;
using namespace sft::transfer::testing;

namespace {

constexpr char kPicUrl[] = "https://dl.example/f/pic.png";
constexpr char kDocUrl[] = "https://dl.example/f/doc.txt";

struct Harness {
  FakeHttpClient http;
  FakeBlobStore blobs;
  FakeMessageStore store;
  InlineExecutor worker;
  ManualExecutor notify;
  DownloadPipeline pipeline{http, blobs, store, worker, notify};

  void AddDownloadRecord(const std::string& id, const std::string& url) {
    MessageRecord record;
    record.id = id;
    record.parent_message_id = "parent-" + id;
    record.download_url = url;
    record.incoming = true;
    std::string error;
    assert(store.SaveMessage(record, error));
  }

  MessageRecord Load(const std::string& id) {
    MessageLoadResult loaded;
    std::string error;
    assert(store.LoadMessage(id, loaded, error));
    assert(loaded.found);
    return loaded.record;
  }
};

std::vector<std::uint8_t> Bytes(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

// Encrypts |plain| and returns the aesgcm link for |base|.
std::string EncryptedLink(const std::string& base,
                          const std::vector<std::uint8_t>& plain,
                          std::vector<std::uint8_t>& out_body) {
  Envelope env;
  TransferError err;
  assert(CryptoEnvelope::Generate(env, err));
  assert(CryptoEnvelope::Encrypt(plain, env.key, env.iv, out_body, err));
  std::string link;
  assert(UrlCodec::EmbedKey(base, env.iv, env.key, link, err));
  return link;
}

}  // namespace

int main() {
  // Encrypted link: fetched over https, decrypted, stored, record updated.
  {
    Harness h;
    const auto plain = Bytes("png bytes here");
    std::vector<std::uint8_t> body;
    const std::string link = EncryptedLink(kPicUrl, plain, body);
    h.http.SetResponse(kPicUrl, MakeResponse(200, body, "image/png"));
    h.AddDownloadRecord("d1", link);

    int calls = 0;
    DownloadResult got;
    h.pipeline.Download(link, "d1", [&](const DownloadResult& r) {
      ++calls;
      got = r;
    });
    assert(calls == 0);
    h.notify.RunPending();
    assert(calls == 1);
    assert(got.success);
    assert(got.url == link);

    const auto requests = h.http.Requests();
    assert(requests.size() == 1);
    assert(requests[0].method == HttpMethod::kGet);
    assert(requests[0].url == kPicUrl);

    std::vector<std::uint8_t> stored;
    std::string error;
    assert(h.blobs.Get(got.blob_locator, stored, error));
    assert(stored == plain);

    const MessageRecord record = h.Load("d1");
    assert(record.media_item_id == got.media_item_id);
    MediaItemLoadResult item;
    assert(h.store.LoadMediaItem(got.media_item_id, item, error));
    assert(item.found);
    assert(item.item.filename == "pic.png");
    assert(item.item.mime_type == "image/png");
    assert(item.item.incoming);
    assert(item.item.transfer_progress == 1.0);
    assert(item.item.size == plain.size());
    assert(h.pipeline.InFlightCount() == 0);
  }

  // Concurrent requests for one resource share a single fetch.
  {
    Harness h;
    h.http.hold = true;
    h.http.SetResponse(kDocUrl,
                       MakeResponse(200, Bytes("shared"), "text/plain"));
    h.AddDownloadRecord("d1", kDocUrl);
    h.AddDownloadRecord("d2", kDocUrl);
    h.AddDownloadRecord("d3", std::string(kDocUrl) + "#note");

    std::vector<DownloadResult> results;
    const auto collect = [&results](const DownloadResult& r) {
      results.push_back(r);
    };
    h.pipeline.Download(kDocUrl, "d1", collect);
    h.pipeline.Download(kDocUrl, "d2", collect);
    h.pipeline.Download(std::string(kDocUrl) + "#note", "d3", collect);
    assert(h.http.RequestCount() == 1);
    assert(h.pipeline.InFlightCount() == 1);

    assert(h.http.CompletePending() == 1);
    h.notify.RunPending();
    assert(results.size() == 3);
    for (const auto& r : results) {
      assert(r.success);
    }
    assert(h.http.RequestCount() == 1);
    assert(h.pipeline.InFlightCount() == 0);
    // One store per distinct original link.
    assert(h.blobs.Count() == 2);
    assert(h.store.MediaCount() == 2);
    assert(h.Load("d1").media_item_id == h.Load("d2").media_item_id);
    assert(h.Load("d1").media_item_id != h.Load("d3").media_item_id);

    // After completion a new request fetches again.
    h.http.hold = false;
    h.pipeline.Download(kDocUrl, "", nullptr);
    assert(h.http.RequestCount() == 2);
  }

  // A keyed link whose body is only a tag stores nothing.
  {
    Harness h;
    std::vector<std::uint8_t> body;
    const std::string link = EncryptedLink(kPicUrl, Bytes("x"), body);
    h.http.SetResponse(kPicUrl,
                       MakeResponse(200, std::vector<std::uint8_t>(16, 7)));
    h.AddDownloadRecord("d1", link);
    DownloadResult got;
    h.pipeline.Download(link, "d1", [&](const DownloadResult& r) { got = r; });
    h.notify.RunPending();
    assert(!got.success);
    assert(got.error.kind == TransferErrorKind::kCrypto);
    assert(h.blobs.Count() == 0);
    assert(h.store.MediaCount() == 0);
    assert(h.Load("d1").media_item_id.empty());
  }

  // Authentication failure.
  {
    Harness h;
    std::vector<std::uint8_t> body;
    const std::string link = EncryptedLink(kPicUrl, Bytes("payload"), body);
    body[0] ^= 0x01;
    h.http.SetResponse(kPicUrl, MakeResponse(200, body));
    DownloadResult got;
    h.pipeline.Download(link, "", [&](const DownloadResult& r) { got = r; });
    h.notify.RunPending();
    assert(got.error.kind == TransferErrorKind::kCrypto);
    assert(h.blobs.Count() == 0);
  }

  // Non-2xx and transport errors end the download without retry.
  {
    Harness h;
    h.http.SetResponse(kDocUrl, MakeResponse(404));
    h.AddDownloadRecord("d1", kDocUrl);
    DownloadResult got;
    h.pipeline.Download(kDocUrl, "d1", [&](const DownloadResult& r) { got = r; });
    h.notify.RunPending();
    assert(got.error.kind == TransferErrorKind::kServerError);
    assert(h.http.RequestCount() == 1);
    assert(h.blobs.Count() == 0);
    assert(h.Load("d1").media_item_id.empty());

    HttpResponse broken;
    broken.error = "timeout";
    h.http.SetResponse(kDocUrl, broken);
    h.pipeline.Download(kDocUrl, "d1", [&](const DownloadResult& r) { got = r; });
    h.notify.RunPending();
    assert(got.error.kind == TransferErrorKind::kServerError);
    assert(h.http.RequestCount() == 2);
  }

  // The owning record vanished: logged and reported, no crash.
  {
    Harness h;
    h.http.SetResponse(kDocUrl, MakeResponse(200, Bytes("orphan")));
    DownloadResult got;
    h.pipeline.Download(kDocUrl, "ghost",
                        [&](const DownloadResult& r) { got = r; });
    h.notify.RunPending();
    assert(!got.success);
    assert(got.error.kind == TransferErrorKind::kMissingRecord);
  }

  // Plaintext link without a callback; type from the extension.
  {
    Harness h;
    h.http.SetResponse(kDocUrl, MakeResponse(200, Bytes("plain")));
    h.AddDownloadRecord("d1", kDocUrl);
    h.pipeline.Download(kDocUrl, "d1");
    assert(h.notify.pending() == 0);
    const MessageRecord record = h.Load("d1");
    assert(!record.media_item_id.empty());
    MediaItemLoadResult item;
    std::string error;
    assert(h.store.LoadMediaItem(record.media_item_id, item, error));
    assert(item.item.mime_type == "text/plain");
    std::vector<std::uint8_t> stored;
    assert(h.blobs.Get(item.item.blob_locator, stored, error));
    assert(stored == Bytes("plain"));
  }

  // Storage failure.
  {
    Harness h;
    h.blobs.fail_puts = true;
    h.http.SetResponse(kDocUrl, MakeResponse(200, Bytes("plain")));
    h.AddDownloadRecord("d1", kDocUrl);
    DownloadResult got;
    h.pipeline.Download(kDocUrl, "d1", [&](const DownloadResult& r) { got = r; });
    h.notify.RunPending();
    assert(got.error.kind == TransferErrorKind::kStorage);
    assert(h.store.MediaCount() == 0);
    assert(h.Load("d1").media_item_id.empty());
  }

  // Unusable links never reach the transport.
  {
    Harness h;
    DownloadResult got;
    h.pipeline.Download("::::", "", [&](const DownloadResult& r) { got = r; });
    h.notify.RunPending();
    assert(got.error.kind == TransferErrorKind::kUrlFormatting);
    assert(h.http.RequestCount() == 0);
  }

  // A fetch result the worker refuses fails its waiters and frees the link.
  {
    Harness h;
    h.worker.reject_post = 2;
    h.http.SetResponse(kDocUrl, MakeResponse(200, Bytes("later")));
    h.AddDownloadRecord("d1", kDocUrl);
    DownloadResult first;
    h.pipeline.Download(kDocUrl, "d1",
                        [&](const DownloadResult& r) { first = r; });
    h.notify.RunPending();
    assert(!first.success);
    assert(first.error.kind == TransferErrorKind::kUnknown);
    assert(h.pipeline.InFlightCount() == 0);
    assert(h.Load("d1").media_item_id.empty());

    DownloadResult second;
    h.pipeline.Download(kDocUrl, "d1",
                        [&](const DownloadResult& r) { second = r; });
    h.notify.RunPending();
    assert(second.success);
    assert(h.http.RequestCount() == 2);
    assert(!h.Load("d1").media_item_id.empty());
  }

  // A response arriving after the pipeline is gone is dropped.
  {
    FakeHttpClient http;
    FakeBlobStore blobs;
    FakeMessageStore store;
    InlineExecutor worker;
    ManualExecutor notify;
    http.hold = true;
    http.SetResponse(kDocUrl, MakeResponse(200, Bytes("late")));
    int calls = 0;
    auto pipeline =
        std::make_unique<DownloadPipeline>(http, blobs, store, worker, notify);
    pipeline->Download(kDocUrl, "", [&calls](const DownloadResult&) { ++calls; });
    assert(http.RequestCount() == 1);
    pipeline.reset();
    const std::size_t posted = worker.posted;
    assert(http.CompletePending() == 1);
    assert(worker.posted == posted);
    assert(notify.RunPending() == 0);
    assert(calls == 0);
    assert(blobs.Count() == 0);
  }

  return 0;
}
