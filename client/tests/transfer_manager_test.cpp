#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "crypto_envelope.h"
#include "transfer_fakes.h"
#include "transfer_manager.h"
#include "url_codec.h"

using namespace sft::transfer;
using namespace sft::transfer::testing;

namespace {

constexpr char kPutUrl[] = "https://up.example/put/1";
constexpr char kGetUrl[] = "https://up.example/get/1/file.bin";

struct Harness {
  FakeDiscoveryTransport discovery;
  FakeSlotTransport slots;
  FakeHttpClient http;
  FakeBlobStore blobs;
  FakeMessageStore store;
  std::unique_ptr<TransferManager> manager;

  explicit Harness(TransferConfig config = TransferConfig{}) {
    slots.response = MakeSlot(kPutUrl, kGetUrl);
    http.SetResponse(kPutUrl, MakeResponse(201));
    manager = std::make_unique<TransferManager>(config, discovery, slots, http,
                                                blobs, store);
    std::string error;
    assert(manager->Start(error));
  }

  ~Harness() {
    if (manager) {
      manager->Shutdown();
    }
  }

  void EnableUploads() {
    discovery.fetched = {MakeUploadRecord("upload.example", "100000")};
    manager->RefreshCapabilities();
    for (int i = 0; i < 500 && !manager->CanUploadFiles(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(manager->CanUploadFiles());
  }

  MessageRecord LoadMessage(const std::string& id) {
    MessageLoadResult loaded;
    std::string error;
    assert(store.LoadMessage(id, loaded, error));
    assert(loaded.found);
    return loaded.record;
  }
};

UploadResult Await(std::future<UploadResult>& fut) {
  assert(fut.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
  return fut.get();
}

std::vector<std::uint8_t> Bytes(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

MediaItem OutgoingItem(const std::string& id) {
  MediaItem item;
  item.id = id;
  item.filename = "voice.m4a";
  item.mime_type = "audio/mp4";
  return item;
}

MessageRecord OutgoingMessage(const std::string& id, MessageSecurity security) {
  MessageRecord message;
  message.id = id;
  message.thread_id = "thread-1";
  message.security = security;
  return message;
}

}  // namespace

int main() {
  // Encryption follows the message security.
  {
    Harness h;
    h.EnableUploads();
    std::promise<UploadResult> done;
    auto fut = done.get_future();
    h.manager->SendMediaItem(OutgoingItem("m1"), Bytes("audio"),
                             OutgoingMessage("msg1", MessageSecurity::kOmemo),
                             [&done](const UploadResult& r) {
                               done.set_value(r);
                             });
    const UploadResult r = Await(fut);
    assert(r.success);
    assert(UrlCodec::IsMarkerUrl(r.url));
    assert(h.http.Requests()[0].body.size() == 5 + 16);

    const MessageRecord msg = h.LoadMessage("msg1");
    assert(msg.text == r.url);
    assert(msg.media_item_id == "m1");
    assert(!msg.has_error);
    MediaItemLoadResult item;
    std::string error;
    assert(h.store.LoadMediaItem("m1", item, error) && item.found);
    assert(item.item.transfer_progress == 1.0);
    const auto outgoing = h.store.Outgoing();
    assert(outgoing.size() == 1);
    assert(outgoing[0].id == "msg1");
  }

  {
    Harness h;
    h.EnableUploads();
    const MessageSecurity plain_levels[] = {MessageSecurity::kPlaintext,
                                            MessageSecurity::kPlaintextWithOtr,
                                            MessageSecurity::kInvalid};
    for (const auto level : plain_levels) {
      std::promise<UploadResult> done;
      auto fut = done.get_future();
      h.manager->SendMediaItem(OutgoingItem("m2"), Bytes("audio"),
                               OutgoingMessage("msg2", level),
                               [&done](const UploadResult& r) {
                                 done.set_value(r);
                               });
      const UploadResult r = Await(fut);
      assert(r.success);
      assert(r.url == kGetUrl);
    }
    std::promise<UploadResult> done;
    auto fut = done.get_future();
    h.manager->SendMediaItem(OutgoingItem("m3"), Bytes("audio"),
                             OutgoingMessage("msg3", MessageSecurity::kOtr),
                             [&done](const UploadResult& r) {
                               done.set_value(r);
                             });
    assert(UrlCodec::IsMarkerUrl(Await(fut).url));
  }

  // Encryption can be forced by configuration.
  {
    TransferConfig config;
    config.upload.require_encryption = true;
    Harness h(config);
    h.EnableUploads();
    std::promise<UploadResult> done;
    auto fut = done.get_future();
    h.manager->SendMediaItem(OutgoingItem("m4"), Bytes("audio"),
                             OutgoingMessage("msg4", MessageSecurity::kPlaintext),
                             [&done](const UploadResult& r) {
                               done.set_value(r);
                             });
    assert(UrlCodec::IsMarkerUrl(Await(fut).url));
  }

  // A failed send is recorded on the message.
  {
    Harness h;
    std::promise<UploadResult> done;
    auto fut = done.get_future();
    h.manager->SendMediaItem(OutgoingItem("m5"), Bytes("audio"),
                             OutgoingMessage("msg5", MessageSecurity::kOmemo),
                             [&done](const UploadResult& r) {
                               done.set_value(r);
                             });
    const UploadResult r = Await(fut);
    assert(!r.success);
    assert(r.error.kind == TransferErrorKind::kNoServers);
    const MessageRecord msg = h.LoadMessage("msg5");
    assert(msg.has_error);
    assert(msg.error_kind == TransferErrorKind::kNoServers);
    assert(h.store.Outgoing().empty());
    assert(h.slots.RequestCount() == 0);
  }

  // Sending a file copies it into the blob store and removes the source.
  {
    const auto dir = std::filesystem::temp_directory_path() / "sft_manager_test";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    const auto path = dir / "holiday.jpg";
    {
      std::ofstream ofs(path, std::ios::binary);
      ofs << "0123456789";
    }
    Harness h;
    h.EnableUploads();
    std::promise<UploadResult> done;
    auto fut = done.get_future();
    h.manager->SendFile(path.string(), "thread-9", MessageSecurity::kOtr, true,
                        [&done](const UploadResult& r) { done.set_value(r); });
    const UploadResult r = Await(fut);
    assert(r.success);
    assert(UrlCodec::IsMarkerUrl(r.url));
    assert(!std::filesystem::exists(path));
    assert(h.blobs.Count() == 1);
    assert(h.slots.requests[0].filename == "holiday.jpg");
    assert(h.slots.requests[0].content_type == "image/jpeg");
    assert(h.slots.requests[0].size == 26);

    const auto outgoing = h.store.Outgoing();
    assert(outgoing.size() == 1);
    assert(outgoing[0].thread_id == "thread-9");
    assert(outgoing[0].text == r.url);
    assert(!outgoing[0].incoming);
    MediaItemLoadResult item;
    std::string error;
    assert(h.store.LoadMediaItem(outgoing[0].media_item_id, item, error));
    assert(item.found);
    assert(item.item.filename == "holiday.jpg");
    assert(item.item.size == 10);
    std::vector<std::uint8_t> stored;
    assert(h.blobs.Get(item.item.blob_locator, stored, error));
    assert(stored == Bytes("0123456789"));

    std::promise<UploadResult> missing;
    auto missing_fut = missing.get_future();
    h.manager->SendFile(path.string(), "thread-9", MessageSecurity::kOtr, false,
                        [&missing](const UploadResult& res) {
                          missing.set_value(res);
                        });
    assert(Await(missing_fut).error.kind == TransferErrorKind::kFileNotFound);
    std::filesystem::remove_all(dir, ec);
  }

  // Files above the prefetch limit are read back from the blob store.
  {
    const auto dir = std::filesystem::temp_directory_path() / "sft_manager_big";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    const auto path = dir / "big.bin";
    {
      std::ofstream ofs(path, std::ios::binary);
      ofs << std::string(64, 'x');
    }
    TransferConfig config;
    config.upload.prefetch_limit_bytes = 16;
    Harness h(config);
    h.EnableUploads();
    std::promise<UploadResult> done;
    auto fut = done.get_future();
    h.manager->SendFile(path.string(), "t", MessageSecurity::kPlaintext, false,
                        [&done](const UploadResult& r) { done.set_value(r); });
    assert(Await(fut).success);
    assert(std::filesystem::exists(path));
    assert(h.http.Requests()[0].body == Bytes(std::string(64, 'x')));
    std::filesystem::remove_all(dir, ec);
  }

  // Links in an incoming message become download records and media items.
  {
    Harness h;
    const auto secret = Bytes("secret picture");
    Envelope env;
    TransferError err;
    assert(CryptoEnvelope::Generate(env, err));
    std::vector<std::uint8_t> body;
    assert(CryptoEnvelope::Encrypt(secret, env.key, env.iv, body, err));
    std::string enc_link;
    assert(UrlCodec::EmbedKey("https://dl.example/a/pic.jpg", env.iv, env.key,
                              enc_link, err));
    h.http.SetResponse("https://dl.example/a/pic.jpg",
                       MakeResponse(200, body, "image/jpeg"));
    h.http.SetResponse("https://dl.example/b/notes.txt",
                       MakeResponse(200, Bytes("notes"), "text/plain"));

    MessageRecord incoming;
    incoming.id = "in1";
    incoming.thread_id = "thread-2";
    incoming.incoming = true;
    incoming.security = MessageSecurity::kOmemo;
    incoming.text = "two files: " + enc_link +
                    " and https://dl.example/b/notes.txt, "
                    "ignored http://dl.example/c";

    std::mutex mu;
    std::vector<DownloadResult> results;
    std::promise<void> both;
    auto both_fut = both.get_future();
    h.manager->CreateAndDownloadItemsIfNeeded(
        incoming, [&](const DownloadResult& r) {
          std::lock_guard<std::mutex> lock(mu);
          results.push_back(r);
          if (results.size() == 2) {
            both.set_value();
          }
        });
    assert(both_fut.wait_for(std::chrono::seconds(5)) ==
           std::future_status::ready);
    {
      std::lock_guard<std::mutex> lock(mu);
      assert(results[0].success && results[1].success);
    }

    std::vector<MessageRecord> downloads;
    std::string error;
    assert(h.store.LoadDownloads("in1", downloads, error));
    assert(downloads.size() == 2);
    for (const auto& d : downloads) {
      assert(d.parent_message_id == "in1");
      assert(d.thread_id == "thread-2");
      assert(d.incoming);
      assert(!d.media_item_id.empty());
      MediaItemLoadResult item;
      assert(h.store.LoadMediaItem(d.media_item_id, item, error));
      std::vector<std::uint8_t> stored;
      assert(h.blobs.Get(item.item.blob_locator, stored, error));
      if (d.download_url == enc_link) {
        assert(stored == secret);
        assert(item.item.filename == "pic.jpg");
      } else {
        assert(d.download_url == "https://dl.example/b/notes.txt");
        assert(stored == Bytes("notes"));
      }
    }

    // Running again reuses the records, which already have media.
    h.manager->CreateAndDownloadItemsIfNeeded(incoming);
    h.manager->Shutdown();
    assert(h.http.RequestCount() == 2);
    assert(h.store.LoadDownloads("in1", downloads, error));
    assert(downloads.size() == 2);
  }

  // Nothing to do for messages with media, no text or no links.
  {
    Harness h;
    MessageRecord with_media;
    with_media.id = "a";
    with_media.text = "https://dl.example/x.jpg";
    with_media.media_item_id = "existing";
    h.manager->CreateAndDownloadItemsIfNeeded(with_media);
    MessageRecord no_links;
    no_links.id = "b";
    no_links.text = "hello there";
    h.manager->CreateAndDownloadItemsIfNeeded(no_links);
    MessageRecord empty;
    empty.id = "c";
    h.manager->CreateAndDownloadItemsIfNeeded(empty);
    h.manager->Shutdown();
    std::vector<MessageRecord> downloads;
    std::string error;
    assert(h.store.LoadDownloads("a", downloads, error) && downloads.empty());
    assert(h.store.LoadDownloads("b", downloads, error) && downloads.empty());
    assert(h.http.RequestCount() == 0);
  }

  // With auto download off only the records are created.
  {
    TransferConfig config;
    config.download.auto_download = false;
    Harness h(config);
    MessageRecord incoming;
    incoming.id = "in2";
    incoming.incoming = true;
    incoming.text = "https://dl.example/only.png";
    h.manager->CreateAndDownloadItemsIfNeeded(incoming);
    h.manager->Shutdown();
    std::vector<MessageRecord> downloads;
    std::string error;
    assert(h.store.LoadDownloads("in2", downloads, error));
    assert(downloads.size() == 1);
    assert(downloads[0].media_item_id.empty());
    assert(h.http.RequestCount() == 0);

    // A record that already has media is never fetched again.
    MessageRecord done_record = downloads[0];
    done_record.media_item_id = "have-it";
    Harness again;
    again.manager->DownloadMediaIfNeeded(done_record);
    again.manager->Shutdown();
    assert(again.http.RequestCount() == 0);
  }

  // Store writes of a send run on one thread, not the caller's callback one.
  {
    const auto dir = std::filesystem::temp_directory_path() / "sft_manager_threads";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    const auto path = dir / "clip.mp4";
    {
      std::ofstream ofs(path, std::ios::binary);
      ofs << "frames";
    }
    Harness h;
    h.EnableUploads();
    std::promise<std::thread::id> done;
    auto fut = done.get_future();
    h.manager->SendFile(path.string(), "t", MessageSecurity::kOmemo, false,
                        [&done](const UploadResult& r) {
                          assert(r.success);
                          done.set_value(std::this_thread::get_id());
                        });
    assert(fut.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    const std::thread::id callback_thread = fut.get();
    assert(h.store.Outgoing().size() == 1);
    const std::set<std::thread::id> writers = h.store.WriterThreads();
    assert(writers.size() == 1);
    assert(writers.count(callback_thread) == 0);
    assert(writers.count(std::this_thread::get_id()) == 0);
    std::filesystem::remove_all(dir, ec);
  }

  // Destroying the manager with a fetch outstanding: the late reply is dropped.
  {
    Harness h;
    h.http.hold = true;
    h.http.SetResponse("https://dl.example/late.txt",
                       MakeResponse(200, Bytes("late")));
    MessageRecord incoming;
    incoming.id = "in3";
    incoming.incoming = true;
    incoming.text = "https://dl.example/late.txt";
    std::atomic<int> calls{0};
    h.manager->CreateAndDownloadItemsIfNeeded(
        incoming, [&calls](const DownloadResult&) { ++calls; });
    for (int i = 0; i < 500 && h.http.RequestCount() == 0; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(h.http.RequestCount() == 1);
    h.manager.reset();
    assert(h.http.CompletePending() == 1);
    assert(calls.load() == 0);
    assert(h.store.MediaCount() == 0);
    assert(h.blobs.Count() == 0);
  }

  return 0;
}
