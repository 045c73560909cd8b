#include "upload_pipeline.h"

#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include "crypto_envelope.h"
#include "mime_types.h"
#include "platform_fs.h"
#include "platform_log.h"
#include "secure_buffer.h"
#include "url_codec.h"

namespace sft::transfer {

namespace plog = sft::platform::log;
namespace pfs = sft::platform::fs;

namespace {

constexpr char kLogTag[] = "upload";
constexpr char kDefaultFilename[] = "attachment";

bool IsPutSuccess(long status) { return status == 200 || status == 201; }

}  // namespace

struct UploadPipeline::Job {
  std::uint64_t id{0};
  UploadRequest request;
  UploadCallback done;
  UploadState state{UploadState::kIdle};
  bool completed{false};

  std::vector<std::uint8_t> payload;
  std::string filename;
  std::string content_type;
  Service service;
  Envelope envelope;
  UploadSlot slot;
  std::string url;

  ~Job() {
    sft::common::SecureWipe(envelope.key);
    sft::common::SecureWipe(envelope.iv);
  }
};

const char* UploadStateName(UploadState state) {
  switch (state) {
    case UploadState::kIdle:
      return "idle";
    case UploadState::kSourceResolved:
      return "source_resolved";
    case UploadState::kServiceSelected:
      return "service_selected";
    case UploadState::kSizeChecked:
      return "size_checked";
    case UploadState::kEncrypted:
      return "encrypted";
    case UploadState::kSlotRequested:
      return "slot_requested";
    case UploadState::kTransferred:
      return "transferred";
    case UploadState::kFinalized:
      return "finalized";
    case UploadState::kFailed:
      return "failed";
  }
  return "unknown";
}

UploadPipeline::UploadPipeline(CapabilityRegistry& registry,
                               SlotNegotiator& negotiator,
                               HttpClient& http,
                               MediaBlobStore& blobs,
                               Executor& worker,
                               Executor& notify)
    : registry_(registry),
      negotiator_(negotiator),
      http_(http),
      blobs_(blobs),
      worker_(worker),
      notify_(notify) {}

void UploadPipeline::Upload(UploadRequest request, UploadCallback done) {
  auto job = std::make_shared<Job>();
  job->id = next_job_id_.fetch_add(1);
  job->request = std::move(request);
  job->done = std::move(done);
  Continue(job, [this, job] { Run(job); });
}

void UploadPipeline::Run(const JobPtr& job) {
  TransferError error;
  if (!ResolveSource(*job, error) || !SelectService(*job, error) ||
      !CheckSize(*job, error) || !EncryptPayload(*job, error)) {
    Fail(job, error);
    return;
  }
  RequestSlot(job);
}

bool UploadPipeline::ResolveSource(Job& job, TransferError& error) {
  TransferSource& source = job.request.source;
  job.filename = job.request.filename;
  job.content_type = job.request.content_type;
  switch (source.kind) {
    case SourceKind::kBytes:
      job.payload = std::move(source.bytes);
      break;
    case SourceKind::kBlobLocator: {
      std::string store_error;
      if (!blobs_.Get(source.blob_locator, job.payload, store_error)) {
        error.Set(TransferErrorKind::kFileNotFound,
                  "blob unavailable: " + store_error);
        return false;
      }
      break;
    }
    case SourceKind::kFilePath: {
      std::error_code ec;
      const std::filesystem::path path(source.file_path);
      if (!pfs::ReadFile(path, job.payload, 0, ec)) {
        error.Set(TransferErrorKind::kFileNotFound,
                  "file unreadable: " + ec.message());
        return false;
      }
      if (job.filename.empty()) {
        job.filename = path.filename().string();
      }
      if (job.content_type.empty()) {
        job.content_type = MimeTypeForPath(source.file_path);
      }
      break;
    }
    case SourceKind::kNone:
      error.Set(TransferErrorKind::kFileNotFound, "no upload source");
      return false;
  }
  if (job.filename.empty()) {
    job.filename = kDefaultFilename;
  }
  if (job.content_type.empty()) {
    job.content_type = kDefaultMimeType;
  }
  job.state = UploadState::kSourceResolved;
  return true;
}

bool UploadPipeline::SelectService(Job& job, TransferError& error) {
  const auto service = registry_.BestService();
  if (!service) {
    error.Set(TransferErrorKind::kNoServers, "no upload service known");
    return false;
  }
  job.service = *service;
  job.state = UploadState::kServiceSelected;
  return true;
}

bool UploadPipeline::CheckSize(Job& job, TransferError& error) {
  const std::uint64_t plain = job.payload.size();
  const std::uint64_t wire =
      job.request.should_encrypt ? CryptoEnvelope::FramedSize(plain) : plain;
  if (wire > job.service.max_upload_size) {
    error.Set(TransferErrorKind::kExceedsMaxSize,
              std::to_string(wire) + " > " +
                  std::to_string(job.service.max_upload_size));
    return false;
  }
  job.state = UploadState::kSizeChecked;
  return true;
}

bool UploadPipeline::EncryptPayload(Job& job, TransferError& error) {
  if (!job.request.should_encrypt) {
    return true;
  }
  if (!CryptoEnvelope::Generate(job.envelope, error)) {
    return false;
  }
  std::vector<std::uint8_t> framed;
  if (!CryptoEnvelope::Encrypt(job.payload, job.envelope.key, job.envelope.iv,
                               framed, error)) {
    return false;
  }
  sft::common::SecureWipe(job.payload);
  job.payload = std::move(framed);
  job.state = UploadState::kEncrypted;
  return true;
}

void UploadPipeline::RequestSlot(const JobPtr& job) {
  job->state = UploadState::kSlotRequested;
  plog::Log(plog::Level::kDebug, kLogTag, "requesting slot",
            {{"job", std::to_string(job->id)},
             {"service", job->service.address},
             {"size", std::to_string(job->payload.size())}});
  const Lifeline::Handle alive = lifeline_.handle();
  negotiator_.RequestSlot(
      job->service, job->filename, job->payload.size(), job->content_type,
      [this, alive, job](const SlotResult& result) {
        const bool live = alive.Run([this, &job, &result] {
          Continue(job, [this, job, result] { OnSlot(job, result); });
        });
        if (!live) {
          plog::Log(plog::Level::kDebug, kLogTag, "slot after teardown");
        }
      });
}

void UploadPipeline::OnSlot(const JobPtr& job, const SlotResult& result) {
  if (!result.success) {
    Fail(job, result.error);
    return;
  }
  job->slot = result.slot;

  HttpRequest put;
  put.method = HttpMethod::kPut;
  put.url = job->slot.put_url;
  put.headers = job->slot.put_headers;
  put.content_type = job->content_type;
  put.body = std::move(job->payload);
  job->payload.clear();
  const Lifeline::Handle alive = lifeline_.handle();
  http_.Send(std::move(put), [this, alive, job](HttpResponse response) {
    auto shared = std::make_shared<HttpResponse>(std::move(response));
    const bool live = alive.Run([this, &job, &shared] {
      Continue(job, [this, job, shared] { OnPut(job, *shared); });
    });
    if (!live) {
      plog::Log(plog::Level::kDebug, kLogTag, "put finished after teardown");
    }
  });
}

void UploadPipeline::OnPut(const JobPtr& job, const HttpResponse& response) {
  TransferError error;
  if (!response.transport_ok) {
    error.Set(TransferErrorKind::kServerError,
              "put failed: " + response.error);
    Fail(job, error);
    return;
  }
  if (!IsPutSuccess(response.status)) {
    error.Set(TransferErrorKind::kServerError,
              "put status " + std::to_string(response.status));
    Fail(job, error);
    return;
  }
  job->state = UploadState::kTransferred;
  if (!Finalize(*job, error)) {
    Fail(job, error);
    return;
  }
  UploadResult result;
  result.success = true;
  result.url = job->url;
  plog::Log(plog::Level::kInfo, kLogTag, "upload finished",
            {{"job", std::to_string(job->id)}, {"url", job->url}});
  Complete(job, std::move(result));
}

bool UploadPipeline::Finalize(Job& job, TransferError& error) {
  if (job.request.should_encrypt) {
    if (!UrlCodec::EmbedKey(job.slot.get_url, job.envelope.iv,
                            job.envelope.key, job.url, error)) {
      return false;
    }
  } else {
    job.url = job.slot.get_url;
  }
  job.state = UploadState::kFinalized;
  return true;
}

void UploadPipeline::Continue(const JobPtr& job, std::function<void()> step) {
  if (worker_.Post(std::move(step))) {
    return;
  }
  TransferError error;
  error.Set(TransferErrorKind::kUnknown, "worker stopped");
  Fail(job, error);
}

void UploadPipeline::Fail(const JobPtr& job, const TransferError& error) {
  plog::Log(plog::Level::kWarn, kLogTag, "upload failed",
            {{"job", std::to_string(job->id)},
             {"state", UploadStateName(job->state)},
             {"kind", TransferErrorKindName(error.kind)},
             {"detail", error.detail}});
  job->state = UploadState::kFailed;
  UploadResult result;
  result.error = error;
  Complete(job, std::move(result));
}

void UploadPipeline::Complete(const JobPtr& job, UploadResult result) {
  if (job->completed) {
    return;
  }
  job->completed = true;
  UploadCallback done = std::move(job->done);
  job->done = nullptr;
  if (!done) {
    return;
  }
  auto shared = std::make_shared<UploadResult>(std::move(result));
  if (!notify_.Post([done, shared] { done(*shared); })) {
    done(*shared);
  }
}

}  // namespace sft::transfer
