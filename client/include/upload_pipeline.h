#ifndef SFT_CLIENT_UPLOAD_PIPELINE_H
#define SFT_CLIENT_UPLOAD_PIPELINE_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "capability_registry.h"
#include "http_client.h"
#include "media_store.h"
#include "slot_negotiator.h"
#include "task_queue.h"
#include "transfer_types.h"

namespace sft::transfer {

enum class UploadState : std::uint8_t {
  kIdle = 0,
  kSourceResolved,
  kServiceSelected,
  kSizeChecked,
  kEncrypted,
  kSlotRequested,
  kTransferred,
  kFinalized,
  kFailed,
};

const char* UploadStateName(UploadState state);

// Runs one upload per request: resolve the payload, pick the service, check
// the ceiling, optionally encrypt, negotiate a slot, PUT, build the shareable
// URL. Orchestration runs on |worker|; the completion runs on |notify|.
// Transport callbacks that arrive after destruction are dropped.
class UploadPipeline {
 public:
  UploadPipeline(CapabilityRegistry& registry,
                 SlotNegotiator& negotiator,
                 HttpClient& http,
                 MediaBlobStore& blobs,
                 Executor& worker,
                 Executor& notify);

  UploadPipeline(const UploadPipeline&) = delete;
  UploadPipeline& operator=(const UploadPipeline&) = delete;

  // |done| fires exactly once.
  void Upload(UploadRequest request, UploadCallback done);

 private:
  struct Job;
  using JobPtr = std::shared_ptr<Job>;

  void Run(const JobPtr& job);
  bool ResolveSource(Job& job, TransferError& error);
  bool SelectService(Job& job, TransferError& error);
  bool CheckSize(Job& job, TransferError& error);
  bool EncryptPayload(Job& job, TransferError& error);
  void RequestSlot(const JobPtr& job);
  void OnSlot(const JobPtr& job, const SlotResult& result);
  void OnPut(const JobPtr& job, const HttpResponse& response);
  bool Finalize(Job& job, TransferError& error);

  // Posts |step| to the worker, failing the job if the worker is gone.
  void Continue(const JobPtr& job, std::function<void()> step);
  void Fail(const JobPtr& job, const TransferError& error);
  void Complete(const JobPtr& job, UploadResult result);

  CapabilityRegistry& registry_;
  SlotNegotiator& negotiator_;
  HttpClient& http_;
  MediaBlobStore& blobs_;
  Executor& worker_;
  Executor& notify_;
  std::atomic<std::uint64_t> next_job_id_{1};

  // Last member: revoked before the rest is torn down.
  Lifeline lifeline_;
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_UPLOAD_PIPELINE_H
