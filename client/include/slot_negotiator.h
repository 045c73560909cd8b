#ifndef SFT_CLIENT_SLOT_NEGOTIATOR_H
#define SFT_CLIENT_SLOT_NEGOTIATOR_H

#include <cstdint>
#include <functional>
#include <string>

#include "transfer_types.h"

namespace sft::transfer {

struct SlotRequest {
  std::string service_address;
  std::string filename;
  std::uint64_t size{0};
  std::string content_type;
};

struct SlotExchangeResult {
  bool ok{false};
  UploadSlot slot;
  // Protocol error text when the service declined or the exchange failed.
  std::string error;
};

using SlotExchangeCallback = std::function<void(SlotExchangeResult)>;

// Carries one slot request to a service and its single response back.
class SlotTransport {
 public:
  virtual ~SlotTransport() = default;
  virtual void SendSlotRequest(const SlotRequest& request,
                               SlotExchangeCallback done) = 0;
};

struct SlotResult {
  bool success{false};
  UploadSlot slot;
  TransferError error;
};

using SlotCallback = std::function<void(const SlotResult&)>;

class SlotNegotiator {
 public:
  explicit SlotNegotiator(SlotTransport& transport) : transport_(transport) {}

  // One attempt, no fallback. |done| fires exactly once, on whatever thread
  // the transport completes on.
  void RequestSlot(const Service& service,
                   const std::string& filename,
                   std::uint64_t size,
                   const std::string& content_type,
                   SlotCallback done);

 private:
  SlotTransport& transport_;
};

// Keeps only the PUT headers an upload service may set.
void FilterPutHeaders(UploadSlot& slot);

}  // namespace sft::transfer

#endif  // SFT_CLIENT_SLOT_NEGOTIATOR_H
