#include "slot_negotiator.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <memory>
#include <utility>

#include "platform_log.h"

namespace sft::transfer {

namespace plog = sft::platform::log;

namespace {

constexpr char kLogTag[] = "slot";

bool IsAllowedPutHeader(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower == "authorization" || lower == "cookie" || lower == "expires";
}

bool HasLineBreak(const std::string& text) {
  return text.find_first_of("\r\n") != std::string::npos;
}

}  // namespace

void FilterPutHeaders(UploadSlot& slot) {
  auto& headers = slot.put_headers;
  headers.erase(std::remove_if(headers.begin(), headers.end(),
                               [](const std::pair<std::string, std::string>& h) {
                                 return !IsAllowedPutHeader(h.first) ||
                                        HasLineBreak(h.second);
                               }),
                headers.end());
}

void SlotNegotiator::RequestSlot(const Service& service,
                                 const std::string& filename,
                                 std::uint64_t size,
                                 const std::string& content_type,
                                 SlotCallback done) {
  if (!done) {
    return;
  }
  if (service.address.empty() || filename.empty()) {
    SlotResult result;
    result.error.Set(TransferErrorKind::kNoSlot, "invalid slot request");
    done(result);
    return;
  }

  SlotRequest request;
  request.service_address = service.address;
  request.filename = filename;
  request.size = size;
  request.content_type = content_type;

  auto fired = std::make_shared<std::atomic<bool>>(false);
  auto callback = std::make_shared<SlotCallback>(std::move(done));
  const std::string address = service.address;
  transport_.SendSlotRequest(
      request, [fired, callback, address](SlotExchangeResult exchange) {
        if (fired->exchange(true)) {
          plog::Log(plog::Level::kWarn, kLogTag, "duplicate slot response",
                    {{"service", address}});
          return;
        }
        SlotResult result;
        if (!exchange.ok) {
          const std::string reason =
              exchange.error.empty() ? "slot request failed" : exchange.error;
          plog::Log(plog::Level::kError, kLogTag, "service refused slot",
                    {{"service", address}, {"error", reason}});
          result.error.Set(TransferErrorKind::kNoSlot, reason);
        } else if (exchange.slot.put_url.empty() ||
                   exchange.slot.get_url.empty()) {
          plog::Log(plog::Level::kError, kLogTag, "slot missing locations",
                    {{"service", address}});
          result.error.Set(TransferErrorKind::kNoSlot, "incomplete slot");
        } else {
          result.success = true;
          result.slot = std::move(exchange.slot);
          FilterPutHeaders(result.slot);
        }
        (*callback)(result);
      });
}

}  // namespace sft::transfer
