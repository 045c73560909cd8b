#include "capability_registry.h"

#include <cctype>
#include <utility>

#include "platform_log.h"

namespace sft::transfer {

namespace plog = sft::platform::log;

namespace {

constexpr char kLogTag[] = "capabilities";
constexpr char kMaxFileSizeVar[] = "max-file-size";

bool ParseSize(const std::string& text, std::uint64_t& out) {
  out = 0;
  if (text.empty() || text.size() > 20) {
    return false;
  }
  std::uint64_t v = 0;
  for (const char ch : text) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) {
      return false;
    }
    const std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
    if (v > (UINT64_MAX - digit) / 10) {
      return false;
    }
    v = v * 10 + digit;
  }
  out = v;
  return true;
}

}  // namespace

bool SupportsUpload(const DiscoInfo& info,
                    const std::string& upload_namespace) {
  for (const auto& feature : info.features) {
    if (feature == upload_namespace) {
      return true;
    }
  }
  return false;
}

std::uint64_t MaxUploadSize(const DiscoInfo& info,
                            const std::string& upload_namespace) {
  for (const auto& form : info.forms) {
    bool names_namespace = false;
    std::uint64_t max_size = 0;
    for (const auto& field : form.fields) {
      if (field.values.empty()) {
        continue;
      }
      for (const auto& value : field.values) {
        if (value == upload_namespace) {
          names_namespace = true;
        }
      }
      if (field.var == kMaxFileSizeVar) {
        std::uint64_t parsed = 0;
        if (ParseSize(field.values.front(), parsed)) {
          max_size = parsed;
        }
      }
    }
    if (names_namespace && max_size > 0) {
      return max_size;
    }
  }
  return 0;
}

ServiceList BuildServices(const std::vector<CapabilityRecord>& records,
                          const std::string& upload_namespace) {
  ServiceList services;
  for (const auto& record : records) {
    if (record.address.empty()) {
      continue;
    }
    if (!SupportsUpload(record.info, upload_namespace)) {
      continue;
    }
    const std::uint64_t max_size = MaxUploadSize(record.info, upload_namespace);
    if (max_size == 0) {
      continue;
    }
    services.push_back(Service{record.address, max_size});
  }
  return services;
}

CapabilityRegistry::CapabilityRegistry(DiscoveryTransport& transport,
                                       Executor& worker,
                                       Executor& notify,
                                       std::string upload_namespace)
    : transport_(transport),
      worker_(worker),
      notify_(notify),
      upload_namespace_(std::move(upload_namespace)),
      snapshot_(std::make_shared<const ServiceList>()) {}

void CapabilityRegistry::Refresh() {
  std::vector<CapabilityRecord> cached;
  if (transport_.CachedCapabilities(cached)) {
    auto records =
        std::make_shared<std::vector<CapabilityRecord>>(std::move(cached));
    if (!worker_.Post([this, records] { Rebuild(*records); })) {
      plog::Log(plog::Level::kWarn, kLogTag, "rebuild not scheduled");
    }
  }
  const Lifeline::Handle alive = lifeline_.handle();
  transport_.FetchAllCapabilities(
      [this, alive](bool ok, std::vector<CapabilityRecord> records,
                    std::string error) {
        if (!ok) {
          plog::Log(plog::Level::kWarn, kLogTag, "discovery failed",
                    {{"error", error}});
          return;
        }
        auto batch = std::make_shared<std::vector<CapabilityRecord>>(
            std::move(records));
        const bool live = alive.Run([this, &batch] {
          if (!worker_.Post([this, batch] { Rebuild(*batch); })) {
            plog::Log(plog::Level::kWarn, kLogTag, "rebuild not scheduled");
          }
        });
        if (!live) {
          plog::Log(plog::Level::kDebug, kLogTag, "discovery after teardown");
        }
      });
}

ServiceSnapshot CapabilityRegistry::Rebuild(
    const std::vector<CapabilityRecord>& records) {
  auto next = std::make_shared<const ServiceList>(
      BuildServices(records, upload_namespace_));
  std::atomic_store(&snapshot_, ServiceSnapshot(next));
  plog::Log(plog::Level::kInfo, kLogTag, "upload services rebuilt",
            {{"records", std::to_string(records.size())},
             {"services", std::to_string(next->size())}});
  Publish(next);
  return next;
}

ServiceSnapshot CapabilityRegistry::Snapshot() const {
  return std::atomic_load(&snapshot_);
}

std::optional<Service> CapabilityRegistry::BestService() const {
  const ServiceSnapshot snap = Snapshot();
  if (!snap || snap->empty()) {
    return std::nullopt;
  }
  return snap->front();
}

bool CapabilityRegistry::CanUpload() const {
  const ServiceSnapshot snap = Snapshot();
  return snap && !snap->empty();
}

std::uint64_t CapabilityRegistry::Subscribe(SnapshotListener listener) {
  if (!listener) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  const std::uint64_t id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void CapabilityRegistry::Unsubscribe(std::uint64_t id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.erase(id);
}

void CapabilityRegistry::Publish(const ServiceSnapshot& snapshot) {
  std::vector<SnapshotListener> targets;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    targets.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
      targets.push_back(entry.second);
    }
  }
  for (auto& listener : targets) {
    if (!notify_.Post([listener, snapshot] { listener(snapshot); })) {
      plog::Log(plog::Level::kWarn, kLogTag, "listener not notified");
    }
  }
}

}  // namespace sft::transfer
