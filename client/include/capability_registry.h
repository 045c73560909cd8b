#ifndef SFT_CLIENT_CAPABILITY_REGISTRY_H
#define SFT_CLIENT_CAPABILITY_REGISTRY_H

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "discovery_transport.h"
#include "task_queue.h"
#include "transfer_types.h"

namespace sft::transfer {

inline constexpr const char kDefaultUploadNamespace[] = "urn:xmpp:http:upload:0";

using ServiceList = std::vector<Service>;
using ServiceSnapshot = std::shared_ptr<const ServiceList>;
using SnapshotListener = std::function<void(const ServiceSnapshot&)>;

// Feature advertised for |upload_namespace| in |info|.
bool SupportsUpload(const DiscoInfo& info, const std::string& upload_namespace);
// Ceiling declared by a form that also names |upload_namespace|, 0 if none.
std::uint64_t MaxUploadSize(const DiscoInfo& info,
                            const std::string& upload_namespace);

// Derives a Service per record that supports upload with a positive ceiling,
// preserving discovery order.
ServiceList BuildServices(const std::vector<CapabilityRecord>& records,
                          const std::string& upload_namespace);

class CapabilityRegistry {
 public:
  // |worker| runs the rebuilds; |notify| delivers listener callbacks.
  CapabilityRegistry(DiscoveryTransport& transport,
                     Executor& worker,
                     Executor& notify,
                     std::string upload_namespace = kDefaultUploadNamespace);

  CapabilityRegistry(const CapabilityRegistry&) = delete;
  CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

  void Refresh();
  // Replaces the snapshot and returns it.
  ServiceSnapshot Rebuild(const std::vector<CapabilityRecord>& records);

  ServiceSnapshot Snapshot() const;
  std::optional<Service> BestService() const;
  bool CanUpload() const;

  std::uint64_t Subscribe(SnapshotListener listener);
  void Unsubscribe(std::uint64_t id);

 private:
  void Publish(const ServiceSnapshot& snapshot);

  DiscoveryTransport& transport_;
  Executor& worker_;
  Executor& notify_;
  std::string upload_namespace_;

  ServiceSnapshot snapshot_;

  std::mutex listeners_mutex_;
  std::uint64_t next_listener_id_{1};
  std::unordered_map<std::uint64_t, SnapshotListener> listeners_;

  // Last member: revoked before the rest is torn down.
  Lifeline lifeline_;
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_CAPABILITY_REGISTRY_H
