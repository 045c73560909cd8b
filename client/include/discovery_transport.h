#ifndef SFT_CLIENT_DISCOVERY_TRANSPORT_H
#define SFT_CLIENT_DISCOVERY_TRANSPORT_H

#include <functional>
#include <string>
#include <vector>

namespace sft::transfer {

struct FormField {
  std::string var;
  std::vector<std::string> values;
};

// A data form (jabber:x:data) attached to a discovery result.
struct DataForm {
  std::string type;
  std::vector<FormField> fields;
};

struct DiscoInfo {
  std::vector<std::string> features;
  std::vector<DataForm> forms;
};

struct CapabilityRecord {
  std::string address;
  DiscoInfo info;
};

using CapabilityCallback =
    std::function<void(bool ok, std::vector<CapabilityRecord> records,
                       std::string error)>;

// The chat session's capability query mechanism.
class DiscoveryTransport {
 public:
  virtual ~DiscoveryTransport() = default;

  // Capabilities already known to the session, in discovery order. Returns
  // false when nothing has been discovered yet.
  virtual bool CachedCapabilities(std::vector<CapabilityRecord>& out) = 0;

  // Starts a discovery round. |done| fires once, on any thread.
  virtual void FetchAllCapabilities(CapabilityCallback done) = 0;
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_DISCOVERY_TRANSPORT_H
