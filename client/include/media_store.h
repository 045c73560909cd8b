#ifndef SFT_CLIENT_MEDIA_STORE_H
#define SFT_CLIENT_MEDIA_STORE_H

#include <cstdint>
#include <string>
#include <vector>

#include "transfer_types.h"

namespace sft::transfer {

struct MessageLoadResult {
  bool found{false};
  MessageRecord record;
};

struct MediaItemLoadResult {
  bool found{false};
  MediaItem item;
};

// Persistence of message, download and media item records. Methods return
// false only on store failure; a missing row is reported through |found|.
class MessageStore {
 public:
  virtual ~MessageStore() = default;

  virtual bool LoadMessage(const std::string& id, MessageLoadResult& out,
                           std::string& error) = 0;
  virtual bool SaveMessage(const MessageRecord& record, std::string& error) = 0;
  virtual bool LoadMediaItem(const std::string& id, MediaItemLoadResult& out,
                             std::string& error) = 0;
  virtual bool SaveMediaItem(const MediaItem& item, std::string& error) = 0;
  // Download records whose parent_message_id equals |parent_id|.
  virtual bool LoadDownloads(const std::string& parent_id,
                             std::vector<MessageRecord>& out,
                             std::string& error) = 0;
  // Hands an outgoing message to the chat layer for delivery.
  virtual bool QueueOutgoing(const MessageRecord& record,
                             std::string& error) = 0;
};

class MediaBlobStore {
 public:
  virtual ~MediaBlobStore() = default;

  virtual bool Put(const std::vector<std::uint8_t>& bytes,
                   std::string& out_locator, std::string& error) = 0;
  virtual bool Get(const std::string& locator,
                   std::vector<std::uint8_t>& out_bytes,
                   std::string& error) = 0;
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_MEDIA_STORE_H
