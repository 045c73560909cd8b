#include "mime_types.h"

#include <cctype>
#include <filesystem>

namespace sft::transfer {

namespace {

struct MimeEntry {
  const char* extension;
  const char* mime;
};

constexpr MimeEntry kMimeTable[] = {
    {"jpg", "image/jpeg"},       {"jpeg", "image/jpeg"},
    {"png", "image/png"},        {"gif", "image/gif"},
    {"webp", "image/webp"},      {"heic", "image/heic"},
    {"bmp", "image/bmp"},        {"m4a", "audio/mp4"},
    {"aac", "audio/aac"},        {"mp3", "audio/mpeg"},
    {"ogg", "audio/ogg"},        {"opus", "audio/ogg"},
    {"wav", "audio/wav"},        {"mp4", "video/mp4"},
    {"m4v", "video/x-m4v"},      {"mov", "video/quicktime"},
    {"webm", "video/webm"},      {"pdf", "application/pdf"},
    {"txt", "text/plain"},       {"zip", "application/zip"},
};

}  // namespace

std::string MimeTypeForExtension(std::string_view extension) {
  if (!extension.empty() && extension.front() == '.') {
    extension.remove_prefix(1);
  }
  std::string lower;
  lower.reserve(extension.size());
  for (const char ch : extension) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  for (const auto& entry : kMimeTable) {
    if (lower == entry.extension) {
      return entry.mime;
    }
  }
  return kDefaultMimeType;
}

std::string MimeTypeForPath(std::string_view path) {
  const std::filesystem::path p{std::string(path)};
  return MimeTypeForExtension(p.extension().string());
}

}  // namespace sft::transfer
