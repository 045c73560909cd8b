#ifndef SFT_CLIENT_MIME_TYPES_H
#define SFT_CLIENT_MIME_TYPES_H

#include <string>
#include <string_view>

namespace sft::transfer {

inline constexpr const char kDefaultMimeType[] = "application/octet-stream";

// |extension| may carry a leading dot; matching is case-insensitive.
std::string MimeTypeForExtension(std::string_view extension);
std::string MimeTypeForPath(std::string_view path);

}  // namespace sft::transfer

#endif  // SFT_CLIENT_MIME_TYPES_H
