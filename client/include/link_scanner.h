#ifndef SFT_CLIENT_LINK_SCANNER_H
#define SFT_CLIENT_LINK_SCANNER_H

#include <string>
#include <string_view>
#include <vector>

namespace sft::transfer {

// Links in |text| whose scheme is https or aesgcm, in order of appearance.
// The scheme is returned in lower case.
std::vector<std::string> ExtractDownloadableUrls(std::string_view text);

}  // namespace sft::transfer

#endif  // SFT_CLIENT_LINK_SCANNER_H
