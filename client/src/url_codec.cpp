#include "url_codec.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <vector>

#include "hex_utils.h"
#include "secure_buffer.h"

namespace sft::transfer {

namespace {

struct UrlDeleter {
  void operator()(CURLU* u) const { curl_url_cleanup(u); }
};
using UrlHandle = std::unique_ptr<CURLU, UrlDeleter>;

struct CurlStringDeleter {
  void operator()(char* p) const { curl_free(p); }
};
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

bool EqualsIgnoreCase(const char* a, const char* b) {
  if (!a || !b) {
    return false;
  }
  const std::size_t len = std::strlen(a);
  if (len != std::strlen(b)) {
    return false;
  }
  for (std::size_t i = 0; i < len; ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

UrlHandle Parse(const std::string& url) {
  if (url.empty()) {
    return nullptr;
  }
  UrlHandle h(curl_url());
  if (!h) {
    return nullptr;
  }
  if (curl_url_set(h.get(), CURLUPART_URL, url.c_str(),
                   CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
    return nullptr;
  }
  return h;
}

bool GetPart(CURLU* h, CURLUPart part, std::string& out,
             unsigned int flags = 0) {
  out.clear();
  char* raw = nullptr;
  if (curl_url_get(h, part, &raw, flags) != CURLUE_OK || !raw) {
    return false;
  }
  CurlString holder(raw);
  out.assign(raw);
  return true;
}

bool SchemeIs(CURLU* h, const char* scheme) {
  std::string current;
  return GetPart(h, CURLUPART_SCHEME, current) &&
         EqualsIgnoreCase(current.c_str(), scheme);
}

bool SetScheme(CURLU* h, const char* scheme) {
  return curl_url_set(h, CURLUPART_SCHEME, scheme, CURLU_NON_SUPPORT_SCHEME) ==
         CURLUE_OK;
}

}  // namespace

bool UrlCodec::EmbedKey(const std::string& base_read_url,
                        const CryptoEnvelope::Iv& iv,
                        const CryptoEnvelope::Key& key,
                        std::string& out_url,
                        TransferError& error) {
  out_url.clear();
  UrlHandle h = Parse(base_read_url);
  if (!h) {
    error.Set(TransferErrorKind::kUrlFormatting, "read url unparsable");
    return false;
  }
  if (!SchemeIs(h.get(), kPlainScheme)) {
    error.Set(TransferErrorKind::kUrlFormatting, "read url is not https");
    return false;
  }

  std::vector<std::uint8_t> material;
  material.reserve(kFragmentKeyMaterialSize);
  material.insert(material.end(), iv.begin(), iv.end());
  material.insert(material.end(), key.begin(), key.end());
  std::string fragment = common::BytesToHexLower(material);
  common::SecureWipe(material);

  const bool composed =
      SetScheme(h.get(), kMarkerScheme) &&
      curl_url_set(h.get(), CURLUPART_FRAGMENT, fragment.c_str(), 0) ==
          CURLUE_OK &&
      GetPart(h.get(), CURLUPART_URL, out_url);
  common::SecureWipe(fragment);
  if (!composed) {
    out_url.clear();
    error.Set(TransferErrorKind::kUrlFormatting, "encrypted url not composable");
    return false;
  }
  return true;
}

std::optional<Envelope> UrlCodec::ExtractKey(const std::string& url) {
  UrlHandle h = Parse(url);
  if (!h || !SchemeIs(h.get(), kMarkerScheme)) {
    return std::nullopt;
  }
  std::string fragment;
  if (!GetPart(h.get(), CURLUPART_FRAGMENT, fragment)) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> material;
  const bool decoded = common::HexToBytes(fragment, material);
  common::SecureWipe(fragment);
  if (!decoded || material.size() != kFragmentKeyMaterialSize) {
    common::SecureWipe(material);
    return std::nullopt;
  }
  Envelope env;
  std::copy(material.begin(), material.begin() + kEnvelopeIvSize,
            env.iv.begin());
  std::copy(material.begin() + kEnvelopeIvSize, material.end(),
            env.key.begin());
  common::SecureWipe(material);
  return env;
}

bool UrlCodec::NormalizeForFetch(const std::string& url,
                                 std::string& out_url,
                                 TransferError& error) {
  out_url.clear();
  UrlHandle h = Parse(url);
  if (!h) {
    error.Set(TransferErrorKind::kUrlFormatting, "url unparsable");
    return false;
  }
  if (!SchemeIs(h.get(), kMarkerScheme)) {
    out_url = url;
    return true;
  }
  if (!SetScheme(h.get(), kPlainScheme) ||
      !GetPart(h.get(), CURLUPART_URL, out_url)) {
    out_url.clear();
    error.Set(TransferErrorKind::kUrlFormatting, "url not recomposable");
    return false;
  }
  return true;
}

bool UrlCodec::DedupeKey(const std::string& url,
                         std::string& out_key,
                         TransferError& error) {
  out_key.clear();
  UrlHandle h = Parse(url);
  if (!h) {
    error.Set(TransferErrorKind::kUrlFormatting, "url unparsable");
    return false;
  }
  if (SchemeIs(h.get(), kMarkerScheme) && !SetScheme(h.get(), kPlainScheme)) {
    error.Set(TransferErrorKind::kUrlFormatting, "url not recomposable");
    return false;
  }
  if (curl_url_set(h.get(), CURLUPART_FRAGMENT, nullptr, 0) != CURLUE_OK ||
      !GetPart(h.get(), CURLUPART_URL, out_key)) {
    out_key.clear();
    error.Set(TransferErrorKind::kUrlFormatting, "url not recomposable");
    return false;
  }
  return true;
}

bool UrlCodec::IsMarkerUrl(const std::string& url) {
  UrlHandle h = Parse(url);
  return h && SchemeIs(h.get(), kMarkerScheme);
}

std::string UrlCodec::LastPathComponent(const std::string& url) {
  UrlHandle h = Parse(url);
  std::string path;
  if (!h || !GetPart(h.get(), CURLUPART_PATH, path, CURLU_URLDECODE)) {
    return {};
  }
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

}  // namespace sft::transfer
