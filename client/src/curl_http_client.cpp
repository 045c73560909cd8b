#include "curl_http_client.h"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <utility>

#include "platform_log.h"

namespace sft::transfer {

namespace plog = sft::platform::log;

namespace {

constexpr char kLogTag[] = "http";
constexpr long kMaxRedirects = 5;

struct EasyDeleter {
  void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

struct SlistDeleter {
  void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

bool GlobalInit() {
  static std::once_flag once;
  static bool ready = false;
  std::call_once(once, [] {
    ready = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
  });
  return ready;
}

struct BodySink {
  std::vector<std::uint8_t>* out{nullptr};
  std::uint64_t limit{0};
  bool overflow{false};
};

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* sink = static_cast<BodySink*>(userdata);
  const std::size_t len = size * nmemb;
  if (sink->limit != 0 && sink->out->size() + len > sink->limit) {
    sink->overflow = true;
    return 0;
  }
  sink->out->insert(sink->out->end(), reinterpret_cast<std::uint8_t*>(ptr),
                    reinterpret_cast<std::uint8_t*>(ptr) + len);
  return len;
}

struct BodySource {
  const std::vector<std::uint8_t>* in{nullptr};
  std::size_t offset{0};
};

size_t ReadBody(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* src = static_cast<BodySource*>(userdata);
  const std::size_t room = size * nitems;
  const std::size_t left = src->in->size() - src->offset;
  const std::size_t n = std::min(room, left);
  if (n > 0) {
    std::memcpy(buffer, src->in->data() + src->offset, n);
    src->offset += n;
  }
  return n;
}

bool AppendHeader(HeaderList& list, const std::string& line) {
  curl_slist* next = curl_slist_append(list.get(), line.c_str());
  if (!next) {
    return false;
  }
  list.release();
  list.reset(next);
  return true;
}

class OptionSetter {
 public:
  explicit OptionSetter(CURL* h) : h_(h) {}

  template <typename T>
  void Set(CURLoption option, T value) {
    if (rc_ == CURLE_OK) {
      rc_ = curl_easy_setopt(h_, option, value);
    }
  }

  CURLcode result() const { return rc_; }

 private:
  CURL* h_;
  CURLcode rc_{CURLE_OK};
};

}  // namespace

CurlHttpClient::CurlHttpClient(HttpOptions options)
    : options_(std::move(options)), io_("http", options_.threads) {}

CurlHttpClient::~CurlHttpClient() { Stop(); }

bool CurlHttpClient::Start(std::string& error) {
  if (!GlobalInit()) {
    error = "curl global init failed";
    return false;
  }
  if (!options_.verify_tls && !options_.allow_insecure_http) {
    error = "tls verification may only be disabled with insecure http";
    return false;
  }
  return io_.Start();
}

void CurlHttpClient::Stop() { io_.Stop(); }

void CurlHttpClient::Send(HttpRequest request, HttpCallback done) {
  if (!done) {
    return;
  }
  auto req = std::make_shared<HttpRequest>(std::move(request));
  auto cb = std::make_shared<HttpCallback>(std::move(done));
  const bool queued = io_.Post([this, req, cb] { (*cb)(Perform(*req)); });
  if (!queued) {
    HttpResponse response;
    response.error = "http transport stopped";
    (*cb)(std::move(response));
  }
}

HttpResponse CurlHttpClient::Perform(const HttpRequest& request) const {
  HttpResponse response;
  if (!GlobalInit()) {
    response.error = "curl global init failed";
    return response;
  }
  EasyHandle curl(curl_easy_init());
  if (!curl) {
    response.error = "curl init failed";
    return response;
  }

  char errbuf[CURL_ERROR_SIZE] = {0};
  const char* protocols = options_.allow_insecure_http ? "http,https" : "https";
  BodySink sink{&response.body, options_.max_download_bytes, false};
  BodySource source{&request.body, 0};
  HeaderList headers;

  OptionSetter opt(curl.get());
  opt.Set(CURLOPT_ERRORBUFFER, errbuf);
  opt.Set(CURLOPT_URL, request.url.c_str());
  opt.Set(CURLOPT_PROTOCOLS_STR, protocols);
  opt.Set(CURLOPT_REDIR_PROTOCOLS_STR, protocols);
  opt.Set(CURLOPT_NOSIGNAL, 1L);
  opt.Set(CURLOPT_USERAGENT, options_.user_agent.c_str());
  opt.Set(CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
  opt.Set(CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
  if (options_.connect_timeout_ms != 0) {
    opt.Set(CURLOPT_CONNECTTIMEOUT_MS,
            static_cast<long>(options_.connect_timeout_ms));
  }
  if (options_.transfer_timeout_ms != 0) {
    opt.Set(CURLOPT_TIMEOUT_MS, static_cast<long>(options_.transfer_timeout_ms));
  }
  if (options_.max_download_bytes != 0) {
    opt.Set(CURLOPT_MAXFILESIZE_LARGE,
            static_cast<curl_off_t>(options_.max_download_bytes));
  }
  opt.Set(CURLOPT_WRITEFUNCTION, WriteBody);
  opt.Set(CURLOPT_WRITEDATA, &sink);

  bool headers_ok = true;
  if (request.method == HttpMethod::kPut) {
    opt.Set(CURLOPT_UPLOAD, 1L);
    opt.Set(CURLOPT_READFUNCTION, ReadBody);
    opt.Set(CURLOPT_READDATA, &source);
    opt.Set(CURLOPT_INFILESIZE_LARGE,
            static_cast<curl_off_t>(request.body.size()));
    headers_ok = AppendHeader(headers, "Expect:");
    if (headers_ok && !request.content_type.empty()) {
      headers_ok = AppendHeader(headers, "Content-Type: " + request.content_type);
    }
  } else {
    opt.Set(CURLOPT_HTTPGET, 1L);
    opt.Set(CURLOPT_FOLLOWLOCATION, 1L);
    opt.Set(CURLOPT_MAXREDIRS, kMaxRedirects);
  }
  for (const auto& header : request.headers) {
    if (!headers_ok) {
      break;
    }
    headers_ok = AppendHeader(headers, header.first + ": " + header.second);
  }
  if (headers.get()) {
    opt.Set(CURLOPT_HTTPHEADER, headers.get());
  }
  if (!headers_ok) {
    response.error = "header list allocation failed";
    return response;
  }
  if (opt.result() != CURLE_OK) {
    response.error = curl_easy_strerror(opt.result());
    return response;
  }

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    if (sink.overflow) {
      response.error = "response exceeds download limit";
    } else {
      response.error = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
    }
    response.body.clear();
    plog::Log(plog::Level::kWarn, kLogTag, "transfer failed",
              {{"url", request.url}, {"error", response.error}});
    return response;
  }

  long status = 0;
  if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status) !=
      CURLE_OK) {
    response.error = "status unavailable";
    response.body.clear();
    return response;
  }
  char* content_type = nullptr;
  if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type) ==
          CURLE_OK &&
      content_type) {
    response.content_type = content_type;
  }
  response.transport_ok = true;
  response.status = status;
  return response;
}

}  // namespace sft::transfer
