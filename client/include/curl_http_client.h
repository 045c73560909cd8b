#ifndef SFT_CLIENT_CURL_HTTP_CLIENT_H
#define SFT_CLIENT_CURL_HTTP_CLIENT_H

#include <cstdint>
#include <string>

#include "http_client.h"
#include "task_queue.h"

namespace sft::transfer {

struct HttpOptions {
  std::uint32_t threads{2};
  // 0 keeps the libcurl default.
  std::uint32_t connect_timeout_ms{0};
  std::uint32_t transfer_timeout_ms{0};
  // 0 means unlimited.
  std::uint64_t max_download_bytes{0};
  std::string user_agent{"sft/1.0"};
  bool allow_insecure_http{false};
  bool verify_tls{true};
};

// libcurl easy handles driven from a private pool of transport threads.
class CurlHttpClient : public HttpClient {
 public:
  explicit CurlHttpClient(HttpOptions options = HttpOptions{});
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  bool Start(std::string& error);
  // Finishes transfers already queued, then joins the transport threads.
  void Stop() override;

  void Send(HttpRequest request, HttpCallback done) override;

  // Blocking variant used by Send() and command line tools.
  HttpResponse Perform(const HttpRequest& request) const;

 private:
  HttpOptions options_;
  TaskQueue io_;
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_CURL_HTTP_CLIENT_H
