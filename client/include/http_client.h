#ifndef SFT_CLIENT_HTTP_CLIENT_H
#define SFT_CLIENT_HTTP_CLIENT_H

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace sft::transfer {

enum class HttpMethod : std::uint8_t { kGet = 0, kPut = 1 };

struct HttpRequest {
  HttpMethod method{HttpMethod::kGet};
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string content_type;
  std::vector<std::uint8_t> body;
};

struct HttpResponse {
  // False on transport failure; status/body are then meaningless.
  bool transport_ok{false};
  long status{0};
  std::string content_type;
  std::vector<std::uint8_t> body;
  std::string error;
};

using HttpCallback = std::function<void(HttpResponse)>;

// Asynchronous HTTP transport. Send() returns immediately; |done| fires once
// on a transport thread.
class HttpClient {
 public:
  virtual ~HttpClient() = default;
  virtual void Send(HttpRequest request, HttpCallback done) = 0;
  // Finishes queued requests; later sends fail immediately.
  virtual void Stop() {}
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_HTTP_CLIENT_H
