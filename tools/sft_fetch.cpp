#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "crypto_envelope.h"
#include "curl_http_client.h"
#include "platform_fs.h"
#include "platform_log.h"
#include "secure_buffer.h"
#include "transfer_config.h"
#include "url_codec.h"

namespace {

struct Options {
  std::string url;
  std::filesystem::path output;
  std::string config_path;
  bool verbose{false};
  bool show_help{false};
};

void PrintUsage() {
  std::cout
      << "Usage: sft_fetch [--config PATH] [--out PATH] [--verbose] URL\n"
         "  URL             https:// or aesgcm:// shareable link\n"
         "  --config PATH   Transfer config (http section is used)\n"
         "  --out PATH      Output file (default: last path component)\n"
         "  --verbose       Debug logging\n";
}

bool ParseArgs(int argc, char** argv, Options& out, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      out.show_help = true;
      return true;
    }
    if (arg == "--config") {
      if (i + 1 >= argc) {
        error = "--config requires a value";
        return false;
      }
      out.config_path = argv[++i];
      continue;
    }
    if (arg == "--out") {
      if (i + 1 >= argc) {
        error = "--out requires a value";
        return false;
      }
      out.output = argv[++i];
      continue;
    }
    if (arg == "--verbose") {
      out.verbose = true;
      continue;
    }
    if (!arg.empty() && arg.front() == '-') {
      error = "unknown argument: " + arg;
      return false;
    }
    if (!out.url.empty()) {
      error = "only one URL may be given";
      return false;
    }
    out.url = arg;
  }
  if (out.url.empty()) {
    error = "URL missing";
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  using sft::transfer::CryptoEnvelope;
  using sft::transfer::CurlHttpClient;
  using sft::transfer::HttpMethod;
  using sft::transfer::HttpRequest;
  using sft::transfer::TransferConfig;
  using sft::transfer::TransferError;
  using sft::transfer::UrlCodec;

  Options opts;
  std::string error;
  if (!ParseArgs(argc, argv, opts, error)) {
    std::cerr << "sft_fetch: " << error << "\n";
    PrintUsage();
    return 2;
  }
  if (opts.show_help) {
    PrintUsage();
    return 0;
  }
  if (opts.verbose) {
    sft::platform::log::SetMinLevel(sft::platform::log::Level::kDebug);
  }

  TransferConfig config;
  if (!opts.config_path.empty() &&
      !sft::transfer::LoadTransferConfig(opts.config_path, config, error)) {
    std::cerr << "sft_fetch: " << error << "\n";
    return 2;
  }

  TransferError terr;
  HttpRequest request;
  request.method = HttpMethod::kGet;
  if (!UrlCodec::NormalizeForFetch(opts.url, request.url, terr)) {
    std::cerr << "sft_fetch: " << terr.detail << "\n";
    return 2;
  }
  if (opts.output.empty()) {
    const std::string name = UrlCodec::LastPathComponent(opts.url);
    opts.output = name.empty() ? std::string("download.bin") : name;
  }

  CurlHttpClient http(config.http);
  const auto response = http.Perform(request);
  if (!response.transport_ok) {
    std::cerr << "sft_fetch: " << response.error << "\n";
    return 1;
  }
  if (response.status < 200 || response.status >= 300) {
    std::cerr << "sft_fetch: HTTP status " << response.status << "\n";
    return 1;
  }

  std::vector<std::uint8_t> body = response.body;
  auto envelope = UrlCodec::ExtractKey(opts.url);
  if (envelope) {
    std::vector<std::uint8_t> plain;
    const bool ok = CryptoEnvelope::Decrypt(body, envelope->key, envelope->iv,
                                            plain, terr);
    sft::common::SecureWipe(envelope->key);
    sft::common::SecureWipe(envelope->iv);
    if (!ok) {
      std::cerr << "sft_fetch: " << terr.detail << "\n";
      return 1;
    }
    body.swap(plain);
  }

  std::error_code ec;
  if (!sft::platform::fs::AtomicWrite(opts.output, body.data(), body.size(),
                                      ec)) {
    std::cerr << "sft_fetch: write failed: " << ec.message() << "\n";
    return 1;
  }
  std::cout << opts.output.string() << " (" << body.size() << " bytes"
            << (envelope ? ", decrypted" : "") << ")\n";
  return 0;
}
