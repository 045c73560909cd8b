#include "transfer_config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string>

namespace sft::transfer {

namespace {

std::string Trim(const std::string& s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint64(const std::string& text, std::uint64_t& out) {
  if (text.empty() || text.front() == '-' || text.front() == '+') return false;
  char* end_ptr = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || errno == ERANGE) {
    return false;
  }
  out = static_cast<std::uint64_t>(v);
  return true;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  std::uint64_t v = 0;
  if (!ParseUint64(text, v) || v > 0xFFFFFFFFu) return false;
  out = static_cast<std::uint32_t>(v);
  return true;
}

bool ParseBool(const std::string& text, bool& out) {
  if (text == "1" || text == "true" || text == "on") {
    out = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "off") {
    out = false;
    return true;
  }
  return false;
}

std::string InvalidAt(const std::string& key, std::size_t line_no) {
  return "invalid " + key + " at line " + std::to_string(line_no);
}

}  // namespace

bool LoadTransferConfig(const std::string& path, TransferConfig& out_cfg,
                        std::string& error) {
  out_cfg = TransferConfig{};
  std::ifstream f(path);
  if (!f.is_open()) {
    error = "transfer config not found: " + path;
    return false;
  }
  std::string section;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    std::string t = StripInlineComment(Trim(line));
    if (t.empty()) continue;
    if (t.front() == '[' && t.back() == ']') {
      section = Trim(t.substr(1, t.size() - 2));
      continue;
    }
    const auto pos = t.find('=');
    if (pos == std::string::npos) {
      error = "invalid line " + std::to_string(line_no);
      return false;
    }
    const std::string key = Trim(t.substr(0, pos));
    const std::string val = StripInlineComment(Trim(t.substr(pos + 1)));
    bool ok = true;
    if (section == "upload") {
      if (key == "namespace") {
        out_cfg.upload.upload_namespace = val;
      } else if (key == "prefetch_limit_bytes") {
        ok = ParseUint64(val, out_cfg.upload.prefetch_limit_bytes);
      } else if (key == "require_encryption") {
        ok = ParseBool(val, out_cfg.upload.require_encryption);
      }
    } else if (section == "http") {
      if (key == "threads") {
        ok = ParseUint32(val, out_cfg.http.threads);
      } else if (key == "connect_timeout_ms") {
        ok = ParseUint32(val, out_cfg.http.connect_timeout_ms);
      } else if (key == "transfer_timeout_ms") {
        ok = ParseUint32(val, out_cfg.http.transfer_timeout_ms);
      } else if (key == "max_download_bytes") {
        ok = ParseUint64(val, out_cfg.http.max_download_bytes);
      } else if (key == "user_agent") {
        out_cfg.http.user_agent = val;
      } else if (key == "allow_insecure_http") {
        ok = ParseBool(val, out_cfg.http.allow_insecure_http);
      } else if (key == "verify_tls") {
        ok = ParseBool(val, out_cfg.http.verify_tls);
      }
    } else if (section == "storage") {
      if (key == "blob_dir") {
        out_cfg.storage.blob_dir = val;
      } else if (key == "blob_key_path") {
        out_cfg.storage.blob_key_path = val;
      }
    } else if (section == "download") {
      if (key == "auto_download") {
        ok = ParseBool(val, out_cfg.download.auto_download);
      }
    }
    if (!ok) {
      error = InvalidAt(key, line_no);
      return false;
    }
  }
  if (out_cfg.upload.upload_namespace.empty()) {
    error = "upload namespace empty";
    return false;
  }
  if (out_cfg.http.threads == 0) {
    out_cfg.http.threads = 1;
  }
  if (out_cfg.http.threads > 16) {
    out_cfg.http.threads = 16;
  }
  if (!out_cfg.http.verify_tls && !out_cfg.http.allow_insecure_http) {
    error = "verify_tls=0 requires allow_insecure_http=1";
    return false;
  }
  if (out_cfg.storage.blob_dir.empty()) {
    error = "blob_dir missing";
    return false;
  }
  if (out_cfg.storage.blob_key_path.empty()) {
    error = "blob_key_path missing";
    return false;
  }
  return true;
}

}  // namespace sft::transfer
