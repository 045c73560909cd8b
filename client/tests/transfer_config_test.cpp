#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

#include "transfer_config.h"

using sft::transfer::LoadTransferConfig;
using sft::transfer::TransferConfig;

static void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

int main() {
  {
    const std::string path = "tmp_transfer_full.ini";
    WriteFile(path,
              "# transfer settings\n"
              "[upload]\n"
              "namespace = urn:xmpp:http:upload:0  ; current\n"
              "prefetch_limit_bytes=2048\n"
              "require_encryption=on\n"
              "[http]\nthreads=4\nconnect_timeout_ms=5000\n"
              "transfer_timeout_ms=60000\nmax_download_bytes=104857600\n"
              "user_agent=sft-test/2\n"
              "[storage]\nblob_dir=/var/lib/sft/blobs\n"
              "blob_key_path=/var/lib/sft/blob.key\n"
              "[download]\nauto_download=false\n"
              "[unknown]\nwhatever=1\n");
    TransferConfig cfg;
    std::string err;
    assert(LoadTransferConfig(path, cfg, err));
    assert(cfg.upload.upload_namespace == "urn:xmpp:http:upload:0");
    assert(cfg.upload.prefetch_limit_bytes == 2048);
    assert(cfg.upload.require_encryption);
    assert(cfg.http.threads == 4);
    assert(cfg.http.connect_timeout_ms == 5000);
    assert(cfg.http.transfer_timeout_ms == 60000);
    assert(cfg.http.max_download_bytes == 104857600u);
    assert(cfg.http.user_agent == "sft-test/2");
    assert(cfg.http.verify_tls);
    assert(!cfg.http.allow_insecure_http);
    assert(cfg.storage.blob_dir == "/var/lib/sft/blobs");
    assert(cfg.storage.blob_key_path == "/var/lib/sft/blob.key");
    assert(!cfg.download.auto_download);
    std::remove(path.c_str());
  }

  {
    const std::string path = "tmp_transfer_defaults.ini";
    WriteFile(path, "\n; nothing set\n");
    TransferConfig cfg;
    std::string err;
    assert(LoadTransferConfig(path, cfg, err));
    assert(cfg.upload.upload_namespace == "urn:xmpp:http:upload:0");
    assert(cfg.upload.prefetch_limit_bytes == 1024 * 1024);
    assert(!cfg.upload.require_encryption);
    assert(cfg.http.threads == 2);
    assert(cfg.http.max_download_bytes == 0);
    assert(cfg.download.auto_download);
    std::remove(path.c_str());
  }

  {
    const std::string path = "tmp_transfer_bad_number.ini";
    WriteFile(path, "[http]\nthreads=2\nconnect_timeout_ms=fast\n");
    TransferConfig cfg;
    std::string err;
    assert(!LoadTransferConfig(path, cfg, err));
    assert(err == "invalid connect_timeout_ms at line 3");
    std::remove(path.c_str());
  }

  {
    const std::string path = "tmp_transfer_bad_bool.ini";
    WriteFile(path, "[download]\nauto_download=maybe\n");
    TransferConfig cfg;
    std::string err;
    assert(!LoadTransferConfig(path, cfg, err));
    assert(err == "invalid auto_download at line 2");
    std::remove(path.c_str());
  }

  {
    const std::string path = "tmp_transfer_bad_line.ini";
    WriteFile(path, "[upload]\nnamespace\n");
    TransferConfig cfg;
    std::string err;
    assert(!LoadTransferConfig(path, cfg, err));
    assert(err == "invalid line 2");
    std::remove(path.c_str());
  }

  // TLS verification can only be relaxed together with insecure http.
  {
    const std::string path = "tmp_transfer_tls.ini";
    WriteFile(path, "[http]\nverify_tls=0\n");
    TransferConfig cfg;
    std::string err;
    assert(!LoadTransferConfig(path, cfg, err));
    WriteFile(path, "[http]\nverify_tls=0\nallow_insecure_http=1\n");
    assert(LoadTransferConfig(path, cfg, err));
    assert(!cfg.http.verify_tls);
    assert(cfg.http.allow_insecure_http);
    std::remove(path.c_str());
  }

  {
    const std::string path = "tmp_transfer_negative.ini";
    WriteFile(path, "[upload]\nprefetch_limit_bytes=-1\n");
    TransferConfig cfg;
    std::string err;
    assert(!LoadTransferConfig(path, cfg, err));
    std::remove(path.c_str());
  }

  {
    TransferConfig cfg;
    std::string err;
    assert(!LoadTransferConfig("tmp_transfer_missing.ini", cfg, err));
    assert(!err.empty());
  }

  return 0;
}
