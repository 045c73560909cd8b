#include "crypto_envelope.h"

#include <openssl/evp.h>

#include <algorithm>
#include <climits>
#include <cstddef>
#include <memory>

#include "platform_random.h"
#include "secure_buffer.h"

namespace sft::transfer {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

bool InitGcm(EVP_CIPHER_CTX* ctx, bool encrypt, const CryptoEnvelope::Key& key,
             const CryptoEnvelope::Iv& iv) {
  const int init = encrypt
                       ? EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr,
                                            nullptr, nullptr)
                       : EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr,
                                            nullptr, nullptr);
  if (init != 1) {
    return false;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(iv.size()), nullptr) != 1) {
    return false;
  }
  const int keyed =
      encrypt ? EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data())
              : EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data());
  return keyed == 1;
}

}  // namespace

bool CryptoEnvelope::Generate(Envelope& out, TransferError& error) {
  if (!platform::RandomArray(out.key) || !platform::RandomArray(out.iv)) {
    common::SecureWipe(out.key);
    common::SecureWipe(out.iv);
    error.Set(TransferErrorKind::kKeyGeneration, "random source unavailable");
    return false;
  }
  return true;
}

bool CryptoEnvelope::Encrypt(const std::vector<std::uint8_t>& plaintext,
                             const Key& key,
                             const Iv& iv,
                             std::vector<std::uint8_t>& out_framed,
                             TransferError& error) {
  out_framed.clear();
  if (plaintext.size() > static_cast<std::size_t>(INT_MAX) - kAuthTagSize) {
    error.Set(TransferErrorKind::kCrypto, "payload too large");
    return false;
  }
  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx || !InitGcm(ctx.get(), true, key, iv)) {
    error.Set(TransferErrorKind::kCrypto, "aes-gcm init failed");
    return false;
  }

  std::vector<std::uint8_t> framed(plaintext.size() + kAuthTagSize);
  int out_len = 0;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), framed.data(), &out_len, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    common::SecureWipe(framed);
    error.Set(TransferErrorKind::kCrypto, "aes-gcm encrypt failed");
    return false;
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), framed.data() + out_len, &final_len) !=
      1) {
    common::SecureWipe(framed);
    error.Set(TransferErrorKind::kCrypto, "aes-gcm final failed");
    return false;
  }
  const std::size_t cipher_len = static_cast<std::size_t>(out_len + final_len);
  if (cipher_len != plaintext.size()) {
    common::SecureWipe(framed);
    error.Set(TransferErrorKind::kCrypto, "aes-gcm length mismatch");
    return false;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(kAuthTagSize),
                          framed.data() + cipher_len) != 1) {
    common::SecureWipe(framed);
    error.Set(TransferErrorKind::kCrypto, "aes-gcm get tag failed");
    return false;
  }
  out_framed.swap(framed);
  return true;
}

bool CryptoEnvelope::Decrypt(const std::vector<std::uint8_t>& framed,
                             const Key& key,
                             const Iv& iv,
                             std::vector<std::uint8_t>& out_plaintext,
                             TransferError& error) {
  out_plaintext.clear();
  if (framed.size() <= kAuthTagSize) {
    error.Set(TransferErrorKind::kCrypto, "ciphertext too short");
    return false;
  }
  if (framed.size() > static_cast<std::size_t>(INT_MAX)) {
    error.Set(TransferErrorKind::kCrypto, "ciphertext too large");
    return false;
  }
  const std::size_t cipher_len = framed.size() - kAuthTagSize;
  std::array<std::uint8_t, kAuthTagSize> tag{};
  std::copy(framed.begin() + static_cast<std::ptrdiff_t>(cipher_len),
            framed.end(), tag.begin());

  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx || !InitGcm(ctx.get(), false, key, iv)) {
    error.Set(TransferErrorKind::kCrypto, "aes-gcm init failed");
    return false;
  }

  std::vector<std::uint8_t> plain(cipher_len);
  int out_len = 0;
  if (EVP_DecryptUpdate(ctx.get(), plain.data(), &out_len, framed.data(),
                        static_cast<int>(cipher_len)) != 1) {
    common::SecureWipe(plain);
    error.Set(TransferErrorKind::kCrypto, "aes-gcm decrypt failed");
    return false;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(tag.size()), tag.data()) != 1) {
    common::SecureWipe(plain);
    error.Set(TransferErrorKind::kCrypto, "aes-gcm set tag failed");
    return false;
  }
  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + out_len, &final_len) !=
      1) {
    common::SecureWipe(plain);
    error.Set(TransferErrorKind::kCrypto, "authentication failed");
    return false;
  }
  plain.resize(static_cast<std::size_t>(out_len + final_len));
  out_plaintext.swap(plain);
  return true;
}

}  // namespace sft::transfer
