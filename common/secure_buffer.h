#ifndef SFT_SECURE_BUFFER_H
#define SFT_SECURE_BUFFER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sft::common {

inline void SecureWipe(void* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  volatile std::uint8_t* p = reinterpret_cast<volatile std::uint8_t*>(data);
  while (len--) {
    *p++ = 0;
  }
}

inline void SecureWipe(std::vector<std::uint8_t>& buf) {
  SecureWipe(buf.data(), buf.size());
}

inline void SecureWipe(std::string& text) {
  SecureWipe(text.empty() ? nullptr : &text[0], text.size());
}

template <std::size_t N>
inline void SecureWipe(std::array<std::uint8_t, N>& buf) {
  SecureWipe(buf.data(), buf.size());
}

// Wipes the referenced bytes when the scope ends. The referenced storage must
// not be reallocated while the guard is alive.
class ScopedWipe {
 public:
  ScopedWipe(void* data, std::size_t len) : data_(data), len_(len) {}

  explicit ScopedWipe(std::vector<std::uint8_t>& buf)
      : data_(buf.data()), len_(buf.size()) {}

  template <std::size_t N>
  explicit ScopedWipe(std::array<std::uint8_t, N>& buf)
      : data_(buf.data()), len_(buf.size()) {}

  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

  ~ScopedWipe() { SecureWipe(data_, len_); }

  void Release() {
    data_ = nullptr;
    len_ = 0;
  }

 private:
  void* data_{nullptr};
  std::size_t len_{0};
};

}  // namespace sft::common

#endif  // SFT_SECURE_BUFFER_H
