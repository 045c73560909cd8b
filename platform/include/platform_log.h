#ifndef SFT_PLATFORM_LOG_H
#define SFT_PLATFORM_LOG_H

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace sft::platform::log {

enum class Level : std::uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3
};

struct Field {
  std::string_view key;
  std::string_view value;
};

// Receives already redacted text.
using LogCallback = void (*)(Level level,
                             const char* tag,
                             const char* message,
                             const Field* fields,
                             std::size_t field_count,
                             void* user_data);

// Passing nullptr restores the default stdout/stderr sink.
void SetLogCallback(LogCallback cb, void* user_data);
void SetMinLevel(Level level);
Level MinLevel();

void Log(Level level, std::string_view tag, std::string_view message);
void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields);

bool IsSensitiveKey(std::string_view key);
std::string RedactValue(std::string_view key, std::string_view value);
std::string RedactMessage(std::string_view message);

// Replaces the fragment of every aesgcm:// link in |text| with "***".
std::string RedactKeyFragments(std::string_view text);

}  // namespace sft::platform::log

#endif  // SFT_PLATFORM_LOG_H
