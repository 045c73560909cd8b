#ifndef SFT_PLATFORM_FS_H
#define SFT_PLATFORM_FS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace sft::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec);
bool IsRegularFile(const std::filesystem::path& path, std::error_code& ec);
std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec);
bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec);
bool Remove(const std::filesystem::path& path, std::error_code& ec);

// Reads a regular file completely. Fails with file_too_large when the file
// exceeds |max_len| (0 means no limit).
bool ReadFile(const std::filesystem::path& path,
              std::vector<std::uint8_t>& out,
              std::uint64_t max_len,
              std::error_code& ec);

// Writes to a sibling temp file, fsyncs and renames over |path|.
bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec);

// Overwrites the file contents with zeros before unlinking it.
bool WipeAndRemove(const std::filesystem::path& path, std::error_code& ec);

}  // namespace sft::platform::fs

#endif  // SFT_PLATFORM_FS_H
