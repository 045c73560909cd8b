#include "platform_fs.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <string>

namespace {

void SetErrno(std::error_code& ec) {
  ec = std::error_code(errno, std::generic_category());
}

bool WriteAllFd(int fd, const std::uint8_t* data, std::size_t len,
                std::error_code& ec) {
  std::size_t offset = 0;
  while (offset < len) {
    const std::size_t chunk = len - offset;
    const ssize_t rc =
        ::write(fd, data + offset, static_cast<size_t>(chunk));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetErrno(ec);
      return false;
    }
    offset += static_cast<std::size_t>(rc);
  }
  return true;
}

std::filesystem::path BuildTempPath(const std::filesystem::path& target,
                                    int attempt) {
  std::filesystem::path dir =
      target.has_parent_path() ? target.parent_path() : std::filesystem::path{};
  std::string base = target.filename().string();
  if (base.empty()) {
    base = "tmp";
  }
  const int pid = static_cast<int>(::getpid());
  std::string name = base + ".tmp." + std::to_string(pid) + "." +
                     std::to_string(attempt);
  return dir.empty() ? std::filesystem::path{name} : (dir / name);
}

}  // namespace

namespace sft::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::exists(path, ec);
}

bool IsRegularFile(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::is_regular_file(path, ec);
}

std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec) {
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec) {
  ec.clear();
  std::filesystem::create_directories(path, ec);
  return !ec;
}

bool Remove(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::remove(path, ec);
}

bool ReadFile(const std::filesystem::path& path,
              std::vector<std::uint8_t>& out,
              std::uint64_t max_len,
              std::error_code& ec) {
  out.clear();
  ec.clear();
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    SetErrno(ec);
    return false;
  }
  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    SetErrno(ec);
    ::close(fd);
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    ::close(fd);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  const auto size = static_cast<std::uint64_t>(st.st_size);
  if (max_len != 0 && size > max_len) {
    ::close(fd);
    ec = std::make_error_code(std::errc::file_too_large);
    return false;
  }
  out.resize(static_cast<std::size_t>(size));
  std::size_t done = 0;
  while (done < out.size()) {
    const ssize_t rc = ::read(fd, out.data() + done, out.size() - done);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetErrno(ec);
      ::close(fd);
      out.clear();
      return false;
    }
    if (rc == 0) {
      break;
    }
    done += static_cast<std::size_t>(rc);
  }
  ::close(fd);
  out.resize(done);
  return true;
}

bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec) {
  ec.clear();
  if (path.empty()) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  if (len > 0 && !data) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  for (int attempt = 0; attempt < 16; ++attempt) {
    const std::filesystem::path tmp = BuildTempPath(path, attempt);
    const int fd =
        ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_TRUNC | O_CLOEXEC,
               0600);
    if (fd < 0) {
      if (errno == EEXIST) {
        continue;
      }
      SetErrno(ec);
      return false;
    }

    if (len > 0 && !WriteAllFd(fd, data, len, ec)) {
      ::close(fd);
      std::error_code ignore_ec;
      std::filesystem::remove(tmp, ignore_ec);
      return false;
    }
    if (::fsync(fd) != 0) {
      SetErrno(ec);
      ::close(fd);
      std::error_code ignore_ec;
      std::filesystem::remove(tmp, ignore_ec);
      return false;
    }
    if (::close(fd) != 0) {
      SetErrno(ec);
      std::error_code ignore_ec;
      std::filesystem::remove(tmp, ignore_ec);
      return false;
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
      SetErrno(ec);
      std::error_code ignore_ec;
      std::filesystem::remove(tmp, ignore_ec);
      return false;
    }

    std::filesystem::path dir =
        path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    const int dfd = ::open(dir.c_str(), O_RDONLY | O_CLOEXEC);
    if (dfd >= 0) {
      (void)::fsync(dfd);
      (void)::close(dfd);
    }
    return true;
  }

  ec = std::make_error_code(std::errc::file_exists);
  return false;
}

bool WipeAndRemove(const std::filesystem::path& path, std::error_code& ec) {
  ec.clear();
  const int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ENOENT) {
      return true;
    }
    SetErrno(ec);
    return false;
  }
  struct stat st {};
  if (::fstat(fd, &st) == 0 && st.st_size > 0) {
    const std::vector<std::uint8_t> zeros(4096, 0);
    std::uint64_t left = static_cast<std::uint64_t>(st.st_size);
    std::error_code write_ec;
    while (left > 0) {
      const std::size_t chunk = static_cast<std::size_t>(
          std::min<std::uint64_t>(left, zeros.size()));
      if (!WriteAllFd(fd, zeros.data(), chunk, write_ec)) {
        break;
      }
      left -= chunk;
    }
    (void)::fsync(fd);
  }
  ::close(fd);
  std::filesystem::remove(path, ec);
  return !ec;
}

}  // namespace sft::platform::fs
