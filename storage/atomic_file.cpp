#include "ledger/storage/atomic_file.hpp"
#include "ledger/observability/logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace ledger {
namespace storage {

namespace fs = std::filesystem;
using observability::LogLevel;

namespace {

bool writeAll(int fd, const std::string& content) {
  const char* data = content.data();
  size_t remaining = content.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += written;
    remaining -= static_cast<size_t>(written);
  }
  return true;
}

// Makes a completed rename durable; failure here is not fatal
void syncDirectory(const fs::path& dir) {
  int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) return;
  ::fsync(fd);
  ::close(fd);
}

void removeTemp(const fs::path& tmp) {
  std::error_code ec;
  fs::remove(tmp, ec);
  if (ec) {
    LEDGER_LOG_BUILDER(LogLevel::WARN, "Failed to remove temporary file")
        .field("path", tmp.string())
        .field("error", ec.message());
  }
}

}  // namespace

bool ensureParentDirectory(const fs::path& file) {
  fs::path dir = file.parent_path();
  if (dir.empty()) return true;

  std::error_code ec;
  if (fs::is_directory(dir, ec)) return true;

  fs::create_directories(dir, ec);
  if (ec) {
    LEDGER_LOG_BUILDER(LogLevel::ERROR, "Failed to create data directory")
        .field("path", dir.string())
        .field("error", ec.message());
    return false;
  }
  return true;
}

fs::path tempPathFor(const fs::path& dest) {
  fs::path tmp = dest;
  tmp += ".tmp";
  return tmp;
}

bool writeFileAtomically(const fs::path& dest, const std::string& content,
                         const std::string& label) {
  if (!ensureParentDirectory(dest)) {
    return false;
  }

  const fs::path tmp = tempPathFor(dest);

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    LEDGER_LOG_BUILDER(LogLevel::ERROR, "Failed to open temporary " + label + " file")
        .field("path", tmp.string())
        .field("error", std::strerror(errno));
    return false;
  }

  bool ok = writeAll(fd, content) && ::fsync(fd) == 0;
  int saved_errno = errno;
  if (::close(fd) != 0 && ok) {
    ok = false;
    saved_errno = errno;
  }
  if (!ok) {
    LEDGER_LOG_BUILDER(LogLevel::ERROR, "Failed to write temporary " + label + " file")
        .field("path", tmp.string())
        .field("error", std::strerror(saved_errno));
    removeTemp(tmp);
    return false;
  }

  std::error_code ec;
  fs::rename(tmp, dest, ec);
  if (!ec) {
    syncDirectory(dest.parent_path());
    return true;
  }

  LEDGER_LOG_BUILDER(LogLevel::WARN, "Failed to move temporary " + label + " file, copying")
      .field("path", dest.string())
      .field("error", ec.message());

  std::error_code copy_ec;
  fs::copy_file(tmp, dest, fs::copy_options::overwrite_existing, copy_ec);
  if (copy_ec) {
    LEDGER_LOG_BUILDER(LogLevel::ERROR, "Copy fallback also failed for " + label)
        .field("path", dest.string())
        .field("error", copy_ec.message());
    removeTemp(tmp);
    return false;
  }

  removeTemp(tmp);
  syncDirectory(dest.parent_path());
  return true;
}

std::optional<std::string> readFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

}  // namespace storage
}  // namespace ledger
