#include "file_port.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include "config.hpp"
#include "file_reader.hpp"
#include "posix_fd.hpp"

static std::string failure(const std::filesystem::path& p, int err) {
  return std::string("write file failed: ") + p.string() + ": " + std::strerror(err);
}

bool PosixFilePort::load(const std::filesystem::path& path, std::vector<std::string>& lines, std::string& msg) {
  lines.clear();
  struct stat st{};
  if (::stat(path.string().c_str(), &st) != 0 && errno == ENOENT) {
    msg = std::string("new file: ") + path.string();
    return true;
  }
  return mmap_readlines(path, lines, msg);
}

bool PosixFilePort::save(const std::filesystem::path& path, const std::vector<std::string>& lines, std::string& msg) {
  mode_t mode = 0644;
  struct stat st{};
  if (::stat(path.string().c_str(), &st) == 0) mode = st.st_mode & 07777;

  // unique sibling of the target so rename() stays on one filesystem
  std::string tmpl = path.string() + ".XXXXXX";
  UniqueFd ufd(::mkstemp(tmpl.data()));
  if (!ufd.valid()) { msg = failure(path, errno); return false; }
  std::filesystem::path tmp = tmpl;
  if (::fchmod(ufd.get(), mode) != 0) {
    msg = failure(tmp, errno);
    ufd.reset();
    ::unlink(tmp.string().c_str());
    return false;
  }

  std::vector<char> buf(static_cast<size_t>(KILN_WRITE_CHUNK_SIZE));
  size_t used = 0;
  size_t total = 0;
  auto write_span = [&](const char* p, size_t len) -> bool {
    while (len > 0) {
      ssize_t w = ::write(ufd.get(), p, len);
      if (w < 0) {
        if (errno == EINTR) continue;
        msg = failure(tmp, errno);
        return false;
      }
      p += w;
      len -= static_cast<size_t>(w);
    }
    return true;
  };
  auto put = [&](const char* p, size_t len) -> bool {
    total += len;
    if (len > buf.size() - used) {
      if (!write_span(buf.data(), used)) return false;
      used = 0;
      if (len >= buf.size()) return write_span(p, len);
    }
    std::memcpy(buf.data() + used, p, len);
    used += len;
    return true;
  };

  for (const auto& s : lines) {
    if (!put(s.data(), s.size()) || !put("\n", 1)) {
      ufd.reset();
      ::unlink(tmp.string().c_str());
      return false;
    }
  }
  bool ok = write_span(buf.data(), used);
#if defined(__APPLE__)
  if (ok && ::fsync(ufd.get()) != 0) { msg = failure(tmp, errno); ok = false; }
#else
  if (ok && ::fdatasync(ufd.get()) != 0) { msg = failure(tmp, errno); ok = false; }
#endif
  if (ok && !ufd.close_checked()) { msg = failure(tmp, errno); ok = false; }
  if (!ok) {
    ufd.reset();
    ::unlink(tmp.string().c_str());
    return false;
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    msg = std::string("write file failed: ") + path.string() + ": " + ec.message();
    ::unlink(tmp.string().c_str());
    return false;
  }
  msg = std::string("saved file: ") + path.string() + " (" + std::to_string(total) + " bytes)";
  return true;
}
