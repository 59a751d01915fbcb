#include "internal/staging/file_io.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include "internal/util/errors.hpp"

namespace relay::staging {

namespace {

bool IsOutOfSpace(int err) {
  return err == ENOSPC || err == EDQUOT;
}

std::string Describe(const std::string& what, const std::filesystem::path& path, int err) {
  return what + " " + path.string() + ": " + std::strerror(err);
}

class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {
  }
  ~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int Get() const {
    return fd_;
  }

  int Release() {
    const int fd = fd_;
    fd_          = -1;
    return fd;
  }

 private:
  int fd_;
};

} // namespace

util::Status WriteAtomically(const std::filesystem::path& final_path, const std::filesystem::path& tmp_path, std::string_view bytes) {
  std::error_code ec;
  const auto      dir = final_path.parent_path();

  const auto space = std::filesystem::space(dir, ec);
  if (!ec && space.available < bytes.size()) {
    throw util::ResourceExhausted("staging volume full: " + std::to_string(space.available) + " bytes free, " + std::to_string(bytes.size()) +
                                  " needed for " + final_path.string());
  }

  FileDescriptor fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (fd.Get() < 0) {
    const int err = errno;
    if (IsOutOfSpace(err)) throw util::ResourceExhausted(Describe("open", tmp_path, err));
    return util::Status::Err(util::ErrorCode::kIOFailure, Describe("open", tmp_path, err));
  }

  const char* data      = bytes.data();
  std::size_t remaining = bytes.size();
  while (remaining > 0) {
    const auto written = ::write(fd.Get(), data, remaining);
    if (written < 0) {
      const int err = errno;
      if (err == EINTR) continue;
      std::filesystem::remove(tmp_path, ec);
      if (IsOutOfSpace(err)) throw util::ResourceExhausted(Describe("write", tmp_path, err));
      return util::Status::Err(util::ErrorCode::kIOFailure, Describe("write", tmp_path, err));
    }
    data += written;
    remaining -= static_cast<std::size_t>(written);
  }

  if (::fsync(fd.Get()) != 0) {
    const int err = errno;
    std::filesystem::remove(tmp_path, ec);
    if (IsOutOfSpace(err)) throw util::ResourceExhausted(Describe("fsync", tmp_path, err));
    return util::Status::Err(util::ErrorCode::kIOFailure, Describe("fsync", tmp_path, err));
  }
  if (::close(fd.Release()) != 0) {
    const int err = errno;
    std::filesystem::remove(tmp_path, ec);
    return util::Status::Err(util::ErrorCode::kIOFailure, Describe("close", tmp_path, err));
  }

  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    return util::Status::Err(util::ErrorCode::kIOFailure, "rename " + tmp_path.string() + ": " + ec.message());
  }

  return SyncDirectory(dir);
}

util::Status SyncDirectory(const std::filesystem::path& dir) {
  FileDescriptor fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (fd.Get() < 0) {
    return util::Status::Err(util::ErrorCode::kIOFailure, Describe("open", dir, errno));
  }
  if (::fsync(fd.Get()) != 0) {
    return util::Status::Err(util::ErrorCode::kIOFailure, Describe("fsync", dir, errno));
  }
  return util::Status::Ok();
}

std::optional<std::string> ReadWholeFile(const std::filesystem::path& path, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (error) *error = "cannot open " + path.string();
    return std::nullopt;
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    if (error) *error = "read failed for " + path.string();
    return std::nullopt;
  }
  return content;
}

} // namespace relay::staging
