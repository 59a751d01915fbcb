#include "internal/transfer/filesystem_sink.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <system_error>
#include <vector>

#include "internal/staging/file_io.hpp"
#include "internal/staging/path_utils.hpp"

namespace relay::transfer {

namespace fs = std::filesystem;

namespace {

util::Status Transport(const std::string& message) {
  return util::Status::Err(util::ErrorCode::kTransportFailure, message);
}

// nullopt when either side cannot be read
std::optional<bool> SameContent(const fs::path& a, const fs::path& b) {
  std::error_code ec;
  const auto      size_a = fs::file_size(a, ec);
  if (ec) return std::nullopt;
  const auto size_b = fs::file_size(b, ec);
  if (ec) return std::nullopt;
  if (size_a != size_b) return false;

  std::ifstream in_a(a, std::ios::binary);
  std::ifstream in_b(b, std::ios::binary);
  if (!in_a || !in_b) return std::nullopt;

  std::vector<char> buf_a(kCopyChunkBytes);
  std::vector<char> buf_b(kCopyChunkBytes);
  while (in_a && in_b) {
    in_a.read(buf_a.data(), static_cast<std::streamsize>(buf_a.size()));
    in_b.read(buf_b.data(), static_cast<std::streamsize>(buf_b.size()));
    const auto got_a = in_a.gcount();
    const auto got_b = in_b.gcount();
    if (got_a != got_b || std::memcmp(buf_a.data(), buf_b.data(), static_cast<std::size_t>(got_a)) != 0) {
      return false;
    }
    if (got_a == 0) break;
  }
  return true;
}

} // namespace

FilesystemSink::FilesystemSink(model::FilesystemSite site) : site_(std::move(site)) {
}

util::Status FilesystemSink::Deliver(const model::PayloadRef& ref, const fs::path& staged_file, Deadline deadline) {
  const auto dir        = fs::path(site_.path) / ref.subsystem;
  const auto final_path = dir / ref.filename;
  const auto part_path  = staging::HiddenSibling(final_path, ".part");

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return Transport("create " + dir.string() + ": " + ec.message());
  }

  if (fs::exists(final_path, ec)) {
    const auto same = SameContent(staged_file, final_path);
    if (!same) {
      return Transport("cannot compare with existing " + final_path.string());
    }
    if (*same) {
      return util::Status::Ok();
    }
    return util::Status::Err(util::ErrorCode::kContentConflict, final_path.string() + " exists with different content");
  }

  std::ifstream in(staged_file, std::ios::binary);
  if (!in) {
    return util::Status::Err(util::ErrorCode::kIOFailure, "cannot open staged file " + staged_file.string());
  }

  const int fd = ::open(part_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return Transport("open " + part_path.string() + ": " + std::strerror(errno));
  }

  auto abandon = [&](util::Status status) {
    ::close(fd);
    std::error_code ignored;
    fs::remove(part_path, ignored);
    return status;
  };

  std::vector<char> buffer(kCopyChunkBytes);
  while (true) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return abandon(Transport("timed out"));
    }
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = static_cast<std::size_t>(in.gcount());
    if (got == 0) {
      if (in.bad()) {
        return abandon(util::Status::Err(util::ErrorCode::kIOFailure, "read failed for " + staged_file.string()));
      }
      break;
    }

    std::size_t offset = 0;
    while (offset < got) {
      const auto written = ::write(fd, buffer.data() + offset, got - offset);
      if (written < 0) {
        if (errno == EINTR) continue;
        return abandon(Transport("write " + part_path.string() + ": " + std::strerror(errno)));
      }
      offset += static_cast<std::size_t>(written);
    }
  }

  if (::fsync(fd) != 0) {
    return abandon(Transport("fsync " + part_path.string() + ": " + std::strerror(errno)));
  }
  if (::close(fd) != 0) {
    fs::remove(part_path, ec);
    return Transport("close " + part_path.string() + ": " + std::strerror(errno));
  }

  fs::rename(part_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(part_path, ignored);
    return Transport("rename " + part_path.string() + ": " + ec.message());
  }

  if (auto synced = staging::SyncDirectory(dir); !synced) {
    return Transport(synced.message);
  }
  return util::Status::Ok();
}

} // namespace relay::transfer
