#include "internal/transfer/storage_grid_sink.hpp"

#include <arrow/buffer.h>
#include <arrow/filesystem/s3fs.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <cstring>
#include <fstream>
#include <vector>

#include "internal/observability/logging.hpp"

namespace relay::transfer {

using relay::observability::StringField;

namespace {

util::Status Transport(const std::string& message) {
  return util::Status::Err(util::ErrorCode::kTransportFailure, message);
}

util::Status Transport(const arrow::Status& status) {
  return Transport(status.ToString());
}

// Best effort; the next attempt truncates the part file anyway.
void DiscardPart(arrow::fs::FileSystem& fs, const std::string& part_path) {
  if (auto removed = fs.DeleteFile(part_path); !removed.ok()) {
    RELAY_LOG_DEBUG("Could not remove partial upload", {StringField("path", part_path), StringField("error", removed.ToString())});
  }
}

std::string Join(const std::string& root, const std::string& child) {
  if (root.empty()) return child;
  if (root.back() == '/') return root + child;
  return root + "/" + child;
}

// Streams the remote object and compares it with the staged file.
arrow::Result<bool> SameContent(arrow::fs::FileSystem& fs, const std::string& remote, const std::filesystem::path& local, Deadline deadline) {
  ARROW_ASSIGN_OR_RAISE(auto info, fs.GetFileInfo(remote));
  std::error_code ec;
  const auto      local_size = std::filesystem::file_size(local, ec);
  if (ec) return arrow::Status::IOError("cannot stat staged file ", local.string());
  if (info.size() != static_cast<int64_t>(local_size)) return false;

  ARROW_ASSIGN_OR_RAISE(auto input, fs.OpenInputStream(remote));
  std::ifstream in(local, std::ios::binary);
  if (!in) return arrow::Status::IOError("cannot open staged file ", local.string());

  std::vector<char> local_buf(kCopyChunkBytes);
  while (true) {
    if (std::chrono::steady_clock::now() >= deadline) return arrow::Status::Cancelled("timed out");
    ARROW_ASSIGN_OR_RAISE(auto chunk, input->Read(static_cast<int64_t>(kCopyChunkBytes)));
    in.read(local_buf.data(), static_cast<std::streamsize>(local_buf.size()));
    const auto got = in.gcount();
    if (got != chunk->size()) return false;
    if (got == 0) break;
    if (std::memcmp(local_buf.data(), chunk->data(), static_cast<std::size_t>(got)) != 0) return false;
  }
  ARROW_RETURN_NOT_OK(input->Close());
  return true;
}

} // namespace

StorageGridSink::StorageGridSink(model::StorageGridSite site, std::chrono::milliseconds request_timeout)
    : site_(std::move(site)), request_timeout_(request_timeout) {
}

StorageGridSink::StorageGridSink(model::StorageGridSite site, std::shared_ptr<arrow::fs::FileSystem> filesystem, std::string root_path)
    : site_(std::move(site)), fs_(std::move(filesystem)), root_path_(std::move(root_path)) {
}

arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> StorageGridSink::FileSystem() {
  std::lock_guard lock(fs_mutex_);
  if (!fs_) {
    std::string root_path;
    if (site_.spec.rfind("s3://", 0) == 0) {
      const double seconds = std::chrono::duration<double>(request_timeout_).count();
      ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(site_.spec, &root_path));
      options.connect_timeout = seconds;
      options.request_timeout = seconds;
      ARROW_ASSIGN_OR_RAISE(auto s3, arrow::fs::S3FileSystem::Make(options));
      fs_ = std::move(s3);
    } else {
      ARROW_ASSIGN_OR_RAISE(fs_, arrow::fs::FileSystemFromUriOrPath(site_.spec, &root_path));
    }
    root_path_ = std::move(root_path);
  }
  return fs_;
}

util::Status StorageGridSink::Deliver(const model::PayloadRef& ref, const std::filesystem::path& staged_file, Deadline deadline) {
  auto resolved = FileSystem();
  if (!resolved.ok()) {
    return Transport(resolved.status());
  }
  auto& fs = **resolved;

  std::string root;
  {
    std::lock_guard lock(fs_mutex_);
    root = root_path_;
  }
  const auto dir        = Join(root, ref.subsystem);
  const auto final_path = Join(dir, ref.filename);
  const auto part_path  = Join(dir, "." + ref.filename + ".part");

  if (auto created = fs.CreateDir(dir, /*recursive=*/true); !created.ok()) {
    return Transport(created);
  }

  auto info = fs.GetFileInfo(final_path);
  if (!info.ok()) {
    return Transport(info.status());
  }
  if (info->IsFile()) {
    auto same = SameContent(fs, final_path, staged_file, deadline);
    if (!same.ok()) {
      return same.status().IsCancelled() ? Transport("timed out") : Transport(same.status());
    }
    if (*same) {
      return util::Status::Ok();
    }
    return util::Status::Err(util::ErrorCode::kContentConflict, site_.name + ":" + final_path + " exists with different content");
  }

  std::ifstream in(staged_file, std::ios::binary);
  if (!in) {
    return util::Status::Err(util::ErrorCode::kIOFailure, "cannot open staged file " + staged_file.string());
  }

  auto opened = fs.OpenOutputStream(part_path);
  if (!opened.ok()) {
    return Transport(opened.status());
  }
  auto out = *opened;

  auto abandon = [&](util::Status status) {
    if (auto aborted = out->Abort(); !aborted.ok()) {
      RELAY_LOG_DEBUG("Could not abort upload", {StringField("path", part_path), StringField("error", aborted.ToString())});
    }
    DiscardPart(fs, part_path);
    return status;
  };

  std::vector<char> buffer(kCopyChunkBytes);
  while (true) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return abandon(Transport("timed out"));
    }
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got == 0) {
      if (in.bad()) {
        return abandon(util::Status::Err(util::ErrorCode::kIOFailure, "read failed for " + staged_file.string()));
      }
      break;
    }
    if (auto written = out->Write(buffer.data(), got); !written.ok()) {
      return abandon(Transport(written));
    }
  }

  if (auto closed = out->Close(); !closed.ok()) {
    DiscardPart(fs, part_path);
    return Transport(closed);
  }
  if (auto moved = fs.Move(part_path, final_path); !moved.ok()) {
    DiscardPart(fs, part_path);
    return Transport(moved);
  }
  return util::Status::Ok();
}

} // namespace relay::transfer
