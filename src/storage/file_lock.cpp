#include <tally/common/critical.hpp>
#include <tally/storage/file_lock.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace tally::storage {

std::string lock_path_for(const std::string_view store_path) {
  auto path = std::string{store_path};
  path += ".lock";
  return path;
}

file_lock::file_lock(const std::string_view path, const lock_mode_t mode)
    : path_{path}, mode_{mode} {
  descriptor_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (descriptor_ < 0) {
    tally::common::critical("cannot open lock file", path_,
                            std::strerror(errno));
  }
  const auto operation = mode_ == lock_mode_t::shared ? LOCK_SH : LOCK_EX;
  while (::flock(descriptor_, operation) != 0) {
    if (errno == EINTR) {
      continue;
    }
    const auto error = errno;
    ::close(descriptor_);
    descriptor_ = -1;
    tally::common::critical("cannot acquire lock file", path_,
                            std::strerror(error));
  }
  spdlog::trace("locked {} ({})", path_,
                mode_ == lock_mode_t::shared ? "shared" : "exclusive");
}

file_lock::~file_lock() {
  release();
}

file_lock::file_lock(file_lock&& other) noexcept
    : path_{std::move(other.path_)},
      mode_{other.mode_},
      descriptor_{std::exchange(other.descriptor_, -1)} {}

file_lock& file_lock::operator=(file_lock&& other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    mode_ = other.mode_;
    descriptor_ = std::exchange(other.descriptor_, -1);
  }
  return *this;
}

void file_lock::release() noexcept {
  if (descriptor_ >= 0) {
    ::flock(descriptor_, LOCK_UN);
    ::close(descriptor_);
    descriptor_ = -1;
  }
}

}  // namespace tally::storage
