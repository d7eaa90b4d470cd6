#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tally::storage {

enum class lock_mode_t : uint8_t { shared = 0, exclusive = 1 };

/// Lock file guarding the store at `store_path`: `<store_path>.lock`.
std::string lock_path_for(std::string_view store_path);

/// Advisory lock on a lock file, held for the lifetime of the object. Blocks
/// until the lock is granted. Writers take it exclusive; a reader that has to
/// wait out a writer takes it shared. Separate instances conflict even inside
/// one process, so two handles on the same store serialize like two processes
/// do.
class file_lock final {
 public:
  explicit file_lock(std::string_view path,
                     lock_mode_t mode = lock_mode_t::exclusive);
  ~file_lock();

  file_lock(const file_lock&) = delete;
  file_lock& operator=(const file_lock&) = delete;
  file_lock(file_lock&& other) noexcept;
  file_lock& operator=(file_lock&& other) noexcept;

  const std::string& path() const { return path_; }
  lock_mode_t mode() const { return mode_; }

 private:
  void release() noexcept;

  std::string path_;
  lock_mode_t mode_{lock_mode_t::exclusive};
  int descriptor_{-1};
};

}  // namespace tally::storage
