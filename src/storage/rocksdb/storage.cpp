#include <tally/common/critical.hpp>
#include <tally/storage/file_lock.hpp>
#include <tally/storage/rocksdb/storage.hpp>

#include <chrono>
#include <filesystem>
#include <system_error>
#include <thread>

namespace tally::storage {

namespace {

constexpr auto kReadOnlyOpenAttempts = 4;
constexpr auto kReadOnlyOpenBackoff = std::chrono::milliseconds{10};

/// Every command opens a store for a handful of small synced batches and
/// closes it again.
ROCKSDB_NAMESPACE::Options short_lived_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.write_buffer_size = 4 << 20;
  options.keep_log_file_num = 2;
  options.info_log_level = ROCKSDB_NAMESPACE::InfoLogLevel::WARN_LEVEL;
  // Open every table file up front. A reader then keeps working after a
  // writer's compaction unlinks them.
  options.max_open_files = -1;
  return options;
}

ROCKSDB_NAMESPACE::Status open_read_only(storage<rocksdb_storage_tag>& store) {
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::OpenForReadOnly(short_lived_options(),
                                                       store.path, &database);
  if (status.ok()) {
    store.database.reset(database);
  }
  return status;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>{};
  store.path = std::string{path};

  auto options = short_lived_options();
  options.create_if_missing = true;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(options, store.path, &database);
  if (!status.ok()) {
    tally::common::critical("cannot open store", store.path, status.ToString());
  }
  store.database.reset(database);
  return store;
}

template <>
std::optional<storage<rocksdb_storage_tag>>
make_read_only_storage<rocksdb_storage_tag>(const std::string_view& path) {
  auto error = std::error_code{};
  if (!std::filesystem::exists(std::filesystem::path{path} / "CURRENT",
                               error)) {
    return std::nullopt;
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.path = std::string{path};

  // Each read-write open rolls the MANIFEST and WAL, so a reader racing a
  // writer can find the files CURRENT names already deleted.
  auto status = ROCKSDB_NAMESPACE::Status{};
  for (auto attempt = 1; attempt <= kReadOnlyOpenAttempts; ++attempt) {
    status = open_read_only(store);
    if (status.ok()) {
      return store;
    }
    spdlog::debug("read-only open of {} failed (attempt {}): {}", store.path,
                  attempt, status.ToString());
    std::this_thread::sleep_for(kReadOnlyOpenBackoff * attempt);
  }

  // Writers hold the lock exclusively, so a shared hold sees a quiet store.
  {
    auto lock = file_lock{lock_path_for(store.path), lock_mode_t::shared};
    status = open_read_only(store);
  }
  if (!status.ok()) {
    tally::common::critical("cannot open store read-only", store.path,
                            status.ToString());
  }
  return store;
}

}  // namespace tally::storage
