#include <tally/common/critical.hpp>
#include <tally/remote/fixture_service.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/key/journal_keys.hpp>
#include <tally/storage/file_lock.hpp>
#include <tally/storage/rocksdb/storage.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <system_error>

namespace tally::remote {

namespace {

using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;
using storage_t =
    tally::storage::storage<tally::storage::rocksdb_storage_tag>;

std::optional<tally::schema::entity_record_t> find_record(
    const storage_t& storage,
    const tally::schema::entity_ref_t& ref) {
  auto encoder = encoder_t{};
  auto key = tally::schema::key::make_fixture_entity_key(ref);
  return storage.get<encoder_t, tally::schema::entity_record_t>(
      encoder, tally::schema::make_bytes_view(key));
}

void store_record(const storage_t& storage,
                  const tally::schema::entity_record_t& record) {
  auto encoder = encoder_t{};
  auto key = tally::schema::key::make_fixture_entity_key(record.ref);
  storage.put(encoder, tally::schema::make_bytes_view(key), record);
  spdlog::debug("fixture {} stored", tally::schema::to_display(record.ref));
}

void set_value(tally::schema::entity_record_t& record,
               const tally::schema::field_t field,
               const tally::schema::optional_field_value_t& value) {
  auto it = std::ranges::find(record.fields, field,
                              &tally::schema::field_entry_t::first);
  if (it == std::end(record.fields)) {
    record.fields.emplace_back(field, tally::schema::normalize(value));
  } else {
    it->second = tally::schema::normalize(value);
  }
}

tally::storage::file_lock lock_fixtures(const std::string& path) {
  auto parent = std::filesystem::path{path}.parent_path();
  if (!parent.empty()) {
    auto error = std::error_code{};
    std::filesystem::create_directories(parent, error);
    if (error) {
      tally::common::critical("cannot create fixtures directory",
                              parent.string(), error.message());
    }
  }
  return tally::storage::file_lock{tally::storage::lock_path_for(path)};
}

}  // namespace

fixture_service::fixture_service(std::string path) : path_{std::move(path)} {}

std::optional<tally::schema::entity_record_t> fixture_service::load(
    const tally::schema::entity_ref_t& ref) const {
  auto reader = tally::storage::make_read_only_storage<
      tally::storage::rocksdb_storage_tag>(path_);
  if (!reader) {
    return std::nullopt;
  }
  return find_record(*reader, ref);
}

tally::execution::read_result fixture_service::read_fields(
    const tally::schema::entity_ref_t& ref,
    const std::vector<tally::schema::field_t>& fields) const {
  auto record = load(ref);
  if (!record.has_value()) {
    return tally::execution::read_result{
        .code = tally::schema::error_code_t::not_found,
        .values = {},
        .detail = tally::schema::to_display(ref) + " not found"};
  }
  auto result = tally::execution::read_result{};
  for (const auto& [field, value] : record->fields) {
    if (std::ranges::find(fields, field) != std::end(fields)) {
      result.values[field] = value;
    }
  }
  return result;
}

tally::execution::write_result fixture_service::write_fields(
    const tally::schema::entity_ref_t& ref,
    const tally::schema::field_value_map_t& values) {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  auto lock = lock_fixtures(path_);
  auto storage = tally::storage::make_storage<
      tally::storage::rocksdb_storage_tag>(path_);
  auto record = find_record(storage, ref);
  if (!record.has_value()) {
    return tally::execution::write_result{
        .code = tally::schema::error_code_t::write_failed,
        .detail = tally::schema::to_display(ref) + " not found",
        .accepted_fields = std::nullopt};
  }
  for (const auto& [field, value] : values) {
    set_value(*record, field, value);
  }
  store_record(storage, *record);
  return {};
}

void fixture_service::upsert(const tally::schema::entity_ref_t& ref,
                             const tally::schema::field_value_map_t& values) {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  auto lock = lock_fixtures(path_);
  auto storage = tally::storage::make_storage<
      tally::storage::rocksdb_storage_tag>(path_);
  auto record =
      find_record(storage, ref).value_or(tally::schema::entity_record_t{});
  record.ref = ref;
  for (const auto& [field, value] : values) {
    set_value(record, field, value);
  }
  store_record(storage, record);
}

std::vector<std::string> fixture_service::ids(
    const tally::schema::entity_kind_t kind) const {
  auto reader = tally::storage::make_read_only_storage<
      tally::storage::rocksdb_storage_tag>(path_);
  if (!reader) {
    return {};
  }
  auto encoder = encoder_t{};
  auto prefix = tally::schema::key::make_fixture_kind_prefix(kind);
  auto ids = std::vector<std::string>{};
  for (const auto& [key, value] :
       reader->list_by_prefix(tally::schema::make_bytes_view(prefix))) {
    auto record = encoder.decode<tally::schema::entity_record_t>(
        tally::schema::make_bytes_view(value));
    ids.push_back(std::move(record.ref.id));
  }
  return ids;
}

tally::execution::reference_catalog fixture_service::catalog() const {
  auto catalog = tally::execution::reference_catalog{};
  for (const auto& [name, kind] : tally::schema::kEntityKindMappings) {
    for (auto& id : ids(kind)) {
      catalog.add(kind, std::move(id));
    }
  }
  return catalog;
}

tally::execution::remote_capabilities fixture_service::capabilities() {
  auto capabilities = tally::execution::remote_capabilities{};
  capabilities.read_fields =
      [this](const tally::schema::entity_ref_t& ref,
             const std::vector<tally::schema::field_t>& fields) {
        return read_fields(ref, fields);
      };
  capabilities.write_fields =
      [this](const tally::schema::entity_ref_t& ref,
             const tally::schema::field_value_map_t& values) {
        return write_fields(ref, values);
      };
  return capabilities;
}

}  // namespace tally::remote
