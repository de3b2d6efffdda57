#include <provenance/common/critical.hpp>
#include <provenance/storage/rocksdb/storage.hpp>

namespace provenance::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    provenance::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

key_value_entry_t make_committed_state_entry(const committed_state& state) {
  auto encoder = detail::encoder_t{};
  return key_value_entry_t{
      provenance::schema::key::make_prefix_key(
          provenance::schema::key::kCommittedStateKey),
      encoder.encode(std::tuple{state.total_submissions, state.state_root})};
}

std::optional<committed_state> storage<rocksdb_storage_tag>::load_committed_state()
    const {
  if (!database) {
    provenance::common::critical("RocksDB database is not initialized");
  }

  auto raw = std::string{};
  auto status = database->Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      std::string{provenance::schema::key::kCommittedStateKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to load committed state: {}", status.ToString());
    provenance::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, provenance::schema::hash32_t>>(
          provenance::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(raw.data()), raw.size()});
  if (!decoded.has_value()) {
    provenance::common::critical("failed to decode committed state");
  }

  auto state = committed_state{};
  state.total_submissions = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  return state;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const provenance::schema::bytes_view_t& prefix) const {
  if (!database) {
    provenance::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    provenance::common::critical("failed to scan RocksDB prefix");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit_batch(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    provenance::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(provenance::schema::make_bytes_view(key)),
                  detail::to_slice(provenance::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      provenance::common::critical("failed staging key in write batch");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}",
                  write_status.ToString());
    provenance::common::critical("failed to commit write batch");
  }
}

}  // namespace provenance::storage
