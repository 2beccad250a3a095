#include "arbiter/kv_store.hpp"

#include <filesystem>
#include <fstream>

#include "arbiter/cas.hpp"
#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"

namespace fs = std::filesystem;

namespace arbiter {

namespace {

Status revision_mismatch(const std::string& key, uint64_t expected, uint64_t actual) {
  return Status::failure(ErrorCode::concurrent_modification,
                         "revision mismatch on '" + key + "': expected " + std::to_string(expected) +
                             ", found " + std::to_string(actual));
}

std::vector<std::string> prefix_scan(const std::map<std::string, VersionedValue>& data,
                                     const std::string& prefix) {
  std::vector<std::string> out;
  for (auto it = data.lower_bound(prefix); it != data.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    out.push_back(it->first);
  }
  return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// InMemoryKvStore
// ---------------------------------------------------------------------------

std::optional<VersionedValue> InMemoryKvStore::get(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = data_.find(key);
  if (it == data_.end()) return std::nullopt;
  return it->second;
}

KvPutResult InMemoryKvStore::put_if(const std::string& key, const std::string& value,
                                    uint64_t expected_revision) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = data_.find(key);
  const uint64_t current = it == data_.end() ? 0 : it->second.revision;
  if (current != expected_revision) return {revision_mismatch(key, expected_revision, current), current};
  VersionedValue& slot = data_[key];
  slot.value = value;
  slot.revision = current + 1;
  return {Status::success(), slot.revision};
}

std::vector<std::string> InMemoryKvStore::keys(const std::string& prefix) const {
  std::lock_guard<std::mutex> lk(mu_);
  return prefix_scan(data_, prefix);
}

// ---------------------------------------------------------------------------
// FileKvStore
// ---------------------------------------------------------------------------

FileKvStore::FileKvStore(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    load_errors_.push_back("cannot create " + root_ + ": " + ec.message());
    return;
  }
  for (const auto& entry : fs::directory_iterator(root_, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
    std::ifstream ifs(entry.path(), std::ios::binary);
    const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    std::optional<jsonlite::JsonError> err;
    auto doc = jsonlite::parse(text, &err);
    const std::string key = jsonlite::get_string(doc, "key");
    if (err || key.empty() || path_for(key) != entry.path().string()) {
      load_errors_.push_back(entry.path().filename().string());
      continue;
    }
    data_[key] = VersionedValue{jsonlite::get_string(doc, "value"), jsonlite::get_u64(doc, "revision")};
  }
}

std::string FileKvStore::path_for(const std::string& key) const {
  return (fs::path(root_) / (blake3_hex(key) + ".json")).string();
}

std::optional<VersionedValue> FileKvStore::get(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = data_.find(key);
  if (it == data_.end()) return std::nullopt;
  return it->second;
}

KvPutResult FileKvStore::put_if(const std::string& key, const std::string& value,
                                uint64_t expected_revision) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = data_.find(key);
  const uint64_t current = it == data_.end() ? 0 : it->second.revision;
  if (current != expected_revision) return {revision_mismatch(key, expected_revision, current), current};

  jsonlite::Object doc;
  doc["key"] = key;
  doc["revision"] = current + 1;
  doc["value"] = value;
  if (!atomic_write_file(path_for(key), jsonlite::to_json(doc))) {
    return {Status::failure(ErrorCode::storage_error, "write failed for key '" + key + "'"), current};
  }
  data_[key] = VersionedValue{value, current + 1};
  return {Status::success(), current + 1};
}

std::vector<std::string> FileKvStore::keys(const std::string& prefix) const {
  std::lock_guard<std::mutex> lk(mu_);
  return prefix_scan(data_, prefix);
}

}  // namespace arbiter
