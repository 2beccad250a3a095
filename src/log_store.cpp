#include "arbiter/log_store.hpp"

#include <cstdio>
#include <fstream>

namespace arbiter {

// ---------------------------------------------------------------------------
// FileLogStore
// ---------------------------------------------------------------------------

struct FileLogStore::Impl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t failure_count{0};
};

FileLogStore::FileLogStore(std::string path) : path_(std::move(path)), impl_(std::make_unique<Impl>()) {
  if (!path_.empty()) impl_->file = std::fopen(path_.c_str(), "ab");
}

FileLogStore::~FileLogStore() {
  if (impl_ && impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

Status FileLogStore::append_batch(const std::vector<std::string>& lines) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (!impl_->file) {
    ++impl_->failure_count;
    return Status::failure(ErrorCode::storage_error, "log file not open: " + path_);
  }
  if (lines.empty()) return Status::success();

  std::string buf;
  for (const auto& l : lines) {
    buf += l;
    buf += '\n';
  }

  // Seek to end before writing so an externally moved file position can
  // never cause an overwrite.
  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return Status::failure(ErrorCode::storage_error, "ftell failed on " + path_);
  }

  const bool written = std::fwrite(buf.data(), 1, buf.size(), impl_->file) == buf.size();
  const bool flushed = std::fflush(impl_->file) == 0;
  if (!written || !flushed) {
    ++impl_->failure_count;
    return Status::failure(ErrorCode::storage_error, "short write on " + path_);
  }

  // The file must have grown by exactly what was written.
  const long post_write_pos = std::ftell(impl_->file);
  if (post_write_pos < 0 || post_write_pos != pre_write_pos + static_cast<long>(buf.size())) {
    ++impl_->failure_count;
    return Status::failure(ErrorCode::storage_error, "append-only violation detected on " + path_);
  }
  return Status::success();
}

Status FileLogStore::read_all(std::vector<std::string>* lines) const {
  lines->clear();
  std::lock_guard<std::mutex> lk(impl_->mu);
  std::ifstream ifs(path_, std::ios::binary);
  if (!ifs) {
    // A log that was never written is empty, not broken.
    return Status::success();
  }
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    lines->push_back(std::move(line));
  }
  if (ifs.bad()) return Status::failure(ErrorCode::storage_error, "read failed on " + path_);
  return Status::success();
}

uint64_t FileLogStore::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

// ---------------------------------------------------------------------------
// InMemoryLogStore
// ---------------------------------------------------------------------------

Status InMemoryLogStore::append_batch(const std::vector<std::string>& lines) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fail_appends_) return Status::failure(ErrorCode::storage_error, "injected append failure");
  lines_.insert(lines_.end(), lines.begin(), lines.end());
  return Status::success();
}

Status InMemoryLogStore::read_all(std::vector<std::string>* lines) const {
  std::lock_guard<std::mutex> lk(mu_);
  *lines = lines_;
  return Status::success();
}

void InMemoryLogStore::set_fail_appends(bool fail) {
  std::lock_guard<std::mutex> lk(mu_);
  fail_appends_ = fail;
}

bool InMemoryLogStore::tamper_for_test(std::size_t index, std::string line) {
  std::lock_guard<std::mutex> lk(mu_);
  if (index >= lines_.size()) return false;
  lines_[index] = std::move(line);
  return true;
}

std::size_t InMemoryLogStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return lines_.size();
}

}  // namespace arbiter
