#include "arbiter/version_index.hpp"

#include <algorithm>

#include "arbiter/jsonlite.hpp"

namespace arbiter {

namespace {

void insert_sorted(std::vector<VersionWindow>& ws, VersionWindow w) {
  auto pos = std::upper_bound(ws.begin(), ws.end(), w.effective_from,
                              [](TimestampMs t, const VersionWindow& x) { return t < x.effective_from; });
  ws.insert(pos, std::move(w));
}

}  // namespace

std::optional<std::string> EffectiveVersionIndex::resolve(const std::string& function_id,
                                                          TimestampMs as_of) const {
  auto it = windows_.find(function_id);
  if (it == windows_.end()) return std::nullopt;
  const auto& ws = it->second;
  // Last window starting at or before as_of; empty windows sharing a start
  // sort before the window that replaced them.
  auto pos = std::upper_bound(ws.begin(), ws.end(), as_of,
                              [](TimestampMs t, const VersionWindow& x) { return t < x.effective_from; });
  if (pos == ws.begin()) return std::nullopt;
  --pos;
  if (!pos->contains(as_of)) return std::nullopt;
  return pos->version;
}

bool EffectiveVersionIndex::is_effective(const std::string& function_id, const std::string& version,
                                         TimestampMs as_of) const {
  auto v = resolve(function_id, as_of);
  return v && *v == version;
}

std::vector<VersionWindow> EffectiveVersionIndex::windows(const std::string& function_id) const {
  auto it = windows_.find(function_id);
  return it == windows_.end() ? std::vector<VersionWindow>{} : it->second;
}

std::optional<VersionWindow> EffectiveVersionIndex::window_of(const std::string& function_id,
                                                              const std::string& version) const {
  auto it = windows_.find(function_id);
  if (it == windows_.end()) return std::nullopt;
  for (const auto& w : it->second) {
    if (w.version == version) return w;
  }
  return std::nullopt;
}

std::optional<EffectiveVersionIndex> EffectiveVersionIndex::with_activation(
    const std::string& function_id, const std::string& version, TimestampMs from,
    std::string* closed_version, Status* status) const {
  Windows next = windows_;
  auto& ws = next[function_id];
  if (closed_version) closed_version->clear();

  for (auto& w : ws) {
    if (w.version == version) {
      if (status) {
        *status = Status::failure(ErrorCode::invalid_state_transition,
                                  "version " + version + " already has an effective window");
      }
      return std::nullopt;
    }
    if (w.effective_until == kOpenEnded) {
      if (from < w.effective_from) {
        if (status) {
          *status = Status::failure(ErrorCode::invalid_state_transition,
                                    "effective_from " + format_iso8601_utc(from) +
                                        " precedes the open window of " + w.version + " starting " +
                                        format_iso8601_utc(w.effective_from));
        }
        return std::nullopt;
      }
    } else if (from < w.effective_until) {
      if (status) {
        *status = Status::failure(ErrorCode::invalid_state_transition,
                                  "effective_from " + format_iso8601_utc(from) + " overlaps the window of " +
                                      w.version);
      }
      return std::nullopt;
    }
  }

  for (auto& w : ws) {
    if (w.effective_until == kOpenEnded) {
      w.effective_until = from;
      if (closed_version) *closed_version = w.version;
    }
  }
  insert_sorted(ws, VersionWindow{version, from, kOpenEnded});
  if (status) *status = Status::success();
  return EffectiveVersionIndex(std::move(next), generation_ + 1);
}

EffectiveVersionIndex EffectiveVersionIndex::with_retirement(const std::string& function_id,
                                                             const std::string& version,
                                                             TimestampMs sunset_at) const {
  Windows next = windows_;
  auto it = next.find(function_id);
  if (it != next.end()) {
    for (auto& w : it->second) {
      if (w.version != version) continue;
      w.effective_until = std::max(w.effective_from, std::min(w.effective_until, sunset_at));
    }
  }
  return EffectiveVersionIndex(std::move(next), generation_ + 1);
}

EffectiveVersionIndex EffectiveVersionIndex::with_window(const std::string& function_id,
                                                         VersionWindow window) const {
  Windows next = windows_;
  insert_sorted(next[function_id], std::move(window));
  return EffectiveVersionIndex(std::move(next), generation_ + 1);
}

std::string EffectiveVersionIndex::to_json() const {
  jsonlite::Object fns;
  for (const auto& [fn, ws] : windows_) {
    jsonlite::Array arr;
    for (const auto& w : ws) {
      jsonlite::Object o;
      o["version"] = w.version;
      o["effective_from"] = format_iso8601_utc(w.effective_from);
      o["effective_until"] =
          w.effective_until == kOpenEnded ? jsonlite::Value(nullptr) : jsonlite::Value(format_iso8601_utc(w.effective_until));
      arr.push_back(std::move(o));
    }
    fns[fn] = std::move(arr);
  }
  jsonlite::Object o;
  o["generation"] = generation_;
  o["functions"] = std::move(fns);
  return jsonlite::to_json(o);
}

}  // namespace arbiter
