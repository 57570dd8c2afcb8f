#ifndef CLIPSYNC_SERVER_CLIPBOARD_STORE_H
#define CLIPSYNC_SERVER_CLIPBOARD_STORE_H

#include <cstddef>
#include <deque>
#include <shared_mutex>
#include <string>
#include <vector>

namespace clipsync::server {

constexpr std::size_t kDefaultHistorySize = 20;

// Current clipboard value plus a most-recent-first history. When current is
// non-empty, history.front() == current.
class ClipboardStore {
 public:
  explicit ClipboardStore(std::size_t capacity = kDefaultHistorySize);

  ClipboardStore(const ClipboardStore&) = delete;
  ClipboardStore& operator=(const ClipboardStore&) = delete;

  // False when content equals the current value.
  bool SetIfChanged(const std::string& content);

  std::vector<std::string> HistorySnapshot() const;
  std::string CurrentSnapshot() const;
  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  mutable std::shared_mutex mutex_;
  std::string current_;
  std::deque<std::string> history_;
};

}  // namespace clipsync::server

#endif  // CLIPSYNC_SERVER_CLIPBOARD_STORE_H
