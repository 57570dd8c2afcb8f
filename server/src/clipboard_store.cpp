#include "clipboard_store.h"

#include <mutex>

namespace clipsync::server {

ClipboardStore::ClipboardStore(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool ClipboardStore::SetIfChanged(const std::string& content) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (content == current_) {
    return false;
  }
  current_ = content;
  history_.push_front(content);
  while (history_.size() > capacity_) {
    history_.pop_back();
  }
  return true;
}

std::vector<std::string> ClipboardStore::HistorySnapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return std::vector<std::string>(history_.begin(), history_.end());
}

std::string ClipboardStore::CurrentSnapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return current_;
}

}  // namespace clipsync::server
