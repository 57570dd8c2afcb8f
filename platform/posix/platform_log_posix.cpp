#include "platform_log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <vector>

namespace clipsync::platform::log {

namespace {

constexpr const char* kSensitiveFragments[] = {"token", "password", "secret",
                                               "key"};

struct Sink {
  std::mutex mutex;
  LogCallback callback = nullptr;
  void* user_data = nullptr;
};

Sink& GlobalSink() {
  static Sink sink;
  return sink;
}

std::atomic<std::uint8_t> g_min_level{static_cast<std::uint8_t>(Level::kInfo)};

const char* LevelName(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

std::string Lowered(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

// Query strings and "k=v, k=v" lists both end a value at these.
bool EndsValue(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == ',' ||
         ch == ';' || ch == '&';
}

void MaskAfter(const std::string& pattern, std::string& text,
               std::string& lower) {
  std::size_t pos = 0;
  while ((pos = lower.find(pattern, pos)) != std::string::npos) {
    const std::size_t start = pos + pattern.size();
    std::size_t end = start;
    while (end < text.size() && !EndsValue(text[end])) {
      ++end;
    }
    if (end == start) {
      pos = start;
      continue;
    }
    text.replace(start, end - start, "***");
    lower.replace(start, end - start, "***");
    pos = start + 3;
  }
}

void AppendTimestamp(std::string& line) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;
  std::tm utc{};
  gmtime_r(&secs, &utc);
  char buf[32];
  const int n = std::snprintf(buf, sizeof(buf),
                              "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                              utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                              utc.tm_hour, utc.tm_min, utc.tm_sec,
                              static_cast<int>(ms));
  if (n > 0) {
    line.append(buf, static_cast<std::size_t>(n));
  }
}

void WriteLine(Level level, std::string_view tag, const std::string& message,
               const std::vector<Field>& fields) {
  std::string line;
  line.reserve(96 + message.size() + fields.size() * 16);
  AppendTimestamp(line);
  line.append(" [clipsync] ");
  line.append(LevelName(level));
  if (!tag.empty()) {
    line.push_back(' ');
    line.append(tag.data(), tag.size());
  }
  line.append(": ");
  line.append(message);
  for (const Field& field : fields) {
    if (field.key.empty()) {
      continue;
    }
    line.push_back(' ');
    line.append(field.key.data(), field.key.size());
    line.push_back('=');
    line.append(field.value.data(), field.value.size());
  }
  line.push_back('\n');
  FILE* out = level >= Level::kWarn ? stderr : stdout;
  std::fwrite(line.data(), 1, line.size(), out);
  std::fflush(out);
}

}  // namespace

void SetLogCallback(LogCallback cb, void* user_data) {
  Sink& sink = GlobalSink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  sink.callback = cb;
  sink.user_data = user_data;
}

void SetMinLevel(Level level) {
  g_min_level.store(static_cast<std::uint8_t>(level), std::memory_order_relaxed);
}

Level MinLevel() {
  return static_cast<Level>(g_min_level.load(std::memory_order_relaxed));
}

void Log(Level level, std::string_view tag, std::string_view message) {
  Log(level, tag, message, {});
}

void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields) {
  if (level < MinLevel()) {
    return;
  }
  const std::string text = RedactMessage(message);
  // Redacted values must outlive the Field views pointing at them.
  std::vector<std::string> values;
  values.reserve(fields.size());
  std::vector<Field> safe;
  safe.reserve(fields.size());
  for (const Field& field : fields) {
    values.push_back(RedactValue(field.key, field.value));
    safe.push_back(Field{field.key, values.back()});
  }

  Sink& sink = GlobalSink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  if (sink.callback) {
    const std::string tag_text(tag);
    sink.callback(level, tag_text.c_str(), text.c_str(), safe.data(),
                  safe.size(), sink.user_data);
    return;
  }
  WriteLine(level, tag, text, safe);
}

bool IsSensitiveKey(std::string_view key) {
  const std::string lower = Lowered(key);
  for (const char* fragment : kSensitiveFragments) {
    if (lower.find(fragment) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string RedactValue(std::string_view key, std::string_view value) {
  return IsSensitiveKey(key) ? std::string("***") : std::string(value);
}

std::string RedactMessage(std::string_view message) {
  std::string text(message);
  std::string lower = Lowered(message);
  for (const char* fragment : kSensitiveFragments) {
    MaskAfter(std::string(fragment) + "=", text, lower);
  }
  return text;
}

}  // namespace clipsync::platform::log
