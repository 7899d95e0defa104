#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// JSON-lines event sink. Events are dropped until Initialize is called.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  void Initialize(const std::string& file_path);
  // Drains the queue and stops the writer; Initialize may be called again.
  void Shutdown();

  // Adds "event", "ts_ms" and the current context to fields and enqueues one line.
  void LogEvent(const std::string& event, nlohmann::json fields = nlohmann::json::object());

  // Context fields are attached to every event until cleared. Explicit
  // event fields win over context fields with the same key.
  void SetContext(const std::string& key, nlohmann::json value);
  void ClearContext();
private:
  StructuredLogger();
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
  nlohmann::json context_ = nlohmann::json::object();
};
