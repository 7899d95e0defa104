#include "telemetry/structured_logger.hpp"
#include <fstream>
#include <chrono>

namespace {
  constexpr size_t kBatchBytes = 4096;

  long long NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
  }
}

StructuredLogger& StructuredLogger::Instance() {
  static StructuredLogger inst;
  return inst;
}

StructuredLogger::StructuredLogger() {}
StructuredLogger::~StructuredLogger() { Shutdown(); }

void StructuredLogger::Initialize(const std::string& file_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  file_path_ = file_path;
  running_ = true;
  worker_ = std::thread(&StructuredLogger::Worker, this);
}

void StructuredLogger::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void StructuredLogger::SetContext(const std::string& key, nlohmann::json value) {
  std::lock_guard<std::mutex> lock(mutex_);
  context_[key] = std::move(value);
}

void StructuredLogger::ClearContext() {
  std::lock_guard<std::mutex> lock(mutex_);
  context_ = nlohmann::json::object();
}

void StructuredLogger::LogEvent(const std::string& event, nlohmann::json fields) {
  if (!fields.is_object()) fields = nlohmann::json{ {"value", fields} };
  fields["event"] = event;
  fields["ts_ms"] = NowMs();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    for (auto it = context_.begin(); it != context_.end(); ++it) {
      if (!fields.contains(it.key())) fields[it.key()] = it.value();
    }
    queue_.push(fields.dump());
  }
  cv_.notify_one();
}

void StructuredLogger::Worker() {
  std::ofstream out(file_path_, std::ios::app | std::ios::out);
  std::string batch;
  batch.reserve(2 * kBatchBytes);
  for (;;) {
    bool stopping = false;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_for(lock, std::chrono::milliseconds(80), [&]{ return !queue_.empty() || !running_; });
      while (!queue_.empty() && batch.size() < kBatchBytes) {
        batch.append(queue_.front());
        batch.push_back('\n');
        queue_.pop();
      }
      stopping = !running_ && queue_.empty();
    }
    if (!batch.empty()) {
      out << batch;
      out.flush();
      batch.clear();
    }
    if (stopping) break;
  }
}
