#pragma once

#include "dcm/core/clock.h"
#include "dcm/monitor/event_channel.h"
#include "dcm/monitor/file_event.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <thread>

namespace dcm::monitor {

// IFileEventSource delivers "file created" notifications into a channel.
// Sources never touch work-unit state; they only push events.
class IFileEventSource {
 public:
  virtual ~IFileEventSource() = default;

  // Begins delivering events into channel, which must outlive stop().
  virtual void start(EventChannel<FileEvent>& channel) = 0;
  // Stops delivery and joins any worker. Safe to call more than once.
  virtual void stop() = 0;

 protected:
  IFileEventSource() = default;
  IFileEventSource(const IFileEventSource&) = default;
  IFileEventSource& operator=(const IFileEventSource&) = default;
  IFileEventSource(IFileEventSource&&) = default;
  IFileEventSource& operator=(IFileEventSource&&) = default;
};

// Called from the polling thread when a directory listing fails.
using ScanErrorHandler = std::function<void(const std::string& path, const std::string& message)>;

// PollingFileEventSource lists the watch directory every `interval` on its own
// thread and pushes one FileEvent per regular file not seen in an earlier
// listing. Files already present when start() runs are reported on the first
// pass. Names starting with '.' are skipped (editor and sync temp files).
//
// The watch directory is created by start() when missing; failure to create it
// throws std::filesystem::filesystem_error.
class PollingFileEventSource final : public IFileEventSource {
 public:
  PollingFileEventSource(std::filesystem::path watch_dir, std::chrono::milliseconds interval,
                         const core::IClock& clock, ScanErrorHandler on_error = {});
  ~PollingFileEventSource() override;

  PollingFileEventSource(const PollingFileEventSource&) = delete;
  PollingFileEventSource& operator=(const PollingFileEventSource&) = delete;
  PollingFileEventSource(PollingFileEventSource&&) = delete;
  PollingFileEventSource& operator=(PollingFileEventSource&&) = delete;

  void start(EventChannel<FileEvent>& channel) override;
  void stop() override;

  // One listing pass; pushes new files and returns how many were pushed.
  // Exposed so tests can drive the source without the thread.
  std::size_t poll_once(EventChannel<FileEvent>& channel);

 private:
  void run(EventChannel<FileEvent>& channel);

  std::filesystem::path watch_dir_;
  std::chrono::milliseconds interval_;
  const core::IClock& clock_;
  ScanErrorHandler on_error_;
  std::set<std::filesystem::path> seen_;
  std::atomic<bool> running_{false};
  std::thread worker_;
};

}  // namespace dcm::monitor
