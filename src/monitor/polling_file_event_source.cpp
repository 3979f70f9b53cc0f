#include "dcm/monitor/file_event_source.h"

#include <algorithm>
#include <system_error>
#include <vector>

namespace dcm::monitor {

namespace fs = std::filesystem;

PollingFileEventSource::PollingFileEventSource(fs::path watch_dir,
                                               std::chrono::milliseconds interval,
                                               const core::IClock& clock,
                                               ScanErrorHandler on_error)
    : watch_dir_(std::move(watch_dir)),
      interval_(interval),
      clock_(clock),
      on_error_(std::move(on_error)) {}

PollingFileEventSource::~PollingFileEventSource() {
  stop();
}

void PollingFileEventSource::start(EventChannel<FileEvent>& channel) {
  if (running_.exchange(true)) {
    return;
  }
  std::error_code ec;
  fs::create_directories(watch_dir_, ec);
  if (ec) {
    running_ = false;
    throw fs::filesystem_error("cannot create watch directory", watch_dir_, ec);
  }
  worker_ = std::thread([this, &channel] { run(channel); });
}

void PollingFileEventSource::stop() {
  running_ = false;
  if (worker_.joinable()) {
    worker_.join();
  }
}

void PollingFileEventSource::run(EventChannel<FileEvent>& channel) {
  // Sleep in short slices so stop() does not wait a whole interval.
  constexpr auto kSlice = std::chrono::milliseconds(50);
  while (running_) {
    poll_once(channel);
    for (auto waited = std::chrono::milliseconds(0); running_ && waited < interval_;
         waited += kSlice) {
      std::this_thread::sleep_for(kSlice);
    }
  }
}

std::size_t PollingFileEventSource::poll_once(EventChannel<FileEvent>& channel) {
  std::error_code ec;
  fs::directory_iterator it(watch_dir_, ec);
  if (ec) {
    if (on_error_) {
      on_error_(watch_dir_.string(), ec.message());
    }
    return 0;
  }

  std::vector<fs::path> fresh;
  for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
    if (ec) {
      if (on_error_) {
        on_error_(watch_dir_.string(), ec.message());
      }
      break;
    }
    const fs::path& path = it->path();
    const std::string name = path.filename().string();
    if (name.empty() || name.front() == '.') {
      continue;
    }
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec) || seen_.count(path) != 0) {
      continue;
    }
    fresh.push_back(path);
  }

  std::sort(fresh.begin(), fresh.end());
  std::size_t pushed = 0;
  for (auto& path : fresh) {
    seen_.insert(path);
    if (channel.push(FileEvent{path, clock_.now()})) {
      ++pushed;
    }
  }
  return pushed;
}

}  // namespace dcm::monitor
