#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace cortex::observability {

struct MemoryWrittenEvent {
  std::string path;
  bool created = false;
};

struct MemoryRemovedEvent {
  std::string path;
};

struct MemoryMovedEvent {
  std::string from;
  std::string to;
};

struct IndexUpdatedEvent {
  std::string category;
};

struct ReindexEvent {
  std::uint64_t memories = 0;
  std::uint64_t categories = 0;
  std::uint64_t warnings = 0;
  std::chrono::milliseconds duration{0};
};

struct PruneEvent {
  std::uint64_t expired = 0;
  bool dry_run = false;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<MemoryWrittenEvent, MemoryRemovedEvent, MemoryMovedEvent, IndexUpdatedEvent,
                 ReindexEvent, PruneEvent, WarningEvent, ErrorEvent>;

struct ReindexDurationMetric {
  std::chrono::milliseconds duration{0};
};

struct IndexedMemoriesMetric {
  std::uint64_t count = 0;
};

struct PrunedMemoriesMetric {
  std::uint64_t count = 0;
};

using ObserverMetric =
    std::variant<ReindexDurationMetric, IndexedMemoriesMetric, PrunedMemoriesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace cortex::observability
