#include "cortex/observability/global.hpp"

#include <mutex>

namespace cortex::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_memory_written(const std::string &path, const bool created) {
  record_event(MemoryWrittenEvent{.path = path, .created = created});
}

void record_memory_removed(const std::string &path) {
  record_event(MemoryRemovedEvent{.path = path});
}

void record_memory_moved(const std::string &from, const std::string &to) {
  record_event(MemoryMovedEvent{.from = from, .to = to});
}

void record_index_updated(const std::string &category) {
  record_event(IndexUpdatedEvent{.category = category});
}

void record_reindex(const std::uint64_t memories, const std::uint64_t categories,
                    const std::uint64_t warnings, const std::chrono::milliseconds duration) {
  record_event(ReindexEvent{.memories = memories,
                            .categories = categories,
                            .warnings = warnings,
                            .duration = duration});
  record_metric(ReindexDurationMetric{.duration = duration});
  record_metric(IndexedMemoriesMetric{.count = memories});
}

void record_prune(const std::uint64_t expired, const bool dry_run) {
  record_event(PruneEvent{.expired = expired, .dry_run = dry_run});
  if (!dry_run) {
    record_metric(PrunedMemoriesMetric{.count = expired});
  }
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace cortex::observability
