#include "cortex/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace cortex::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string root_label(const std::string &category) {
  return category.empty() ? std::string("<root>") : category;
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, MemoryWrittenEvent>) {
          log_line("INFO", std::string(evt.created ? "memory.create" : "memory.update") +
                               " path=" + evt.path);
        } else if constexpr (std::is_same_v<T, MemoryRemovedEvent>) {
          log_line("INFO", "memory.remove path=" + evt.path);
        } else if constexpr (std::is_same_v<T, MemoryMovedEvent>) {
          log_line("INFO", "memory.move from=" + evt.from + " to=" + evt.to);
        } else if constexpr (std::is_same_v<T, IndexUpdatedEvent>) {
          log_line("DEBUG", "index.update category=" + root_label(evt.category));
        } else if constexpr (std::is_same_v<T, ReindexEvent>) {
          log_line("INFO", "index.reindex memories=" + std::to_string(evt.memories) +
                               " categories=" + std::to_string(evt.categories) +
                               " warnings=" + std::to_string(evt.warnings) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, PruneEvent>) {
          log_line("INFO", "memory.prune expired=" + std::to_string(evt.expired) +
                               " dry_run=" + (evt.dry_run ? std::string("true")
                                                          : std::string("false")));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ReindexDurationMetric>) {
          log_line("DEBUG", "metric.reindex_duration_ms=" + std::to_string(m.duration.count()));
        } else if constexpr (std::is_same_v<T, IndexedMemoriesMetric>) {
          log_line("DEBUG", "metric.indexed_memories=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, PrunedMemoriesMetric>) {
          log_line("DEBUG", "metric.pruned_memories=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace cortex::observability
