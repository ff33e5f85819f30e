#pragma once

#include "cortex/observability/observer.hpp"

#include <memory>

namespace cortex::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_memory_written(const std::string &path, bool created);
void record_memory_removed(const std::string &path);
void record_memory_moved(const std::string &from, const std::string &to);
void record_index_updated(const std::string &category);
void record_reindex(std::uint64_t memories, std::uint64_t categories, std::uint64_t warnings,
                    std::chrono::milliseconds duration);
void record_prune(std::uint64_t expired, bool dry_run);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace cortex::observability
