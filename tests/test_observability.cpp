#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "cortex/config/schema.hpp"
#include "cortex/observability/factory.hpp"
#include "cortex/observability/global.hpp"
#include "cortex/observability/multi_observer.hpp"

namespace {

namespace obs = cortex::observability;

cortex::config::Config with_backend(const std::string &backend) {
  cortex::config::Config config;
  config.observability.backend = backend;
  return config;
}

} // namespace

void register_observability_tests(std::vector<cortex::tests::TestCase> &tests) {
  using cortex::tests::require;

  tests.push_back({"observability_factory_backends", [] {
                     require(obs::create_observer(with_backend("log"))->name() == "log",
                             "log backend");
                     require(obs::create_observer(with_backend(" NONE "))->name() == "noop",
                             "none backend");
                     require(obs::create_observer(with_backend(""))->name() == "noop",
                             "empty backend should be noop");

                     auto combined = obs::create_observer(with_backend("log, none"));
                     require(combined->name() == "multi", "comma list should build a multi");
                     const auto *multi = dynamic_cast<obs::MultiObserver *>(combined.get());
                     require(multi != nullptr && multi->size() == 2, "multi should hold two");
                   }});

  tests.push_back({"observability_global_helpers", [] {
                     obs::record_memory_written("a/b", true);

                     auto recorded = cortex::testing::install_recorder();
                     obs::record_memory_written("a/b", true);
                     obs::record_memory_moved("a/b", "c/b");
                     obs::record_warning("index", "skipped");
                     obs::record_reindex(4, 2, 1, std::chrono::milliseconds(12));
                     require(recorded->events.size() == 4, "four events expected");
                     const auto &written = std::get<obs::MemoryWrittenEvent>(recorded->events[0]);
                     require(written.path == "a/b" && written.created, "written event mismatch");
                     const auto &moved = std::get<obs::MemoryMovedEvent>(recorded->events[1]);
                     require(moved.from == "a/b" && moved.to == "c/b", "moved event mismatch");
                     const auto &reindex = std::get<obs::ReindexEvent>(recorded->events[3]);
                     require(reindex.memories == 4 && reindex.categories == 2 &&
                                 reindex.warnings == 1,
                             "reindex event mismatch");
                     require(recorded->metrics.size() == 2, "reindex should emit two metrics");

                     obs::set_global_observer(nullptr);
                     obs::record_warning("index", "dropped");
                     require(recorded->events.size() == 4, "detached observer should not record");
                   }});

  tests.push_back({"observability_prune_metrics", [] {
                     auto recorded = cortex::testing::install_recorder();
                     obs::record_prune(3, true);
                     require(recorded->metrics.empty(), "dry run should not emit a metric");
                     obs::record_prune(3, false);
                     require(recorded->count<obs::PruneEvent>() == 2, "two prune events");
                     require(recorded->metrics.size() == 1, "real prune should emit a metric");
                     const auto &metric = std::get<obs::PrunedMemoriesMetric>(recorded->metrics[0]);
                     require(metric.count == 3, "pruned count mismatch");
                   }});

  tests.push_back({"observability_multi_fans_out", [] {
                     auto first = std::make_shared<cortex::testing::Recorded>();
                     auto second = std::make_shared<cortex::testing::Recorded>();
                     obs::MultiObserver multi;
                     multi.add(std::make_unique<cortex::testing::RecordingObserver>(first));
                     multi.add(std::make_unique<cortex::testing::RecordingObserver>(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observers should be ignored");

                     multi.record_event(obs::ErrorEvent{.component = "memory", .message = "boom"});
                     multi.record_metric(obs::IndexedMemoriesMetric{.count = 7});
                     require(first->events.size() == 1 && second->events.size() == 1,
                             "both observers should see the event");
                     require(first->metrics.size() == 1 && second->metrics.size() == 1,
                             "both observers should see the metric");
                   }});
}
