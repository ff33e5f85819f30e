#include "cortex/observability/factory.hpp"

#include "cortex/common/fs.hpp"
#include "cortex/observability/log_observer.hpp"
#include "cortex/observability/multi_observer.hpp"
#include "cortex/observability/noop_observer.hpp"

#include <iostream>
#include <vector>

namespace cortex::observability {

namespace {

std::unique_ptr<IObserver> observer_for(const std::string &name) {
  if (name == "log") {
    return std::make_unique<LogObserver>();
  }
  if (name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  std::vector<std::unique_ptr<IObserver>> selected;
  for (const auto &part : common::split(config.observability.backend, ',')) {
    const std::string name = common::to_lower(common::trim(part));
    if (name.empty()) {
      continue;
    }
    auto observer = observer_for(name);
    if (observer == nullptr) {
      // validate_config rejects these; a hand-built Config still gets logging.
      std::cerr << "[WARN] unknown observability backend '" << name << "', using log\n";
      observer = std::make_unique<LogObserver>();
    }
    selected.push_back(std::move(observer));
  }

  if (selected.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (selected.size() == 1 && config.observability.backend.find(',') == std::string::npos) {
    return std::move(selected.front());
  }
  auto multi = std::make_unique<MultiObserver>();
  for (auto &observer : selected) {
    multi->add(std::move(observer));
  }
  return multi;
}

} // namespace cortex::observability
