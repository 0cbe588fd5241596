#include "chatfetch/observability/factory.hpp"

#include "chatfetch/common/fs.hpp"
#include "chatfetch/observability/log_observer.hpp"
#include "chatfetch/observability/multi_observer.hpp"
#include "chatfetch/observability/noop_observer.hpp"

#include <sstream>
#include <vector>

namespace chatfetch::observability {

namespace {

std::vector<std::string> backend_names(const std::string &setting) {
  std::vector<std::string> names;
  std::stringstream stream(common::to_lower(setting));
  std::string part;
  while (std::getline(stream, part, ',')) {
    if (auto name = common::trim(part); !name.empty()) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

// Unknown names are rejected by config validation; treat them as "log" here.
std::unique_ptr<IObserver> make_backend(const std::string &name) {
  if (name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto names = backend_names(config.observability.backend);
  if (names.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (names.size() == 1) {
    return make_backend(names.front());
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : names) {
    multi->add(make_backend(name));
  }
  return multi;
}

} // namespace chatfetch::observability
