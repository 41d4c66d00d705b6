/**
 * @file fake_components.hpp
 * @brief Recording components for the lifecycle tests.
 */

#ifndef FORGE_TESTS_FAKE_COMPONENTS_HPP_
#define FORGE_TESTS_FAKE_COMPONENTS_HPP_

#include "forge/component.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace forge_test {

/// Ordered "start:A" / "stop:B" events shared by the components of a test.
class EventLog {
 public:
  void Record(const std::string& event) {
    std::lock_guard<std::mutex> lk(mtx_);
    events_.push_back(event);
  }

  std::vector<std::string> Events() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return events_;
  }

  void Clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    events_.clear();
  }

 private:
  mutable std::mutex mtx_;
  std::vector<std::string> events_;
};

/**
 * Records every Start()/Stop() call. A failing call is recorded as well,
 * prefixed with "fail-".
 */
class FakeComponent : public forge::Component {
 public:
  FakeComponent(std::string name, std::shared_ptr<EventLog> log)
      : name_(std::move(name)), log_(std::move(log)) {}

  FakeComponent& FailStart(bool fail = true) {
    fail_start_ = fail;
    return *this;
  }

  FakeComponent& FailStop(bool fail = true) {
    fail_stop_ = fail;
    return *this;
  }

  forge::expected<void, forge::Fault> Start() override {
    if (fail_start_) {
      log_->Record("fail-start:" + name_);
      return forge::expected<void, forge::Fault>::error(
          forge::Fault::Make(1, "%s refused to start", name_.c_str()));
    }
    log_->Record("start:" + name_);
    running_ = true;
    return forge::expected<void, forge::Fault>::success();
  }

  forge::expected<void, forge::Fault> Stop() override {
    if (fail_stop_) {
      log_->Record("fail-stop:" + name_);
      return forge::expected<void, forge::Fault>::error(
          forge::Fault::Make(2, "%s refused to stop", name_.c_str()));
    }
    log_->Record("stop:" + name_);
    running_ = false;
    return forge::expected<void, forge::Fault>::success();
  }

  bool running() const noexcept { return running_; }

 private:
  std::string name_;
  std::shared_ptr<EventLog> log_;
  bool fail_start_ = false;
  bool fail_stop_ = false;
  bool running_ = false;
};

/// Adds a FakeComponent and returns it for further configuration.
inline FakeComponent& AddFake(forge::System& sys, const char* name,
                              const std::shared_ptr<EventLog>& log) {
  auto comp = std::make_unique<FakeComponent>(name, log);
  FakeComponent& ref = *comp;
  auto r = sys.Add(name, std::move(comp));
  (void)r;
  return ref;
}

}  // namespace forge_test

#endif  // FORGE_TESTS_FAKE_COMPONENTS_HPP_
