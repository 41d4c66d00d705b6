/**
 * @file component.hpp
 * @brief Component lifecycle interface and the ordered System container.
 *
 * A System is an ordered collection of uniquely named components. The order
 * in which the constructor adds components is the start order; stop runs
 * in reverse. The System records a per-entry ComponentState so that a
 * partially started or stopped system can be inspected and handed back to
 * a later transition.
 *
 * Usage:
 * @code
 *   forge::System sys;
 *   sys.Emplace<Database>("db", url);
 *   sys.Emplace<HttpServer>("http", port);
 *   auto r = sys.StartComponents();
 *   if (!r) {
 *     FORGE_LOG_ERROR("App", "%s: %s", r.get_error().name.c_str(),
 *                     r.get_error().fault.message.c_str());
 *   }
 * @endcode
 */

#ifndef FORGE_COMPONENT_HPP_
#define FORGE_COMPONENT_HPP_

#include "forge/platform.hpp"
#include "forge/vocabulary.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace forge {

#ifndef FORGE_COMPONENT_NAME_SIZE
#define FORGE_COMPONENT_NAME_SIZE 32U
#endif

#ifndef FORGE_FAULT_MESSAGE_SIZE
#define FORGE_FAULT_MESSAGE_SIZE 128U
#endif

#ifndef FORGE_SYSTEM_MAX_COMPONENTS
#define FORGE_SYSTEM_MAX_COMPONENTS 64U
#endif

using ComponentName = FixedString<FORGE_COMPONENT_NAME_SIZE>;

// ============================================================================
// Fault - cause of a failed construction, start or stop
// ============================================================================

struct Fault {
  int32_t code = 0;
  FixedString<FORGE_FAULT_MESSAGE_SIZE> message;

  FORGE_PRINTF_LIKE(2, 3)
  static Fault Make(int32_t code, const char* fmt, ...) {
    Fault f;
    f.code = code;
    char buf[FORGE_FAULT_MESSAGE_SIZE + 1U];
    va_list args;
    va_start(args, fmt);
    int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    if (n > 0) f.message.assign(TruncateToCapacity, buf);
    return f;
  }
};

// ============================================================================
// Component
// ============================================================================

enum class ComponentState : uint8_t {
  kConstructed = 0,  ///< Built by the constructor, never started
  kStarted,          ///< Start() succeeded
  kStopped           ///< Stop() succeeded
};

inline const char* ComponentStateName(ComponentState s) noexcept {
  switch (s) {
    case ComponentState::kConstructed: return "constructed";
    case ComponentState::kStarted:     return "started";
    case ComponentState::kStopped:     return "stopped";
  }
  return "unknown";
}

/**
 * @brief A named unit of the system with a start/stop lifecycle.
 *
 * Start() and Stop() transition only this component. Stop() may be called
 * on a component that was never started or is already stopped, and must
 * succeed in that case.
 */
class Component {
 public:
  virtual ~Component() = default;

  virtual expected<void, Fault> Start() = 0;
  virtual expected<void, Fault> Stop() = 0;
};

// ============================================================================
// SystemSnapshot - copyable description of a System
// ============================================================================

struct ComponentInfo {
  ComponentName name;
  ComponentState state;
};

struct SystemSnapshot {
  std::vector<ComponentInfo> components;

  uint32_t Size() const noexcept {
    return static_cast<uint32_t>(components.size());
  }

  bool Empty() const noexcept { return components.empty(); }

  const ComponentInfo* Find(const char* name) const noexcept {
    for (const auto& c : components) {
      if (c.name == name) return &c;
    }
    return nullptr;
  }

  bool Contains(const char* name) const noexcept { return Find(name) != nullptr; }

  uint32_t RunningCount() const noexcept {
    uint32_t n = 0;
    for (const auto& c : components) {
      if (c.state == ComponentState::kStarted) ++n;
    }
    return n;
  }
};

// ============================================================================
// System
// ============================================================================

enum class SystemError : uint8_t {
  kDuplicateName = 0,
  kNullComponent,
  kNameTooLong,
  kSystemFull
};

/// Component that failed during StartComponents() / StopComponents().
struct ComponentFailure {
  uint32_t index = 0;
  ComponentName name;
  Fault fault;
};

class System final {
 public:
  System() = default;
  ~System() = default;

  System(System&&) noexcept = default;
  System& operator=(System&&) noexcept = default;
  System(const System&) = delete;
  System& operator=(const System&) = delete;

  // ==========================================================================
  // Composition
  // ==========================================================================

  /**
   * @brief Append a component; its position is its start order.
   * @param name Unique component name (at most FORGE_COMPONENT_NAME_SIZE chars).
   * @param component Owned component, must not be null.
   */
  expected<void, SystemError> Add(const char* name,
                                  std::unique_ptr<Component> component) {
    FORGE_ASSERT(name != nullptr);
    if (component == nullptr) {
      return expected<void, SystemError>::error(SystemError::kNullComponent);
    }
    if (std::strlen(name) > ComponentName::capacity()) {
      return expected<void, SystemError>::error(SystemError::kNameTooLong);
    }
    if (entries_.size() >= FORGE_SYSTEM_MAX_COMPONENTS) {
      return expected<void, SystemError>::error(SystemError::kSystemFull);
    }
    if (IndexOf(name) >= 0) {
      return expected<void, SystemError>::error(SystemError::kDuplicateName);
    }
    Entry e;
    e.name.assign(TruncateToCapacity, name);
    e.component = std::move(component);
    e.state = ComponentState::kConstructed;
    entries_.push_back(std::move(e));
    return expected<void, SystemError>::success();
  }

  template <typename T, typename... Args>
  expected<void, SystemError> Emplace(const char* name, Args&&... args) {
    static_assert(std::is_base_of<Component, T>::value,
                  "T must derive from forge::Component");
    return Add(name, std::make_unique<T>(std::forward<Args>(args)...));
  }

  /// Remove the named entry, destroying its component. Returns false if absent.
  bool Remove(const char* name) {
    int32_t idx = IndexOf(name);
    if (idx < 0) return false;
    entries_.erase(entries_.begin() + idx);
    return true;
  }

  /// Keep the first @p count entries, destroying the rest in reverse order.
  void Truncate(uint32_t count) {
    while (entries_.size() > count) {
      entries_.pop_back();
    }
  }

  // ==========================================================================
  // Lifecycle
  // ==========================================================================

  /**
   * @brief Start every entry in order, stopping at the first failure.
   *
   * On failure, entries before the failing one are kStarted, the failing
   * entry and every later entry keep their previous state.
   */
  expected<void, ComponentFailure> StartComponents() {
    for (uint32_t i = 0; i < entries_.size(); ++i) {
      Entry& e = entries_[i];
      auto r = e.component->Start();
      if (!r) {
        return expected<void, ComponentFailure>::error(
            MakeFailure(i, r.get_error()));
      }
      e.state = ComponentState::kStarted;
    }
    return expected<void, ComponentFailure>::success();
  }

  /**
   * @brief Stop every entry in reverse order, stopping at the first failure.
   *
   * Every entry is asked to stop regardless of its recorded state. On
   * failure, entries after the failing one are kStopped and the failing
   * entry and every earlier entry keep their previous state.
   */
  expected<void, ComponentFailure> StopComponents() {
    for (uint32_t i = static_cast<uint32_t>(entries_.size()); i > 0U; --i) {
      Entry& e = entries_[i - 1U];
      auto r = e.component->Stop();
      if (!r) {
        return expected<void, ComponentFailure>::error(
            MakeFailure(i - 1U, r.get_error()));
      }
      e.state = ComponentState::kStopped;
    }
    return expected<void, ComponentFailure>::success();
  }

  // ==========================================================================
  // Query
  // ==========================================================================

  uint32_t Size() const noexcept { return static_cast<uint32_t>(entries_.size()); }
  bool Empty() const noexcept { return entries_.empty(); }

  bool Contains(const char* name) const noexcept { return IndexOf(name) >= 0; }

  const char* NameAt(uint32_t index) const noexcept {
    FORGE_ASSERT(index < entries_.size());
    return entries_[index].name.c_str();
  }

  ComponentState StateAt(uint32_t index) const noexcept {
    FORGE_ASSERT(index < entries_.size());
    return entries_[index].state;
  }

  /// @return The component, or nullptr if no entry has this name.
  Component* Find(const char* name) noexcept {
    int32_t idx = IndexOf(name);
    return (idx < 0) ? nullptr : entries_[static_cast<uint32_t>(idx)].component.get();
  }

  const Component* Find(const char* name) const noexcept {
    int32_t idx = IndexOf(name);
    return (idx < 0) ? nullptr : entries_[static_cast<uint32_t>(idx)].component.get();
  }

  /// Typed access; the caller asserts the entry was added as T.
  template <typename T>
  T* Get(const char* name) noexcept {
    return static_cast<T*>(Find(name));
  }

  template <typename T>
  const T* Get(const char* name) const noexcept {
    return static_cast<const T*>(Find(name));
  }

  optional<ComponentState> StateOf(const char* name) const noexcept {
    int32_t idx = IndexOf(name);
    if (idx < 0) return {};
    return entries_[static_cast<uint32_t>(idx)].state;
  }

  uint32_t RunningCount() const noexcept {
    uint32_t n = 0;
    for (const auto& e : entries_) {
      if (e.state == ComponentState::kStarted) ++n;
    }
    return n;
  }

  SystemSnapshot Snapshot() const {
    SystemSnapshot snap;
    snap.components.reserve(entries_.size());
    for (const auto& e : entries_) {
      snap.components.push_back(ComponentInfo{e.name, e.state});
    }
    return snap;
  }

 private:
  struct Entry {
    ComponentName name;
    std::unique_ptr<Component> component;
    ComponentState state = ComponentState::kConstructed;
  };

  int32_t IndexOf(const char* name) const noexcept {
    if (name == nullptr) return -1;
    for (uint32_t i = 0; i < entries_.size(); ++i) {
      if (entries_[i].name == name) return static_cast<int32_t>(i);
    }
    return -1;
  }

  ComponentFailure MakeFailure(uint32_t index, const Fault& fault) const {
    ComponentFailure f;
    f.index = index;
    f.name = entries_[index].name;
    f.fault = fault;
    return f;
  }

  std::vector<Entry> entries_;
};

}  // namespace forge

#endif  // FORGE_COMPONENT_HPP_
