/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all forge modules.
 *
 * - expected<V, E>: value-or-error return type (no exceptions)
 * - optional<T>: std::optional alias
 * - FixedString<N>: fixed-capacity, NUL-terminated string (no heap)
 * - ScopeGuard: run a callable on scope exit
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef FORGE_VOCABULARY_HPP_
#define FORGE_VOCABULARY_HPP_

#include "forge/platform.hpp"

#include <cstdint>
#include <cstring>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

namespace forge {

// ============================================================================
// Error enums shared across modules
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kKeyNotFound
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the named factories success() / error(). Accessing
 * value() on an error (or get_error() on a value) is a programming error
 * and asserts in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.value)) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.value)) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.err)) E(std::move(e));
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value)) V(other.storage_.value);
    } else {
      ::new (static_cast<void*>(&storage_.err)) E(other.storage_.err);
    }
  }

  expected(expected&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value))
          V(std::move(other.storage_.value));
    } else {
      ::new (static_cast<void*>(&storage_.err)) E(std::move(other.storage_.err));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_.value)) V(other.storage_.value);
      } else {
        ::new (static_cast<void*>(&storage_.err)) E(other.storage_.err);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_.value))
            V(std::move(other.storage_.value));
      } else {
        ::new (static_cast<void*>(&storage_.err))
            E(std::move(other.storage_.err));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    FORGE_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    FORGE_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    FORGE_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  const E& get_error() const {
    FORGE_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  expected() noexcept : has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    } else {
      storage_.err.~E();
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/**
 * @brief expected<void, E> specialization: success carries no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(); }

  static expected error(E e) {
    expected r;
    r.err_ = std::move(e);
    r.has_value_ = false;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const {
    FORGE_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() : err_(), has_value_(true) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
using optional = std::optional<T>;

// ============================================================================
// FixedString<N>
// ============================================================================

/// Tag selecting the truncating FixedString constructor.
struct TruncateToCapacity_t {};
inline constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Fixed-capacity string stored inline, always NUL-terminated.
 *
 * Literals are checked against the capacity at compile time; runtime
 * strings must go through the TruncateToCapacity overloads.
 */
template <uint32_t N>
class FixedString final {
 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  template <uint32_t M>
  FixedString(const char (&str)[M]) noexcept : size_(0) {  // NOLINT
    static_assert(M - 1U <= N, "string literal exceeds FixedString capacity");
    Copy(str, M - 1U);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept
      : size_(0) {
    Copy(str, (len <= N) ? len : N);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    uint32_t len = 0;
    while (len < N && str[len] != '\0') ++len;
    Copy(str, len);
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return N; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  template <uint32_t M>
  bool operator==(const FixedString<M>& other) const noexcept {
    return size_ == other.size() &&
           std::memcmp(buf_, other.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& other) const noexcept {
    return !(*this == other);
  }

  bool operator==(const char* str) const noexcept {
    return str != nullptr && std::strcmp(buf_, str) == 0;
  }

  bool operator!=(const char* str) const noexcept { return !(*this == str); }

 private:
  void Copy(const char* str, uint32_t len) noexcept {
    if (len > 0U) std::memcpy(buf_, str, len);
    size_ = len;
    buf_[size_] = '\0';
  }

  char buf_[N + 1];
  uint32_t size_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a callable when the guard leaves scope, unless released.
 *
 * @code
 *   ++waiters_;
 *   forge::ScopeGuard<std::function<void()>> release([this] { --waiters_; });
 *   cv_.wait(lk, pred);
 * @endcode
 */
template <typename Fn>
class ScopeGuard final {
 public:
  explicit ScopeGuard(Fn fn) noexcept(std::is_nothrow_move_constructible<Fn>::value)
      : fn_(std::move(fn)), active_(true) {}

  ~ScopeGuard() {
    if (active_) fn_();
  }

  void Release() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard(ScopeGuard&&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  Fn fn_;
  bool active_;
};

}  // namespace forge

#endif  // FORGE_VOCABULARY_HPP_
