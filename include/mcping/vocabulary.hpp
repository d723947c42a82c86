/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file vocabulary.hpp
 * @brief Exception-free result type expected<V,E> and
 *        the error enums shared by several modules.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 * Accessing value() of an error result (or get_error() of a success) is a
 * programming error and trips MCPING_ASSERT in debug builds.
 */

#ifndef MCPING_VOCABULARY_HPP_
#define MCPING_VOCABULARY_HPP_

#include "mcping/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace mcping {

// ============================================================================
// Shared error enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kInvalidValue,
  kUnknownOption,
  kMissingValue,
};

inline const char* ToString(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:       return "file not found";
    case ConfigError::kParseError:         return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kInvalidValue:       return "invalid value";
    case ConfigError::kUnknownOption:      return "unknown option";
    case ConfigError::kMissingValue:       return "missing value";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the success() / error() factories.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(ValueTag{}, v); }
  static expected success(V&& v) {
    return expected(ValueTag{}, static_cast<V&&>(v));
  }
  static expected error(E e) noexcept { return expected(ErrorTag{}, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(static_cast<V&&>(other.value_));
    } else {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(other.value_);
      } else {
        ::new (static_cast<void*>(&error_)) E(other.error_);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(static_cast<V&&>(other.value_));
      } else {
        ::new (static_cast<void*>(&error_)) E(other.error_);
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() noexcept {
    MCPING_ASSERT(has_value_);
    return value_;
  }

  const V& value() const noexcept {
    MCPING_ASSERT(has_value_);
    return value_;
  }

  E get_error() const noexcept {
    MCPING_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& default_val) const {
    return has_value_ ? value_ : default_val;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  expected(ValueTag, const V& v) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) V(v);
  }
  expected(ValueTag, V&& v) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) V(static_cast<V&&>(v));
  }
  expected(ErrorTag, E e) noexcept : has_value_(false) {
    ::new (static_cast<void*>(&error_)) E(e);
  }

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
    }
  }

  union {
    V value_;
    E error_;
  };
  bool has_value_;
};

/** @brief void specialization: success carries no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    MCPING_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E e) noexcept : error_(e), has_value_(ok) {}

  E error_;
  bool has_value_;
};

}  // namespace mcping

#endif  // MCPING_VOCABULARY_HPP_
