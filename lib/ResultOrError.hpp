#ifndef BAZAAR_RESULT_OR_ERROR_HPP
#define BAZAAR_RESULT_OR_ERROR_HPP

#include <cstdint>
#include <new>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace bz {

/**
 * Common base for error types carried by ResultOrError.
 * Components derive their own Error from it so that error codes stay scoped
 * to the component that produced them.
 */
struct RoeErrorBase {
  int32_t code{ 0 };
  std::string message;

  RoeErrorBase() = default;
  RoeErrorBase(int32_t c, const std::string &msg) : code(c), message(msg) {}
  RoeErrorBase(int32_t c, std::string &&msg) : code(c), message(std::move(msg)) {}
  explicit RoeErrorBase(const std::string &msg) : code(-1), message(msg) {}
  explicit RoeErrorBase(std::string &&msg) : code(-1), message(std::move(msg)) {}
};

inline std::ostream &operator<<(std::ostream &os, const RoeErrorBase &e) {
  return os << "[" << e.code << "] " << e.message;
}

template <typename T, typename E = std::string> class ResultOrError {
public:
  // Success
  ResultOrError(const T &value) : hasValue_(true) { new (&storage_) T(value); }

  ResultOrError(T &&value) : hasValue_(true) {
    new (&storage_) T(std::move(value));
  }

  // Error, implicit so that `return Error(...)` works in functions
  // returning Roe<T>
  template <typename U = E,
            typename = std::enable_if_t<!std::is_same<U, T>::value>>
  ResultOrError(const E &err) : hasValue_(false) {
    new (&storage_) E(err);
  }

  template <typename U = E,
            typename = std::enable_if_t<!std::is_same<U, T>::value>>
  ResultOrError(E &&err) : hasValue_(false) {
    new (&storage_) E(std::move(err));
  }

  static ResultOrError error(const E &err) {
    ResultOrError result;
    new (&result.storage_) E(err);
    return result;
  }

  static ResultOrError error(E &&err) {
    ResultOrError result;
    new (&result.storage_) E(std::move(err));
    return result;
  }

  ResultOrError(const ResultOrError &other) : hasValue_(other.hasValue_) {
    if (hasValue_) {
      new (&storage_) T(*other.valuePtr());
    } else {
      new (&storage_) E(*other.errorPtr());
    }
  }

  ResultOrError(ResultOrError &&other) noexcept : hasValue_(other.hasValue_) {
    if (hasValue_) {
      new (&storage_) T(std::move(*other.valuePtr()));
    } else {
      new (&storage_) E(std::move(*other.errorPtr()));
    }
  }

  ~ResultOrError() { destroy(); }

  ResultOrError &operator=(const ResultOrError &other) {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      if (hasValue_) {
        new (&storage_) T(*other.valuePtr());
      } else {
        new (&storage_) E(*other.errorPtr());
      }
    }
    return *this;
  }

  ResultOrError &operator=(ResultOrError &&other) noexcept {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      if (hasValue_) {
        new (&storage_) T(std::move(*other.valuePtr()));
      } else {
        new (&storage_) E(std::move(*other.errorPtr()));
      }
    }
    return *this;
  }

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  // Access value (throws if error)
  const T &value() const {
    if (!hasValue_) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return *valuePtr();
  }

  T &value() {
    if (!hasValue_) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return *valuePtr();
  }

  T valueOr(const T &defaultValue) const {
    return hasValue_ ? *valuePtr() : defaultValue;
  }

  // Access error (throws if value)
  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return *errorPtr();
  }

  E &error() {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return *errorPtr();
  }

  const T &operator*() const { return value(); }
  T &operator*() { return value(); }

  const T *operator->() const { return &value(); }
  T *operator->() { return &value(); }

private:
  ResultOrError() : hasValue_(false) {}

  T *valuePtr() { return reinterpret_cast<T *>(&storage_); }
  const T *valuePtr() const { return reinterpret_cast<const T *>(&storage_); }
  E *errorPtr() { return reinterpret_cast<E *>(&storage_); }
  const E *errorPtr() const { return reinterpret_cast<const E *>(&storage_); }

  void destroy() {
    if (hasValue_) {
      valuePtr()->~T();
    } else {
      errorPtr()->~E();
    }
  }

  bool hasValue_;
  typename std::aligned_union<0, T, E>::type storage_;
};

// Specialization for void return type
template <typename E> class ResultOrError<void, E> {
public:
  ResultOrError() : hasValue_(true) {}

  ResultOrError(const E &err) : hasValue_(false) { new (&storage_) E(err); }

  ResultOrError(E &&err) : hasValue_(false) { new (&storage_) E(std::move(err)); }

  static ResultOrError error(const E &err) { return ResultOrError(err); }

  static ResultOrError error(E &&err) { return ResultOrError(std::move(err)); }

  ResultOrError(const ResultOrError &other) : hasValue_(other.hasValue_) {
    if (!hasValue_) {
      new (&storage_) E(*other.errorPtr());
    }
  }

  ResultOrError(ResultOrError &&other) noexcept : hasValue_(other.hasValue_) {
    if (!hasValue_) {
      new (&storage_) E(std::move(*other.errorPtr()));
    }
  }

  ~ResultOrError() { destroy(); }

  ResultOrError &operator=(const ResultOrError &other) {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      if (!hasValue_) {
        new (&storage_) E(*other.errorPtr());
      }
    }
    return *this;
  }

  ResultOrError &operator=(ResultOrError &&other) noexcept {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      if (!hasValue_) {
        new (&storage_) E(std::move(*other.errorPtr()));
      }
    }
    return *this;
  }

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return *errorPtr();
  }

  E &error() {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return *errorPtr();
  }

private:
  E *errorPtr() { return reinterpret_cast<E *>(&storage_); }
  const E *errorPtr() const { return reinterpret_cast<const E *>(&storage_); }

  void destroy() {
    if (!hasValue_) {
      errorPtr()->~E();
    }
  }

  bool hasValue_;
  typename std::aligned_union<0, E>::type storage_;
};

} // namespace bz

#endif // BAZAAR_RESULT_OR_ERROR_HPP
