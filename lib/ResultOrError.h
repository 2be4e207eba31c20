#ifndef CHAIN_LEDGER_RESULT_OR_ERROR_H
#define CHAIN_LEDGER_RESULT_OR_ERROR_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace cl {

/**
 * Common base for all error types carried by ResultOrError.
 * Each component derives its own Error from it so that error values from
 * different layers are not mixed up by accident.
 */
struct RoeErrorBase {
  int32_t code{ -1 };
  std::string message;

  RoeErrorBase() = default;
  RoeErrorBase(int32_t c, const std::string &msg) : code(c), message(msg) {}
  RoeErrorBase(int32_t c, std::string &&msg) : code(c), message(std::move(msg)) {}
  explicit RoeErrorBase(const std::string &msg) : message(msg) {}
  explicit RoeErrorBase(std::string &&msg) : message(std::move(msg)) {}
};

template <typename T, typename E = RoeErrorBase> class ResultOrError {
public:
  // Success
  ResultOrError(const T &value) : value_(value) {}
  ResultOrError(T &&value) : value_(std::move(value)) {}

  // Failure
  ResultOrError(const E &err) : error_(err) {}
  ResultOrError(E &&err) : error_(std::move(err)) {}

  ResultOrError(const ResultOrError &) = default;
  ResultOrError(ResultOrError &&) noexcept = default;
  ResultOrError &operator=(const ResultOrError &) = default;
  ResultOrError &operator=(ResultOrError &&) noexcept = default;

  bool isOk() const { return value_.has_value(); }
  bool isError() const { return !value_.has_value(); }
  explicit operator bool() const { return value_.has_value(); }

  const T &value() const {
    if (!value_) {
      throw std::runtime_error("Attempting to access value of error result: " +
                               error_.message);
    }
    return *value_;
  }

  T &value() {
    if (!value_) {
      throw std::runtime_error("Attempting to access value of error result: " +
                               error_.message);
    }
    return *value_;
  }

  T valueOr(const T &defaultValue) const {
    return value_ ? *value_ : defaultValue;
  }

  const E &error() const {
    if (value_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return error_;
  }

  E &error() {
    if (value_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return error_;
  }

  const T &operator*() const { return value(); }
  T &operator*() { return value(); }

  const T *operator->() const { return &value(); }
  T *operator->() { return &value(); }

private:
  std::optional<T> value_;
  E error_;
};

// Specialization for operations that return nothing on success
template <typename E> class ResultOrError<void, E> {
public:
  ResultOrError() : hasValue_(true) {}

  ResultOrError(const E &err) : hasValue_(false), error_(err) {}
  ResultOrError(E &&err) : hasValue_(false), error_(std::move(err)) {}

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return error_;
  }

  E &error() {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return error_;
  }

private:
  bool hasValue_;
  E error_;
};

} // namespace cl

#endif // CHAIN_LEDGER_RESULT_OR_ERROR_H
