#pragma once

#include <cassert>
#include <utility>
#include <variant>

namespace tw::core {

/// Result<T, E>: either a value or an error, never both.
/// Every fallible operation of the scheduler returns one of these; nothing
/// is thrown across the public API.
template <typename T, typename E> class Result {
public:
  static Result Ok(T value) {
    return Result(std::in_place_index<0>, std::move(value));
  }

  static Result Err(E error) {
    return Result(std::in_place_index<1>, std::move(error));
  }

  [[nodiscard]] bool is_ok() const noexcept { return storage_.index() == 0; }
  [[nodiscard]] bool is_err() const noexcept { return storage_.index() == 1; }

  /// Success value. Precondition: is_ok().
  [[nodiscard]] const T &value() const & {
    assert(is_ok() && "Result::value() on error");
    return std::get<0>(storage_);
  }

  [[nodiscard]] T &&value() && {
    assert(is_ok() && "Result::value() on error");
    return std::get<0>(std::move(storage_));
  }

  /// Error value. Precondition: is_err().
  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result::error() on success");
    return std::get<1>(storage_);
  }

  [[nodiscard]] E &&error() && {
    assert(is_err() && "Result::error() on success");
    return std::get<1>(std::move(storage_));
  }

  [[nodiscard]] T value_or(T fallback) const & {
    return is_ok() ? std::get<0>(storage_) : std::move(fallback);
  }

private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V &&v)
      : storage_(tag, std::forward<V>(v)) {}

  // Index 0 holds T and index 1 holds E, so Result<std::string, std::string>
  // stays unambiguous.
  std::variant<T, E> storage_;
};

/// Result<void, E>: success carries nothing.
template <typename E> class Result<void, E> {
public:
  static Result Ok() { return Result(); }

  static Result Err(E error) {
    Result r;
    r.failed_ = true;
    r.error_ = std::move(error);
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return !failed_; }
  [[nodiscard]] bool is_err() const noexcept { return failed_; }

  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result<void>::error() on success");
    return error_;
  }

private:
  Result() = default;
  bool failed_ = false;
  E error_{};
};

} // namespace tw::core
