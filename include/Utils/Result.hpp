#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

/**
 * @brief Value-or-error return type used at every reconciler boundary.
 *
 * The error alternative carries a human readable message. unwrap() and
 * expect() move the value out, so call them once per Result.
 */
template <typename T, typename E = std::string>
class Result {
  std::variant<T, E> storage;

public:
  Result(T&& value)
      : storage(std::in_place_index<0>, std::move(value)) {}
  Result(const T& value)
      : storage(std::in_place_index<0>, value) {}
  Result(E&& error)
      : storage(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool isOk() const noexcept {
    return storage.index() == 0;
  }
  [[nodiscard]] bool isErr() const noexcept { return storage.index() == 1; }

  [[nodiscard]] const T& value() const {
    if (isErr()) throw std::runtime_error("Called value on error Result: " + std::get<1>(storage));
    return std::get<0>(storage);
  }

  [[nodiscard]] const E& error() const {
    if (isOk()) throw std::runtime_error("Called error on ok Result");
    return std::get<1>(storage);
  }

  T expect(const std::string& msg) {
    if (isErr()) throw std::runtime_error(msg + ": " + std::get<1>(storage));
    return std::move(std::get<0>(storage));
  }

  T unwrap() { return expect("Called unwrap on error Result"); }
  E unwrapErr() {
    if (isOk()) throw std::runtime_error("Called unwrapErr on ok Result");
    return std::get<1>(storage);
  }

  T unwrapOr(T&& defaultValue) { return isOk() ? std::move(std::get<0>(storage)) : std::move(defaultValue); }
};
