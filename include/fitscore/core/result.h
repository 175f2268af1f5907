#pragma once

#include <utility>
#include <variant>

namespace fitscore::core {

// Result<T, E> encodes success (T) or failure (E) explicitly for fallible boundary
// operations (configuration loading, profile validation, JSON parsing).
// Scoring functions never use it: they are total and always produce a value.
// Usage: return Result<Value, Error>::ok(val) or Result<Value, Error>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace fitscore::core
