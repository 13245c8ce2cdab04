#pragma once

// Value-or-error holder behind procex::Result. Unlike std::expected it converts
// implicitly from the error type, so failing paths can `return error;`.

#include <utility>
#include <variant>

namespace procex {

template <typename T, typename E>
class expected {
 public:
  using value_type = T;
  using error_type = E;

  expected(const T& value) : storage_(std::in_place_index<0>, value) {}
  expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
  expected(const E& error) : storage_(std::in_place_index<1>, error) {}
  expected(E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  // Accessing the wrong alternative throws std::bad_variant_access.
  [[nodiscard]] T& value() & { return std::get<0>(storage_); }
  [[nodiscard]] const T& value() const& { return std::get<0>(storage_); }
  [[nodiscard]] T&& value() && { return std::get<0>(std::move(storage_)); }

  [[nodiscard]] T& operator*() & { return value(); }
  [[nodiscard]] const T& operator*() const& { return value(); }
  [[nodiscard]] T* operator->() { return &value(); }
  [[nodiscard]] const T* operator->() const { return &value(); }

  [[nodiscard]] E& error() & { return std::get<1>(storage_); }
  [[nodiscard]] const E& error() const& { return std::get<1>(storage_); }
  [[nodiscard]] E&& error() && { return std::get<1>(std::move(storage_)); }

  template <typename U>
  [[nodiscard]] T value_or(U&& fallback) const& {
    return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
  }

 private:
  std::variant<T, E> storage_;
};

template <typename E>
class expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  expected() = default;
  expected(const E& error) : error_(error), has_error_(true) {}
  expected(E&& error) : error_(std::move(error)), has_error_(true) {}

  [[nodiscard]] bool has_value() const noexcept { return !has_error_; }
  explicit operator bool() const noexcept { return has_value(); }

  void value() const {}

  [[nodiscard]] E& error() & { return error_; }
  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  E error_{};
  bool has_error_ = false;
};

}  // namespace procex
