#ifndef CORE_INFRASTRUCTURE_RESULT_HPP
#define CORE_INFRASTRUCTURE_RESULT_HPP

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

template <typename T, typename Err = std::runtime_error> class Result {
private:
  std::variant<T, Err> data_;
  bool ok_flag;

public:
  template <typename U>
    requires(!std::is_same_v<std::decay_t<U>, Err>) &&
                std::is_constructible_v<T, U &&>
  Result(U &&value) noexcept(std::is_nothrow_constructible_v<T, U &&>)
      : data_(std::in_place_index<0>, std::forward<U>(value)), ok_flag(true) {}

  template <typename E>
    requires std::is_constructible_v<Err, E &&>
  Result(E &&error) noexcept(std::is_nothrow_constructible_v<Err, E &&>)
      : data_(std::in_place_index<1>, std::forward<E>(error)), ok_flag(false) {}

  bool is_ok() const { return ok_flag; }

  T &value() & { return std::get<0>(data_); }
  const T &value() const & { return std::get<0>(data_); }
  T &&value() && { return std::get<0>(std::move(data_)); }

  Err &error() & { return std::get<1>(data_); }
  const Err &error() const & { return std::get<1>(data_); }
  Err &&error() && { return std::get<1>(std::move(data_)); }

  T &unwrap() & {
    if (!ok_flag) {
      throw error();
    }
    return value();
  }

  T &&unwrap() && {
    if (!ok_flag) {
      throw error();
    }
    return std::move(value());
  }

  template <typename F>
  auto map(F &&func) -> Result<std::invoke_result_t<F, T &>, Err> {
    if (!ok_flag) {
      return Result<std::invoke_result_t<F, T &>, Err>::Error(error());
    }
    return Result<std::invoke_result_t<F, T &>, Err>::Ok(func(value()));
  }

  template <typename F>
  auto and_then(F &&func) -> std::invoke_result_t<F, T &> {
    if (!ok_flag) {
      using ResultType = std::invoke_result_t<F, T &>;
      return ResultType::Error(error());
    }
    return func(value());
  }

  template <typename OkHandler, typename ErrHandler>
  auto match(OkHandler &&ok_func, ErrHandler &&err_func)
      -> std::common_type_t<std::invoke_result_t<OkHandler, T &>,
                            std::invoke_result_t<ErrHandler, Err &>> {
    if (ok_flag) {
      return ok_func(value());
    }
    return err_func(error());
  }

  static Result Ok(T &&value) { return Result(std::forward<T>(value)); }

  static Result Ok(const T &value) { return Result(value); }

  static Result Error(Err &&error) { return Result(std::forward<Err>(error)); }

  static Result Error(const Err &error) { return Result(error); }
};

// Success carries no value, only the absence of an error.
template <typename Err> class Result<void, Err> {
private:
  std::optional<Err> error_;

public:
  Result() noexcept : error_(std::nullopt) {}

  template <typename E>
    requires std::is_constructible_v<Err, E &&>
  Result(E &&error) noexcept(std::is_nothrow_constructible_v<Err, E &&>)
      : error_(std::forward<E>(error)) {}

  bool is_ok() const { return !error_.has_value(); }

  Err &error() & { return error_.value(); }
  const Err &error() const & { return error_.value(); }
  Err &&error() && { return std::move(error_.value()); }

  void unwrap() const {
    if (error_) {
      throw *error_;
    }
  }

  template <typename F> auto and_then(F &&func) -> std::invoke_result_t<F> {
    if (error_) {
      using ResultType = std::invoke_result_t<F>;
      return ResultType::Error(*error_);
    }
    return func();
  }

  template <typename OkHandler, typename ErrHandler>
  auto match(OkHandler &&ok_func, ErrHandler &&err_func)
      -> std::common_type_t<std::invoke_result_t<OkHandler>,
                            std::invoke_result_t<ErrHandler, Err &>> {
    if (!error_) {
      return ok_func();
    }
    return err_func(*error_);
  }

  static Result Ok() { return Result(); }

  static Result Error(Err &&error) { return Result(std::forward<Err>(error)); }

  static Result Error(const Err &error) { return Result(error); }
};

} // namespace core

#endif // CORE_INFRASTRUCTURE_RESULT_HPP
