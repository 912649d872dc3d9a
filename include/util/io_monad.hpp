#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "my_error_codes.hpp"

// Continuation-style Result/IO used across hookrelay. An IO<T> is a deferred
// computation that reports exactly once through a callback; nothing happens
// until run() is called.
//
//   client.FindSources(names)
//       .then([](auto sources) { return open_session(sources); })
//       .map_err([](monad::Error err) { return annotate(err); })
//       .run([](monad::MyResult<Session> r) { ... });

namespace hookrelay::monad {

struct Error {
  int code{0};
  std::string what;
  int response_status{0};
  std::string key;
  std::map<std::string, std::string> params;
};

inline Error make_error(int code, std::string what) {
  Error err;
  err.code = code;
  err.what = std::move(what);
  return err;
}

inline std::ostream &operator<<(std::ostream &os, const Error &err) {
  os << "Error{code=" << err.code;
  if (err.response_status != 0) {
    os << ", status=" << err.response_status;
  }
  os << ", what=" << err.what << '}';
  return os;
}

template <typename T, typename E> class Result {
public:
  static Result Ok(T value) {
    return Result(std::in_place_index<0>, std::move(value));
  }
  static Result Err(E error) {
    return Result(std::in_place_index<1>, std::move(error));
  }

  bool is_ok() const { return data_.index() == 0; }
  bool is_err() const { return data_.index() == 1; }

  T &value() & { return std::get<0>(data_); }
  const T &value() const & { return std::get<0>(data_); }
  T &&value() && { return std::get<0>(std::move(data_)); }

  E &error() & { return std::get<1>(data_); }
  const E &error() const & { return std::get<1>(data_); }

private:
  template <std::size_t I, typename Arg>
  Result(std::in_place_index_t<I> tag, Arg &&arg)
      : data_(tag, std::forward<Arg>(arg)) {}

  std::variant<T, E> data_;
};

template <typename E> class Result<void, E> {
public:
  static Result Ok() { return Result{}; }
  static Result Err(E error) {
    Result r;
    r.error_ = std::move(error);
    return r;
  }

  bool is_ok() const { return !error_.has_value(); }
  bool is_err() const { return error_.has_value(); }

  E &error() & { return *error_; }
  const E &error() const & { return *error_; }

private:
  std::optional<E> error_;
};

template <typename T> using MyResult = Result<T, Error>;
using MyVoidResult = Result<void, Error>;

template <typename T> class IO;

namespace detail {

template <typename F, typename T> struct invoke_with {
  using type = std::invoke_result_t<F, T>;
};
template <typename F> struct invoke_with<F, void> {
  using type = std::invoke_result_t<F>;
};
template <typename F, typename T>
using invoke_with_t = typename invoke_with<F, T>::type;

} // namespace detail

template <typename T> class IO {
public:
  using value_type = T;
  using ResultType = MyResult<T>;
  using Callback = std::function<void(ResultType)>;
  using Thunk = std::function<void(Callback)>;

  explicit IO(Thunk thunk) : thunk_(std::move(thunk)) {}

  template <typename U = T>
    requires(!std::is_void_v<U>)
  static IO pure(U value) {
    return IO([value](Callback cb) { cb(ResultType::Ok(value)); });
  }

  template <typename U = T>
    requires std::is_void_v<U>
  static IO pure() {
    return IO([](Callback cb) { cb(ResultType::Ok()); });
  }

  static IO fail(Error err) {
    return IO([err](Callback cb) { cb(ResultType::Err(err)); });
  }

  static IO from_result(ResultType result) {
    return IO([result](Callback cb) { cb(result); });
  }

  void run(Callback cb) const { thunk_(std::move(cb)); }

  // f: T -> IO<U>
  template <typename F> auto then(F f) const {
    using NextIO = detail::invoke_with_t<F, T>;
    using NextResult = typename NextIO::ResultType;
    auto thunk = thunk_;
    return NextIO([thunk, f](typename NextIO::Callback cb) {
      thunk([f, cb](ResultType r) mutable {
        if (r.is_err()) {
          cb(NextResult::Err(std::move(r.error())));
          return;
        }
        if constexpr (std::is_void_v<T>) {
          f().run(std::move(cb));
        } else {
          f(std::move(r).value()).run(std::move(cb));
        }
      });
    });
  }

  // f: T -> U
  template <typename F> auto map(F f) const {
    using U = detail::invoke_with_t<F, T>;
    using NextIO = IO<U>;
    using NextResult = typename NextIO::ResultType;
    auto thunk = thunk_;
    return NextIO([thunk, f](typename NextIO::Callback cb) {
      thunk([f, cb](ResultType r) mutable {
        if (r.is_err()) {
          cb(NextResult::Err(std::move(r.error())));
          return;
        }
        if constexpr (std::is_void_v<T> && std::is_void_v<U>) {
          f();
          cb(NextResult::Ok());
        } else if constexpr (std::is_void_v<T>) {
          cb(NextResult::Ok(f()));
        } else if constexpr (std::is_void_v<U>) {
          f(std::move(r).value());
          cb(NextResult::Ok());
        } else {
          cb(NextResult::Ok(f(std::move(r).value())));
        }
      });
    });
  }

  // f: Error -> Error
  template <typename F> IO map_err(F f) const {
    auto thunk = thunk_;
    return IO([thunk, f](Callback cb) {
      thunk([f, cb](ResultType r) mutable {
        if (r.is_ok()) {
          cb(std::move(r));
          return;
        }
        cb(ResultType::Err(f(std::move(r.error()))));
      });
    });
  }

  // Re-runs this computation while `should_retry(err)` holds, doubling the
  // delay after each failure. The last error is reported once attempts are
  // exhausted.
  template <typename Pred>
  IO retry_exponential_if(int max_attempts, std::chrono::milliseconds base_delay,
                          boost::asio::io_context &ioc,
                          Pred should_retry) const {
    IO self = *this;
    return IO([self, max_attempts, base_delay, &ioc, should_retry](Callback cb) {
      RetryStep(self, 1, max_attempts, base_delay, ioc, should_retry,
                std::move(cb));
    });
  }

private:
  template <typename Pred>
  static void RetryStep(IO io, int attempt, int max_attempts,
                        std::chrono::milliseconds delay,
                        boost::asio::io_context &ioc, Pred should_retry,
                        Callback cb) {
    io.run([io, attempt, max_attempts, delay, &ioc, should_retry,
            cb](ResultType r) mutable {
      if (r.is_ok() || attempt >= max_attempts || !should_retry(r.error())) {
        cb(std::move(r));
        return;
      }
      auto timer = std::make_shared<boost::asio::steady_timer>(ioc, delay);
      Error last = r.error();
      timer->async_wait([timer, io, attempt, max_attempts, delay, &ioc,
                         should_retry, cb,
                         last](const boost::system::error_code &ec) mutable {
        if (ec) {
          cb(ResultType::Err(std::move(last)));
          return;
        }
        RetryStep(io, attempt + 1, max_attempts, delay * 2, ioc, should_retry,
                  std::move(cb));
      });
    });
  }

  Thunk thunk_;
};

} // namespace hookrelay::monad
