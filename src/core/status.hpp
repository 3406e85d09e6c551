/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace rudel::core {

enum class Errc : std::uint8_t {
  None = 0,
  Generic,
  InvalidArgument,
  Io,
  ProtocolError,

  ConnectTimeout,
  NegotiationRejected,
  LinkDropped,
  ResponseTimeout,
  ChunkRetryExhausted,
  DigestMismatch,
  FinalizeTimeout,
  Cancelled,
  AdapterUnavailable,
};

constexpr std::string_view errc_name(Errc e) noexcept {
  switch (e) {
    case Errc::None:                return "None";
    case Errc::Generic:             return "Error";
    case Errc::InvalidArgument:     return "InvalidArgument";
    case Errc::Io:                  return "Io";
    case Errc::ProtocolError:       return "ProtocolError";
    case Errc::ConnectTimeout:      return "ConnectTimeout";
    case Errc::NegotiationRejected: return "NegotiationRejected";
    case Errc::LinkDropped:         return "LinkDropped";
    case Errc::ResponseTimeout:     return "ResponseTimeout";
    case Errc::ChunkRetryExhausted: return "ChunkRetryExhausted";
    case Errc::DigestMismatch:      return "DigestMismatch";
    case Errc::FinalizeTimeout:     return "FinalizeTimeout";
    case Errc::Cancelled:           return "Cancelled";
    case Errc::AdapterUnavailable:  return "AdapterUnavailable";
  }
  return "Unknown";
}

struct Status {
  bool ok = true;
  Errc code = Errc::None;
  std::string msg;

  Status() = default;
  Status(bool ok_, std::string msg_) : ok(ok_), code(ok_ ? Errc::None : Errc::Generic), msg(std::move(msg_)) {}
  Status(Errc code_, std::string msg_) : ok(code_ == Errc::None), code(code_), msg(std::move(msg_)) {}

  static Status Ok() { return {}; }

  static Status Fail(std::string msg) { return Status(false, std::move(msg)); }
  static Status Fail(Errc code, std::string msg) { return Status(code, std::move(msg)); }

  template <class... Args>
  static Status Failf(fmt::format_string<Args...> f, Args&&... args) {
    return Fail(fmt::format(f, std::forward<Args>(args)...));
  }

  template <class... Args>
  static Status Failf(Errc code, fmt::format_string<Args...> f, Args&&... args) {
    return Fail(code, fmt::format(f, std::forward<Args>(args)...));
  }

  explicit operator bool() const noexcept { return ok; }
};

template <class T>
struct Result {
  // NOTE: default construct = failure-without-value. This avoids requiring T{}.
  Status st{false, {}};
  bool has_value = false;

  struct Empty { };
  union {
    Empty empty;
    T value;
  };

  Result() noexcept : empty{} {}

  ~Result() { reset_(); }

  Result(const Result&) = delete;
  Result& operator=(const Result&) = delete;

  Result(Result&& o) noexcept(std::is_nothrow_move_constructible_v<T>)
    : st(std::move(o.st))
    , has_value(o.has_value)
  {
    if (has_value) {
      ::new (static_cast<void*>(std::addressof(value))) T(std::move(o.value));
      o.reset_();
    } else {
      empty = Empty{};
    }
  }

  Result& operator=(Result&& o) noexcept(std::is_nothrow_move_constructible_v<T>) {
    if (this == &o) return *this;
    reset_();

    st = std::move(o.st);
    has_value = o.has_value;

    if (has_value) {
      ::new (static_cast<void*>(std::addressof(value))) T(std::move(o.value));
      o.reset_();
    } else {
      empty = Empty{};
    }
    return *this;
  }

  static Result Ok(T v) {
    Result r;
    r.st = Status::Ok();
    ::new (static_cast<void*>(std::addressof(r.value))) T(std::move(v));
    r.has_value = true;
    return r;
  }

  static Result Fail(std::string msg) {
    Result r;
    r.st = Status::Fail(std::move(msg));
    return r;
  }

  static Result Fail(Errc code, std::string msg) {
    Result r;
    r.st = Status::Fail(code, std::move(msg));
    return r;
  }

  // Carries the code of an upstream failure.
  static Result Fail(Status st) {
    Result r;
    r.st = std::move(st);
    if (r.st.ok) r.st = Status::Fail("internal: Result::Fail with ok status");
    return r;
  }

  template <class... Args>
  static Result Failf(fmt::format_string<Args...> f, Args&&... args) {
    return Fail(fmt::format(f, std::forward<Args>(args)...));
  }

  template <class... Args>
  static Result Failf(Errc code, fmt::format_string<Args...> f, Args&&... args) {
    return Fail(code, fmt::format(f, std::forward<Args>(args)...));
  }

  explicit operator bool() const noexcept { return st.ok; }

private:
  void reset_() noexcept {
    if (has_value) {
      value.~T();
      has_value = false;
    }
  }
};

} // namespace rudel::core

#define RUDEL_TRY(expr) do { auto _st = (expr); if (!_st.ok) return _st; } while (0)
