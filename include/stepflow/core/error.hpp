#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace stepflow {

enum class Error : int {
  Success,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  Cancelled,
  CycleDetected,
  InvalidTransition,
  QueuedLimitExceeded,
  ActiveLimitExceeded,
  HourlyLimitExceeded,
  HandlerNotRegistered,
  HandlerFailed,
  ValidationError,
  LimitExceeded,
  LeaseLost,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "file not found",
      "failed to open file",
      "parse error",
      "database error",
      "failed to open database",
      "database query failed",
      "invalid argument",
      "not found",
      "already exists",
      "timeout",
      "cancelled",
      "cycle detected in plan",
      "invalid state transition",
      "too many queued tasks",
      "too many active tasks",
      "too many tasks per hour",
      "no handler registered for action",
      "action handler failed",
      "validation error",
      "execution limit exceeded",
      "lease lost",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "stepflow";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

// Error code plus the human-readable text that callers surface to users
// (validation messages, limit rejections, step failures).
struct ErrorInfo {
  std::error_code code;
  std::string message;
};

template <typename T>
using DetailedResult = std::expected<T, ErrorInfo>;

[[nodiscard]] inline auto fail(Error e, std::string message)
    -> std::unexpected<ErrorInfo> {
  return std::unexpected{ErrorInfo{make_error_code(e), std::move(message)}};
}

}  // namespace stepflow

template <>
struct std::is_error_code_enum<stepflow::Error> : std::true_type {};

namespace stepflow {

struct StringHash {
  using is_transparent = void;

  [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
    return std::hash<std::string_view>{}(sv);
  }

  [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }

  [[nodiscard]] std::size_t operator()(const char* s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace stepflow
