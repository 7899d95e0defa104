#pragma once
#include <string>
#include <utility>
#include <variant>

enum class SwapError {
  ConnectivityError,
  TokenInfoUnavailable,
  InsufficientBalance,
  ApprovalFailed,
  QuoteUnavailable,
  SubmissionFailed,
  TransactionReverted,
  ConfirmationTimeout,
  EncodingError,
  InvalidIntent,
  Unexpected
};

const char* SwapErrorName(SwapError e);

struct Failure {
  SwapError code;
  std::string detail;
  std::string Describe() const { return std::string(SwapErrorName(code)) + ": " + detail; }
};

// Value-or-failure returned by every component operation.
template <typename T>
class Result {
public:
  Result(T value) : v_(std::move(value)) {}
  Result(Failure f) : v_(std::move(f)) {}

  static Result Fail(SwapError code, std::string detail) { return Result(Failure{code, std::move(detail)}); }

  bool ok() const { return std::holds_alternative<T>(v_); }
  explicit operator bool() const { return ok(); }

  const T& value() const { return std::get<T>(v_); }
  T& value() { return std::get<T>(v_); }
  const T& operator*() const { return value(); }
  const T* operator->() const { return &value(); }

  const Failure& error() const { return std::get<Failure>(v_); }
private:
  std::variant<T, Failure> v_;
};
