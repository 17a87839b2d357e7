#pragma once

// strata/types.hpp — Error taxonomy and the result type every asynchronous
// operation completes with.
//
// PROPAGATION POLICY:
//   - store_error never reaches a load/pull/push caller. The replica logs it,
//     counts it, and falls back to the remote.
//   - connection_error is retried by the session until the reconnect ceiling
//     or an explicit close(), then surfaces on every pending invocation.
//   - query/conflict/transaction/authorization errors come from the remote and
//     surface unchanged. Nothing is retried automatically.
//   - protocol_error marks a malformed inbound frame. The session drops it.
//
// Nothing here throws. Callers branch on Error::code.

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace strata {

enum class ErrorCode {
  none,
  connection_error,
  query_error,
  conflict_error,
  transaction_error,
  authorization_error,
  store_error,
  protocol_error,
  invalid_revision,
  config_invalid,
};

std::string to_string(ErrorCode code);

// Name used on the wire ("ConflictError", ...). Empty for local-only codes.
std::string wire_name(ErrorCode code);

// Inverse of wire_name. Unknown names map to transaction_error so an
// unrecognised server verdict is still surfaced as a policy failure.
ErrorCode error_code_from_name(const std::string& name);

struct Error {
  ErrorCode code{ErrorCode::none};
  std::string message;
  // Address keys the error is scoped to (conflicting refs, failed cache keys).
  std::vector<std::string> addresses;

  std::string to_json() const;
};

Error make_error(ErrorCode code, std::string message,
                 std::vector<std::string> addresses = {});

struct Unit {};

template <typename T>
class Result {
 public:
  Result(T value) : value_(std::move(value)) {}
  Result(Error error) : error_(std::move(error)) {}

  bool ok() const { return !error_.has_value(); }
  explicit operator bool() const { return ok(); }

  const T& value() const { return *value_; }
  T& value() { return *value_; }
  const Error& error() const { return *error_; }

 private:
  std::optional<T> value_;
  std::optional<Error> error_;
};

template <typename T>
using Callback = std::function<void(Result<T>)>;

}  // namespace strata
