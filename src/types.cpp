#include "strata/types.hpp"

#include <sstream>

#include "strata/jsonlite.hpp"

namespace strata {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::connection_error: return "connection_error";
    case ErrorCode::query_error: return "query_error";
    case ErrorCode::conflict_error: return "conflict_error";
    case ErrorCode::transaction_error: return "transaction_error";
    case ErrorCode::authorization_error: return "authorization_error";
    case ErrorCode::store_error: return "store_error";
    case ErrorCode::protocol_error: return "protocol_error";
    case ErrorCode::invalid_revision: return "invalid_revision";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string wire_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::connection_error: return "ConnectionError";
    case ErrorCode::query_error: return "QueryError";
    case ErrorCode::conflict_error: return "ConflictError";
    case ErrorCode::transaction_error: return "TransactionError";
    case ErrorCode::authorization_error: return "AuthorizationError";
    case ErrorCode::store_error: return "StoreError";
    default: return "";
  }
}

ErrorCode error_code_from_name(const std::string& name) {
  if (name == "ConnectionError") return ErrorCode::connection_error;
  if (name == "QueryError") return ErrorCode::query_error;
  if (name == "ConflictError") return ErrorCode::conflict_error;
  if (name == "TransactionError") return ErrorCode::transaction_error;
  if (name == "AuthorizationError") return ErrorCode::authorization_error;
  if (name == "StoreError") return ErrorCode::store_error;
  return ErrorCode::transaction_error;
}

std::string Error::to_json() const {
  std::ostringstream o;
  o << "{\"code\":\"" << to_string(code) << "\""
    << ",\"message\":\"" << jsonlite::escape(message) << "\""
    << ",\"addresses\":[";
  for (size_t i = 0; i < addresses.size(); ++i) {
    if (i) o << ",";
    o << "\"" << jsonlite::escape(addresses[i]) << "\"";
  }
  o << "]}";
  return o.str();
}

Error make_error(ErrorCode code, std::string message,
                 std::vector<std::string> addresses) {
  Error e;
  e.code = code;
  e.message = std::move(message);
  e.addresses = std::move(addresses);
  return e;
}

}  // namespace strata
